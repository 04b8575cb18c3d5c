#include "arb/matching/match_types.hpp"

namespace arb {

const char* toString(MatchingStrategy strategy) {
  switch (strategy) {
    case MatchingStrategy::AutoDetect:  return "auto";
    case MatchingStrategy::DualDepth:   return "dual";
    case MatchingStrategy::SingleDepth: return "single";
    case MatchingStrategy::BestPrices:  return "best";
  }
  return "unknown";
}

const char* toString(MatchVariant variant) {
  switch (variant) {
    case MatchVariant::DualDepth:   return "dual-depth";
    case MatchVariant::SingleDepth: return "single-depth";
    case MatchVariant::BestPrices:  return "best-prices";
  }
  return "unknown";
}

const char* toString(RejectReason reason) {
  switch (reason) {
    case RejectReason::None:                 return "none";
    case RejectReason::InvalidRequest:       return "invalid-request";
    case RejectReason::InvalidPrice:         return "invalid-price";
    case RejectReason::SpreadBelowThreshold: return "spread-below-threshold";
    case RejectReason::BelowLotSize:         return "below-lot-size";
  }
  return "unknown";
}

std::optional<MatchingStrategy> parseMatchingStrategy(std::string_view text) {
  if (text == "auto")   return MatchingStrategy::AutoDetect;
  if (text == "dual")   return MatchingStrategy::DualDepth;
  if (text == "single") return MatchingStrategy::SingleDepth;
  if (text == "best")   return MatchingStrategy::BestPrices;
  return std::nullopt;
}

}  // namespace arb
