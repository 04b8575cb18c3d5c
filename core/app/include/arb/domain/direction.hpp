#pragma once

#include <optional>
#include <string_view>

namespace arb {
namespace domain {

// -----------------------------------------------------------------------------
// SpreadDirection
// -----------------------------------------------------------------------------
// Responsibility: Direction of a hedged pair position as seen by the
// opportunity that created it.
//
//   LongSpread   Buy instrument 1, sell instrument 2 (instrument 1 expected
//                to be the cheaper leg).
//   ShortSpread  Sell instrument 1, buy instrument 2.
// -----------------------------------------------------------------------------
enum class SpreadDirection {
  LongSpread,
  ShortSpread,
};

// -----------------------------------------------------------------------------
// MatchDirection
// -----------------------------------------------------------------------------
// Direction vocabulary of the SpreadMatcher. LongS1 buys instrument 1 and
// sells instrument 2; ShortS1 is the reverse. Kept separate from
// SpreadDirection because the matcher flips it when it swaps instruments.
// -----------------------------------------------------------------------------
enum class MatchDirection {
  LongS1,
  ShortS1,
};

inline MatchDirection toMatchDirection(SpreadDirection direction) {
  return direction == SpreadDirection::LongSpread ? MatchDirection::LongS1
                                                  : MatchDirection::ShortS1;
}

inline MatchDirection flip(MatchDirection direction) {
  return direction == MatchDirection::LongS1 ? MatchDirection::ShortS1
                                             : MatchDirection::LongS1;
}

inline const char* toString(SpreadDirection direction) {
  switch (direction) {
    case SpreadDirection::LongSpread:  return "LONG_SPREAD";
    case SpreadDirection::ShortSpread: return "SHORT_SPREAD";
  }
  return "UNKNOWN";
}

inline const char* toString(MatchDirection direction) {
  switch (direction) {
    case MatchDirection::LongS1:  return "LONG_S1";
    case MatchDirection::ShortS1: return "SHORT_S1";
  }
  return "UNKNOWN";
}

// Accepts the config/wire spelling ("LONG_SPREAD", "SHORT_SPREAD").
inline std::optional<SpreadDirection> parseSpreadDirection(
    std::string_view text) {
  if (text == "LONG_SPREAD") {
    return SpreadDirection::LongSpread;
  }
  if (text == "SHORT_SPREAD") {
    return SpreadDirection::ShortSpread;
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace arb
