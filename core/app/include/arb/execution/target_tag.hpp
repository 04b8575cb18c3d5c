#pragma once

#include "arb/domain/leg_order.hpp"

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace arb {

// -----------------------------------------------------------------------------
// Order tags
// -----------------------------------------------------------------------------
// Every leg order carries "arb-target:<id>" where <id> is the decimal
// TargetId. Order events are routed back to their target by parsing the tag;
// nothing else about the order identifies its owner.
// -----------------------------------------------------------------------------
inline constexpr std::string_view kTargetTagPrefix = "arb-target:";

inline std::string makeTargetTag(domain::TargetId id) {
  return std::string(kTargetTagPrefix) + std::to_string(id);
}

// std::nullopt unless tag is exactly the prefix followed by a non-zero
// decimal id.
inline std::optional<domain::TargetId> parseTargetTag(std::string_view tag) {
  if (tag.size() <= kTargetTagPrefix.size() ||
      tag.substr(0, kTargetTagPrefix.size()) != kTargetTagPrefix) {
    return std::nullopt;
  }

  const std::string_view digits = tag.substr(kTargetTagPrefix.size());
  domain::TargetId id = 0;
  const auto [end, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), id);
  if (ec != std::errc() || end != digits.data() + digits.size() || id == 0) {
    return std::nullopt;
  }
  return id;
}

}  // namespace arb
