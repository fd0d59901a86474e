#pragma once

#include "core/RuleConfig.hpp"

#include <optional>
#include <string>
#include <vector>

namespace snake_escape::controller {

std::optional<core::SnakeColor> parseSnakeColor(const std::string& text);

// Reads --reversible <color>, --wrapping <color> and --max-slide <n> into a
// RuleConfig, starting from the defaults. Throws std::invalid_argument on an
// unknown flag, a missing value or a bad value.
core::RuleConfig parseRuleConfig(const std::vector<std::string>& args);

} // namespace snake_escape::controller
