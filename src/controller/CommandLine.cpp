#include "controller/CommandLine.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace snake_escape::controller {

std::optional<core::SnakeColor> parseSnakeColor(const std::string& text) {
    std::string s = text;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (s == "red") return core::SnakeColor::Red;
    if (s == "green") return core::SnakeColor::Green;
    if (s == "blue") return core::SnakeColor::Blue;
    if (s == "yellow") return core::SnakeColor::Yellow;
    return std::nullopt;
}

core::RuleConfig parseRuleConfig(const std::vector<std::string>& args) {
    core::RuleConfig config;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& flag = args[i];
        if (i + 1 >= args.size()) {
            throw std::invalid_argument("missing value for " + flag);
        }
        const std::string& value = args[++i];

        if (flag == "--reversible" || flag == "--wrapping") {
            const auto color = parseSnakeColor(value);
            if (!color) {
                throw std::invalid_argument("unknown snake color: " + value);
            }
            (flag == "--reversible" ? config.reversibleColor : config.wrappingColor) = *color;
        } else if (flag == "--max-slide") {
            int steps = 0;
            try {
                steps = std::stoi(value);
            } catch (const std::exception&) {
                throw std::invalid_argument("--max-slide expects a number, got " + value);
            }
            if (steps <= 0) {
                throw std::invalid_argument("--max-slide must be positive");
            }
            config.maxSlideSteps = steps;
        } else {
            throw std::invalid_argument("unknown option: " + flag);
        }
    }
    return config;
}

} // namespace snake_escape::controller
