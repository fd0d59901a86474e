#include "controller/Command.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace snake_escape::controller {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<int> toInt(const std::string& s) {
    try {
        std::size_t used = 0;
        const int v = std::stoi(s, &used);
        if (used != s.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

std::optional<Command> parseCommand(const std::string& line) {
    std::istringstream is(line);
    std::vector<std::string> words;
    for (std::string w; is >> w;) {
        words.push_back(w);
    }
    if (words.empty()) {
        return std::nullopt;
    }

    const std::string verb = lower(words[0]);

    if (verb == "move" || verb == "m") {
        if (words.size() != 5) return std::nullopt;
        const auto id = toInt(words[1]);
        const std::string end = lower(words[2]);
        const auto x = toInt(words[3]);
        const auto y = toInt(words[4]);
        if (!id || *id < 0 || !x || !y || (end != "head" && end != "tail")) {
            return std::nullopt;
        }
        return MoveCommand{static_cast<core::SnakeId>(*id),
                           end == "head" ? core::SnakeEnd::Head : core::SnakeEnd::Tail,
                           core::Cell{*x, *y}};
    }

    if (verb == "drag" || verb == "d") {
        if (words.size() != 5) return std::nullopt;
        const auto x1 = toInt(words[1]);
        const auto y1 = toInt(words[2]);
        const auto x2 = toInt(words[3]);
        const auto y2 = toInt(words[4]);
        if (!x1 || !y1 || !x2 || !y2) return std::nullopt;
        return DragCommand{core::Cell{*x1, *y1}, core::Cell{*x2, *y2}};
    }

    if (words.size() == 1 && (verb == "reload" || verb == "r")) return ReloadCommand{};
    if (words.size() == 1 && (verb == "help" || verb == "h" || verb == "?")) return HelpCommand{};
    if (words.size() == 1 && (verb == "quit" || verb == "q")) return QuitCommand{};

    if (verb == "busy" && words.size() == 2) {
        const std::string v = lower(words[1]);
        if (v == "on") return BusyCommand{true};
        if (v == "off") return BusyCommand{false};
    }

    return std::nullopt;
}

} // namespace snake_escape::controller
