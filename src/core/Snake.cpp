#include "core/Snake.hpp"

#include <algorithm>
#include <cassert>
#include <stdexcept>
#include <unordered_set>

namespace snake_escape::core {

Snake::Snake(SnakeId id, SnakeColor color, std::vector<Cell> body)
    : id_{id}
    , color_{color}
    , body_{std::move(body)}
{
    if (body_.empty()) {
        throw std::invalid_argument("Snake body must not be empty");
    }
    std::unordered_set<Cell, CellHash> seen;
    for (const auto& c : body_) {
        if (!seen.insert(c).second) {
            throw std::invalid_argument("Snake body must not repeat a cell");
        }
    }
}

bool Snake::occupies(Cell c) const noexcept {
    return std::find(body_.begin(), body_.end(), c) != body_.end();
}

void Snake::advanceHead(Cell next, bool grow) {
    assert(!body_.empty());
    body_.insert(body_.begin(), next);
    if (!grow) {
        body_.pop_back();
    }
}

void Snake::advanceTail(Cell next) {
    assert(!body_.empty());
    body_.push_back(next);
    body_.erase(body_.begin());
}

void Snake::setEnd(SnakeEnd which, Cell c) {
    assert(!body_.empty());
    if (which == SnakeEnd::Head) {
        body_.front() = c;
    } else {
        body_.back() = c;
    }
}

bool Snake::sliceAt(Cell c) {
    auto it = std::find(body_.begin(), body_.end(), c);
    if (it == body_.end()) {
        return false;
    }
    if (it == body_.begin()) {
        body_.erase(body_.begin());
    } else {
        body_.erase(it, body_.end());
    }
    return true;
}

} // namespace snake_escape::core
