#pragma once

#include "Types.hpp"
#include <cstddef>
#include <vector>

namespace snake_escape::core {

// A snake is tracked outside the board grid: its body spans many cells and
// is queried for collision on its own.
class Snake {
public:
    // body[0] is the head, body.back() the tail.
    // Throws std::invalid_argument for an empty body or a repeated cell.
    Snake(SnakeId id, SnakeColor color, std::vector<Cell> body);

    SnakeId id() const noexcept { return id_; }
    SnakeColor color() const noexcept { return color_; }
    const std::vector<Cell>& body() const noexcept { return body_; }
    std::size_t length() const noexcept { return body_.size(); }

    Cell head() const noexcept { return body_.front(); }
    Cell tail() const noexcept { return body_.back(); }
    Cell end(SnakeEnd which) const noexcept {
        return which == SnakeEnd::Head ? head() : tail();
    }

    bool occupies(Cell c) const noexcept;

    // Head step: new head in front, tail dropped unless growing
    void advanceHead(Cell next, bool grow);

    // Tail step (reversed crawl): new tail appended, head dropped
    void advanceTail(Cell next);

    // Teleport an end without touching the rest of the body
    void setEnd(SnakeEnd which, Cell c);

    // Cut the body at c: a head hit loses only the head cell, any other hit
    // loses everything from c to the tail. Returns false if c is not part of
    // the body. The body may be empty afterwards.
    bool sliceAt(Cell c);

    bool empty() const noexcept { return body_.empty(); }

private:
    SnakeId id_;
    SnakeColor color_;
    std::vector<Cell> body_;
};

} // namespace snake_escape::core
