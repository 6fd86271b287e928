#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace sexpr {

// A location in the source buffer. Line and column are 1-based; the column
// counts Unicode scalar values, not bytes.
struct Position {
    size_t offset = 0;
    int line = 1;
    int col = 1;

    bool operator==(const Position& o) const { return offset == o.offset; }
    bool operator!=(const Position& o) const { return offset != o.offset; }
    bool operator<(const Position& o) const { return offset < o.offset; }
    bool operator<=(const Position& o) const { return offset <= o.offset; }

    std::string to_string() const;
};

// Half-open range [start, end) over the source buffer.
struct Span {
    Position start;
    Position end;

    Span() = default;
    Span(Position s, Position e) : start(s), end(e) {}

    bool empty() const { return start.offset == end.offset; }
    size_t length() const { return end.offset - start.offset; }

    // Smallest span covering both
    Span merge(const Span& other) const;
    bool contains(const Span& other) const;

    bool operator==(const Span& o) const { return start == o.start && end == o.end; }
    bool operator!=(const Span& o) const { return !(*this == o); }

    std::string to_string() const;
};

// Maps byte offsets of a buffer to Positions. The cursor only moves forward;
// asking for an offset behind it, or past the end of input, throws
// std::out_of_range.
class SpanTracker {
public:
    explicit SpanTracker(std::string_view source);

    const Position& position() const { return pos_; }

    // Move the cursor to `offset` and return the resulting position.
    const Position& advance_to(size_t offset);

    // Move the cursor over the next `bytes` bytes.
    const Position& advance(size_t bytes) { return advance_to(pos_.offset + bytes); }

private:
    std::string_view source_;
    Position pos_;
};

} // namespace sexpr
