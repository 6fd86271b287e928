#include <sexpr/lang/span.hpp>
#include <sexpr/lang/utf8.hpp>
#include <algorithm>
#include <stdexcept>

namespace sexpr {

std::string Position::to_string() const {
    return std::to_string(line) + ":" + std::to_string(col);
}

Span Span::merge(const Span& other) const {
    Span s;
    s.start = std::min(start, other.start);
    s.end = (end < other.end) ? other.end : end;
    return s;
}

bool Span::contains(const Span& other) const {
    return start <= other.start && other.end <= end;
}

std::string Span::to_string() const {
    return start.to_string() + "-" + end.to_string();
}

SpanTracker::SpanTracker(std::string_view source)
    : source_(source) {}

const Position& SpanTracker::advance_to(size_t offset) {
    if (offset < pos_.offset) {
        throw std::out_of_range("span tracker cannot move backwards (offset " +
                                std::to_string(offset) + " < " +
                                std::to_string(pos_.offset) + ")");
    }
    if (offset > source_.size()) {
        throw std::out_of_range("span tracker offset " + std::to_string(offset) +
                                " is past end of input");
    }

    while (pos_.offset < offset) {
        char c = source_[pos_.offset];
        if (c == '\n') {
            ++pos_.line;
            pos_.col = 1;
            ++pos_.offset;
            continue;
        }
        if (c == '\r' && pos_.offset + 1 < source_.size() &&
            source_[pos_.offset + 1] == '\n') {
            // \r\n is a single break; the \n does the line bump
            ++pos_.offset;
            continue;
        }

        auto d = utf8::decode(source_, pos_.offset);
        ++pos_.col;
        pos_.offset = std::min(pos_.offset + d.width, offset);
    }
    return pos_;
}

} // namespace sexpr
