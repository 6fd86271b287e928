#include <catch2/catch.hpp>
#include <sexpr/lang/span.hpp>
#include <sexpr/lang/utf8.hpp>
#include <stdexcept>
#include <string>

using namespace sexpr;

TEST_CASE("tracker starts at 1:1", "[span]") {
    SpanTracker t("abc");
    CHECK(t.position().offset == 0);
    CHECK(t.position().line == 1);
    CHECK(t.position().col == 1);
}

TEST_CASE("tracker counts lines and columns", "[span]") {
    SpanTracker t("ab\ncd");
    auto p = t.advance_to(2);
    CHECK(p.line == 1);
    CHECK(p.col == 3);

    p = t.advance_to(3);
    CHECK(p.line == 2);
    CHECK(p.col == 1);

    p = t.advance_to(5);
    CHECK(p.offset == 5);
    CHECK(p.line == 2);
    CHECK(p.col == 3);
}

TEST_CASE("tracker treats CRLF as one line break", "[span]") {
    std::string src = "a\r\nb";
    SpanTracker t(src);
    auto p = t.advance_to(2);
    CHECK(p.line == 1);
    CHECK(p.col == 2);

    p = t.advance_to(3);
    CHECK(p.line == 2);
    CHECK(p.col == 1);
}

TEST_CASE("lone CR is an ordinary column", "[span]") {
    SpanTracker t("a\rb");
    auto p = t.advance_to(3);
    CHECK(p.line == 1);
    CHECK(p.col == 4);
}

TEST_CASE("columns count code points, not bytes", "[span]") {
    // p, U+221A (3 bytes), U+00F6 (2 bytes), j, k
    std::string src = "p\xE2\x88\x9A\xC3\xB6jk";
    SpanTracker t(src);
    auto p = t.advance_to(6);
    CHECK(p.col == 4);
    p = t.advance_to(src.size());
    CHECK(p.offset == 8);
    CHECK(p.col == 6);
}

TEST_CASE("invalid bytes count one column each", "[span]") {
    std::string src = "\xFF\xFEx";
    SpanTracker t(src);
    CHECK(t.advance(1).col == 2);
    CHECK(t.advance(1).col == 3);
    CHECK(t.advance(1).col == 4);
}

TEST_CASE("tracker refuses to move backwards or past the end", "[span]") {
    SpanTracker t("abc");
    t.advance_to(2);
    REQUIRE_THROWS_AS(t.advance_to(1), std::out_of_range);
    REQUIRE_THROWS_AS(t.advance_to(4), std::out_of_range);
    REQUIRE(t.advance_to(2).offset == 2);
    REQUIRE(t.advance_to(3).offset == 3);
}

TEST_CASE("span helpers", "[span]") {
    Span a(Position{0, 1, 1}, Position{3, 1, 4});
    Span b(Position{5, 1, 6}, Position{9, 2, 2});

    CHECK(a.length() == 3);
    CHECK_FALSE(a.empty());
    CHECK(Span(a.end, a.end).empty());
    CHECK(a.to_string() == "1:1-1:4");

    Span m = a.merge(b);
    CHECK(m.start.offset == 0);
    CHECK(m.end.offset == 9);
    CHECK(m.to_string() == "1:1-2:2");
    CHECK(b.merge(a) == m);

    CHECK(m.contains(a));
    CHECK(m.contains(b));
    CHECK_FALSE(a.contains(m));
}

TEST_CASE("utf8 decode", "[span][utf8]") {
    std::string src = "a\xC3\xB6\xE2\x88\x80\xF0\x9D\x90\x80";
    auto d = utf8::decode(src, 0);
    CHECK(d.ok());
    CHECK(d.cp == U'a');
    CHECK(d.width == 1);

    d = utf8::decode(src, 1);
    CHECK(d.cp == 0xF6);
    CHECK(d.width == 2);

    d = utf8::decode(src, 3);
    CHECK(d.cp == 0x2200);
    CHECK(d.width == 3);

    d = utf8::decode(src, 6);
    CHECK(d.cp == 0x1D400);
    CHECK(d.width == 4);

    CHECK(utf8::decode(src, src.size()).status == utf8::DecodeStatus::End);
}

TEST_CASE("utf8 decode rejects malformed input one byte at a time", "[span][utf8]") {
    CHECK(utf8::decode("\x80", 0).status == utf8::DecodeStatus::InvalidLead);
    CHECK(utf8::decode("\xC3", 0).status == utf8::DecodeStatus::Truncated);
    CHECK(utf8::decode("\xC3x", 0).status == utf8::DecodeStatus::InvalidCont);
    // overlong '/' and a UTF-16 surrogate
    CHECK(utf8::decode("\xC0\xAF", 0).status != utf8::DecodeStatus::Ok);
    CHECK(utf8::decode("\xED\xA0\x80", 0).status != utf8::DecodeStatus::Ok);
    CHECK(utf8::decode("\xC3x", 0).width == 1);

    CHECK(utf8::sequence_width('a') == 1);
    CHECK(utf8::sequence_width(0xE2) == 3);
    CHECK(utf8::sequence_width(0x80) == 0);
}
