#include <catch2/catch.hpp>
#include <sexpr/lang/lexer.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

using namespace sexpr;

static std::string fixture_dir() {
    const char* src = std::getenv("SEXPR_SOURCE_DIR");
    if (src) return std::string(src) + "/tests/fixtures";
    return "../tests/fixtures";
}

static std::string read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

static LexResult lex_ok(const std::string& src, const Config& cfg = Config{}) {
    auto r = lex(src, cfg);
    REQUIRE(r.is_ok());
    return std::move(r).value();
}

static std::vector<TokenType> types_of(const LexResult& r) {
    std::vector<TokenType> out;
    for (const auto& t : r.tokens) out.push_back(t.type);
    return out;
}

// ===== Basics =====

TEST_CASE("lex empty input", "[lexer]") {
    auto r = lex_ok("");
    REQUIRE(r.tokens.size() == 1);
    CHECK(r.tokens[0].type == TokenType::Eof);
    CHECK(r.tokens[0].span.empty());
    CHECK(r.diagnostics.empty());
}

TEST_CASE("lex whitespace only", "[lexer]") {
    auto r = lex_ok(" \t\r\n  ");
    REQUIRE(r.tokens.size() == 1);
    CHECK(r.tokens[0].span.start.offset == 6);
    CHECK(r.tokens[0].span.start.line == 2);
}

TEST_CASE("lex a single atom", "[lexer]") {
    auto r = lex_ok("foo");
    REQUIRE(r.tokens.size() == 2);
    CHECK(r.tokens[0].type == TokenType::Atom);
    CHECK(r.tokens[0].text == "foo");
    CHECK(r.tokens[0].span.to_string() == "1:1-1:4");
    CHECK(r.tokens[1].type == TokenType::Eof);
    CHECK(r.tokens[1].span.start.offset == 3);
}

TEST_CASE("lex parenthesised list", "[lexer]") {
    auto r = lex_ok("(a b)");
    REQUIRE(types_of(r) == std::vector<TokenType>{
        TokenType::Open, TokenType::Atom, TokenType::Atom, TokenType::Close, TokenType::Eof});
    CHECK(*r.tokens[0].group() == GroupKind::Paren);
    CHECK(*r.tokens[3].group() == GroupKind::Paren);
    CHECK(r.tokens[2].span.start.col == 4);
}

TEST_CASE("operator atoms", "[lexer]") {
    auto r = lex_ok("+ - <= ?x a.b ' `q");
    REQUIRE(r.tokens.size() == 8);
    CHECK(r.tokens[0].text == "+");
    CHECK(r.tokens[2].text == "<=");
    CHECK(r.tokens[3].text == "?x");
    CHECK(r.tokens[4].text == "a.b");
    CHECK(r.tokens[5].text == "'");
    CHECK(r.tokens[6].text == "`q");
    CHECK(r.diagnostics.empty());
}

TEST_CASE("unicode identifiers and math symbols", "[lexer]") {
    auto r = lex_ok("(p\xC3\xB6jk unicode) \xE2\x88\x80x");
    REQUIRE(r.tokens.size() == 6);
    CHECK(r.tokens[1].text == "p\xC3\xB6jk");
    CHECK(r.tokens[1].span.start.offset == 1);
    CHECK(r.tokens[1].span.end.offset == 6);
    CHECK(r.tokens[1].span.to_string() == "1:2-1:6");
    CHECK(r.tokens[4].type == TokenType::Atom);
    CHECK(r.tokens[4].text == "\xE2\x88\x80x");
    CHECK(r.diagnostics.empty());
}

TEST_CASE("positions across CRLF line endings", "[lexer]") {
    auto r = lex_ok("a\r\n  b");
    REQUIRE(r.tokens.size() == 3);
    CHECK(r.tokens[1].span.start.line == 2);
    CHECK(r.tokens[1].span.start.col == 3);
}

TEST_CASE("streaming lexer keeps returning Eof", "[lexer]") {
    Lexer lexer("a", Config{});
    CHECK_FALSE(lexer.at_end());
    CHECK(lexer.next().type == TokenType::Atom);
    CHECK(lexer.next().type == TokenType::Eof);
    CHECK(lexer.at_end());
    CHECK(lexer.next().type == TokenType::Eof);
}

// ===== Optional syntax =====

TEST_CASE("braces and brackets are atom characters when disabled", "[lexer][config]") {
    auto r = lex_ok("{abc}");
    REQUIRE(r.tokens.size() == 2);
    CHECK(r.tokens[0].type == TokenType::Atom);
    CHECK(r.tokens[0].text == "{abc}");
    CHECK(r.tokens[0].span.end.offset == 5);

    r = lex_ok("(a[0])");
    REQUIRE(types_of(r) == std::vector<TokenType>{
        TokenType::Open, TokenType::Atom, TokenType::Close, TokenType::Eof});
    CHECK(r.tokens[1].text == "a[0]");
}

TEST_CASE("all three group flavours when enabled", "[lexer][config]") {
    auto r = lex_ok("([{}])", Config::all());
    REQUIRE(r.tokens.size() == 7);
    CHECK(*r.tokens[0].group() == GroupKind::Paren);
    CHECK(*r.tokens[1].group() == GroupKind::Bracket);
    CHECK(*r.tokens[2].group() == GroupKind::Brace);
    CHECK(r.tokens[3].type == TokenType::Close);
    CHECK(*r.tokens[3].group() == GroupKind::Brace);
    CHECK(*r.tokens[5].group() == GroupKind::Paren);
}

TEST_CASE("line comments are collected apart from tokens", "[lexer][config]") {
    auto r = lex_ok("a ; hi\nb", Config{}.with_line_comments());
    REQUIRE(r.tokens.size() == 3);
    CHECK(r.tokens[1].text == "b");
    CHECK(r.tokens[1].span.start.line == 2);
    REQUIRE(r.comments.size() == 1);
    CHECK(r.comments[0].text == " hi");
    CHECK(r.comments[0].span.to_string() == "1:3-1:7");
}

TEST_CASE("comment at end of input", "[lexer][config]") {
    auto r = lex_ok("a ;tail", Config{}.with_line_comments());
    REQUIRE(r.tokens.size() == 2);
    REQUIRE(r.comments.size() == 1);
    CHECK(r.comments[0].text == "tail");
}

TEST_CASE("a lone CR does not end a comment", "[lexer][config]") {
    auto r = lex_ok("; x\ry", Config::all());
    REQUIRE(r.tokens.size() == 1);
    CHECK(r.tokens[0].type == TokenType::Eof);
    REQUIRE(r.comments.size() == 1);
    CHECK(r.comments[0].text == " x\ry");
    CHECK(r.comments[0].span.end.offset == 5);
}

TEST_CASE("CRLF ends a comment", "[lexer][config]") {
    auto r = lex_ok("; x\r\ny", Config::all());
    REQUIRE(r.tokens.size() == 2);
    CHECK(r.tokens[0].text == "y");
    CHECK(r.tokens[0].span.start.line == 2);
    REQUIRE(r.comments.size() == 1);
    CHECK(r.comments[0].text == " x");
}

TEST_CASE("semicolon is an atom character when comments are disabled", "[lexer][config]") {
    auto r = lex_ok("a;b");
    REQUIRE(r.tokens.size() == 2);
    CHECK(r.tokens[0].text == "a;b");
    CHECK(r.comments.empty());
}

TEST_CASE("byte strings", "[lexer][config]") {
    auto cfg = Config{}.with_byte_strings();
    auto r = lex_ok("#0aFF# ##", cfg);
    REQUIRE(r.tokens.size() == 3);
    REQUIRE(r.tokens[0].type == TokenType::Bytes);
    CHECK(r.tokens[0].bytes()->data == std::vector<uint8_t>{0x0a, 0xff});
    CHECK(r.tokens[0].bytes()->to_hex() == "0aff");
    CHECK(r.tokens[1].bytes()->data.empty());

    auto plain = lex_ok("#0aff#");
    REQUIRE(plain.tokens.size() == 2);
    CHECK(plain.tokens[0].type == TokenType::Atom);
    CHECK(plain.tokens[0].text == "#0aff#");
}

TEST_CASE("malformed byte strings", "[lexer][config]") {
    auto cfg = Config{}.with_byte_strings();

    auto odd = lex_ok("#abc# x", cfg);
    REQUIRE(odd.tokens.size() == 3);
    CHECK(odd.tokens[0].type == TokenType::Error);
    CHECK(*odd.tokens[0].error() == DiagnosticCode::MalformedNumber);
    CHECK(odd.tokens[1].text == "x");
    REQUIRE(odd.diagnostics.size() == 1);
    CHECK(odd.diagnostics[0].span.end.offset == 5);

    auto bad_digit = lex_ok("#zz#", cfg);
    REQUIRE(bad_digit.diagnostics.size() == 1);
    CHECK(bad_digit.diagnostics[0].message.find("'z'") != std::string::npos);

    auto open = lex_ok("(#ab)", cfg);
    REQUIRE(open.diagnostics.size() == 1);
    CHECK(open.diagnostics[0].code == DiagnosticCode::MalformedNumber);
    CHECK(open.tokens[1].text == "#ab");
    CHECK(open.tokens[2].type == TokenType::Close);
}

// ===== Strings =====

TEST_CASE("quoted strings keep escapes as written", "[lexer]") {
    auto r = lex_ok("\"hello world\" \"a\\\"b\"");
    REQUIRE(r.tokens.size() == 3);
    REQUIRE(r.tokens[0].type == TokenType::String);
    CHECK(r.tokens[0].string()->raw == "hello world");
    CHECK_FALSE(r.tokens[0].string()->has_escape);
    CHECK(r.tokens[1].string()->raw == "a\\\"b");
    CHECK(r.tokens[1].string()->has_escape);
    CHECK(r.tokens[1].text == "\"a\\\"b\"");
}

TEST_CASE("strings may contain delimiters and newlines", "[lexer]") {
    auto r = lex_ok("\"(a ;\n)\" x", Config::all());
    REQUIRE(r.tokens.size() == 3);
    CHECK(r.tokens[0].string()->raw == "(a ;\n)");
    CHECK(r.tokens[1].span.start.line == 2);
    CHECK(r.comments.empty());
}

TEST_CASE("unterminated string", "[lexer]") {
    auto r = lex_ok("(a \"abc");
    REQUIRE(r.diagnostics.size() == 1);
    CHECK(r.diagnostics[0].code == DiagnosticCode::UnterminatedString);
    CHECK(r.diagnostics[0].span.start.offset == 3);
    CHECK(r.diagnostics[0].span.end.offset == 7);
    CHECK(r.tokens[2].type == TokenType::Error);
    CHECK(r.tokens.back().type == TokenType::Eof);
}

// ===== Numbers =====

TEST_CASE("number tokens", "[lexer][number]") {
    auto r = lex_ok("0xfedc__1240__abcd 100_000_000 0b11 1.25");
    REQUIRE(r.tokens.size() == 5);
    for (size_t i = 0; i < 4; ++i) {
        CHECK(r.tokens[i].type == TokenType::Number);
    }
    CHECK(r.tokens[0].number()->value == mpz_class("fedc1240abcd", 16));
    CHECK(r.tokens[1].number()->to_u64() == 100000000u);
    CHECK(r.tokens[2].number()->to_u64() == 3u);
    CHECK(r.tokens[3].number()->is_decimal);
}

TEST_CASE("dot after a number starts an atom", "[lexer][number]") {
    auto r = lex_ok("1.");
    REQUIRE(r.tokens.size() == 3);
    CHECK(r.tokens[0].type == TokenType::Number);
    CHECK(r.tokens[1].type == TokenType::Atom);
    CHECK(r.tokens[1].text == ".");
}

TEST_CASE("malformed numbers are reported and lexing continues", "[lexer][number]") {
    auto r = lex_ok("12_ ok _12 1__2");
    REQUIRE(types_of(r) == std::vector<TokenType>{
        TokenType::Error, TokenType::Atom, TokenType::Error, TokenType::Number, TokenType::Eof});
    CHECK(r.tokens[0].text == "12_");
    CHECK(r.tokens[1].text == "ok");
    CHECK(r.tokens[2].text == "_12");
    CHECK(r.tokens[3].number()->to_u64() == 12u);

    REQUIRE(r.diagnostics.size() == 2);
    CHECK(r.diagnostics[0].code == DiagnosticCode::MalformedNumber);
    CHECK(r.diagnostics[0].span.to_string() == "1:1-1:4");
    CHECK(r.diagnostics[1].code == DiagnosticCode::MalformedNumber);
    CHECK(r.diagnostics[1].span.start.col == 8);
}

TEST_CASE("leading separator before a fraction is malformed", "[lexer][number]") {
    auto r = lex_ok("_12.5 _1.x _12.5x");
    REQUIRE(types_of(r) == std::vector<TokenType>{
        TokenType::Error, TokenType::Error, TokenType::Atom, TokenType::Atom, TokenType::Eof});
    CHECK(r.tokens[0].text == "_12.5");
    CHECK(r.tokens[1].text == "_1");
    CHECK(r.tokens[2].text == ".x");
    CHECK(r.tokens[3].text == "_12.5x");
    REQUIRE(r.diagnostics.size() == 2);
    CHECK(r.diagnostics[0].code == DiagnosticCode::MalformedNumber);
    CHECK(r.diagnostics[0].span.end.offset == 5);
}

TEST_CASE("underscore identifiers are atoms", "[lexer][number]") {
    auto r = lex_ok("_x1 _1x _");
    REQUIRE(r.tokens.size() == 4);
    CHECK(r.tokens[0].type == TokenType::Atom);
    CHECK(r.tokens[1].type == TokenType::Atom);
    CHECK(r.tokens[1].text == "_1x");
    CHECK(r.tokens[2].type == TokenType::Atom);
    CHECK(r.diagnostics.empty());
}

TEST_CASE("letters glued to a number make it malformed", "[lexer][number]") {
    auto r = lex_ok("12abc 0b102");
    REQUIRE(r.diagnostics.size() == 2);
    CHECK(r.tokens[0].text == "12abc");
    CHECK(r.tokens[1].text == "0b102");
}

// ===== Invalid input =====

TEST_CASE("invalid UTF-8 byte is skipped with a diagnostic", "[lexer]") {
    auto r = lex_ok(std::string("a \xFF b"));
    REQUIRE(types_of(r) == std::vector<TokenType>{
        TokenType::Atom, TokenType::Error, TokenType::Atom, TokenType::Eof});
    REQUIRE(r.diagnostics.size() == 1);
    CHECK(r.diagnostics[0].code == DiagnosticCode::InvalidCharacter);
    CHECK(r.diagnostics[0].span.start.offset == 2);
    CHECK(r.diagnostics[0].span.end.offset == 3);
}

TEST_CASE("control characters are invalid", "[lexer]") {
    auto r = lex_ok("a\x01");
    REQUIRE(r.diagnostics.size() == 1);
    CHECK(r.diagnostics[0].code == DiagnosticCode::InvalidCharacter);
    CHECK(r.diagnostics[0].message.find("U+0001") != std::string::npos);
}

TEST_CASE("NUL bytes are rejected outright", "[lexer]") {
    auto r = lex(std::string("a\0b", 3));
    REQUIRE(r.is_err());
    CHECK(r.error().code == SexprError::InvalidInput);
    CHECK(r.error().message.find("offset 1") != std::string::npos);
}

TEST_CASE("diagnostics are reported in source order", "[lexer]") {
    auto r = lex_ok("(1_ \xFF \"x");
    REQUIRE(r.diagnostics.size() == 3);
    CHECK(r.diagnostics[0].code == DiagnosticCode::MalformedNumber);
    CHECK(r.diagnostics[1].code == DiagnosticCode::InvalidCharacter);
    CHECK(r.diagnostics[2].code == DiagnosticCode::UnterminatedString);
}

TEST_CASE("diagnostic format", "[lexer]") {
    auto r = lex_ok("\n  12_");
    REQUIRE(r.diagnostics.size() == 1);
    auto text = r.diagnostics[0].format("x.sexp");
    CHECK(text.find("x.sexp:2:3: error[MalformedNumber]: ") == 0);
    CHECK(text.find("trailing") != std::string::npos);
}

// ===== Fixture =====

TEST_CASE("lex program fixture", "[lexer][fixture]") {
    auto src = read_file(fixture_dir() + "/program.sexp");
    REQUIRE_FALSE(src.empty());

    auto r = lex_ok(src, Config::all());
    CHECK(r.diagnostics.empty());
    REQUIRE(r.comments.size() == 2);
    CHECK(r.comments[0].text == " this is a post comment");
    CHECK(r.comments[1].span.start.line == 2);

    size_t strings = 0, numbers = 0;
    for (const auto& t : r.tokens) {
        if (t.type == TokenType::String) ++strings;
        if (t.type == TokenType::Number) ++numbers;
    }
    CHECK(strings == 3);
    CHECK(numbers == 4);
}
