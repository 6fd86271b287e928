#include <sexpr/lang/lexer.hpp>
#include <sexpr/lang/utf8.hpp>
#include <sexpr/log.hpp>
#include <unicode/uchar.h>
#include <cctype>
#include <cstdio>
#include <cstring>

namespace sexpr {

// ---------------------------------------------------------------------------
// Character classes
// ---------------------------------------------------------------------------

namespace {

// Any ASCII punctuation that may appear in an atom, except the reserved
// ( ) " \ and the optional { } [ ] ; which depend on the config.
bool is_ascii_operator(char32_t cp) {
    return cp < 0x80 && cp != 0 &&
           std::strchr("?!#@$+-*/=<>,.:|%^&~'`", static_cast<int>(cp)) != nullptr;
}

bool is_math_operator(char32_t cp) {
    return (cp >= 0x2200 && cp <= 0x22FF) || (cp >= 0x2A00 && cp <= 0x2AFF);
}

bool is_math_alphanumeric(char32_t cp) {
    return cp >= 0x1D400 && cp <= 0x1D7FF;
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool is_ascii_digit(char c) {
    return c >= '0' && c <= '9';
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string describe_codepoint(char32_t cp) {
    char buf[48];
    if (cp < 0x20 || cp == 0x7F) {
        std::snprintf(buf, sizeof(buf), "control character U+%04X", static_cast<unsigned>(cp));
    } else {
        std::snprintf(buf, sizeof(buf), "unexpected character U+%04X", static_cast<unsigned>(cp));
    }
    return buf;
}

} // anonymous namespace

bool Lexer::is_atom_start(char32_t cp) const {
    if (cp < 0x80) {
        char c = static_cast<char>(cp);
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') return true;
        if (is_ascii_operator(cp)) return true;
        if (!config_.brace_groups && (c == '{' || c == '}')) return true;
        if (!config_.bracket_groups && (c == '[' || c == ']')) return true;
        if (!config_.line_comments && c == ';') return true;
        return false;
    }
    return u_hasBinaryProperty(static_cast<UChar32>(cp), UCHAR_XID_START) ||
           is_math_operator(cp);
}

bool Lexer::is_atom_continue(char32_t cp) const {
    if (cp < 0x80) {
        return is_ascii_digit(static_cast<char>(cp)) || is_atom_start(cp);
    }
    return u_hasBinaryProperty(static_cast<UChar32>(cp), UCHAR_XID_CONTINUE) ||
           is_math_operator(cp) || is_math_alphanumeric(cp);
}

// Characters that end a byte-string interior early
bool Lexer::is_terminator(char c) const {
    if (is_space(c) || c == '(' || c == ')' || c == '"') return true;
    if (config_.brace_groups && (c == '{' || c == '}')) return true;
    if (config_.bracket_groups && (c == '[' || c == ']')) return true;
    if (config_.line_comments && c == ';') return true;
    return false;
}

// `_12`, `__1_0`, `_12.5`: a run of separators and digits (with an optional
// `.digits` tail) that would otherwise lex as an atom is a number with a
// leading separator. As with any number, a '.' ends the literal.
bool Lexer::underscore_number_ahead(size_t start) const {
    auto skip_run = [this](size_t i, bool& saw_digit) {
        while (i < src_.size() && (src_[i] == '_' || is_ascii_digit(src_[i]))) {
            saw_digit = saw_digit || is_ascii_digit(src_[i]);
            ++i;
        }
        return i;
    };

    bool saw_digit = false;
    size_t i = skip_run(start, saw_digit);
    if (!saw_digit) return false;
    if (i + 1 < src_.size() && src_[i] == '.' && is_ascii_digit(src_[i + 1])) {
        i = skip_run(i + 1, saw_digit);
    }
    if (i == src_.size() || src_[i] == '.') return true;

    auto d = utf8::decode(src_, i);
    return !d.ok() || !is_atom_continue(d.cp);
}

// ---------------------------------------------------------------------------
// Lexer
// ---------------------------------------------------------------------------

Status check_input(std::string_view source) {
    auto nul = source.find('\0');
    if (nul != std::string_view::npos) {
        return SexprError{SexprError::InvalidInput,
            "input is not text: NUL byte at offset " + std::to_string(nul),
            "binary data cannot be lexed"};
    }
    return ok_status();
}

Lexer::Lexer(std::string_view source, const Config& config)
    : src_(source), config_(config), tracker_(source) {}

std::vector<Diagnostic> Lexer::take_diagnostics() {
    std::vector<Diagnostic> out;
    out.swap(diagnostics_);
    return out;
}

void Lexer::skip_whitespace() {
    while (pos_ < src_.size() && is_space(src_[pos_])) {
        ++pos_;
    }
}

Token Lexer::make(TokenType type, size_t start, size_t end) {
    Token tok;
    tok.type = type;
    tok.text = std::string(src_.substr(start, end - start));
    tok.span.start = tracker_.advance_to(start);
    tok.span.end = tracker_.advance_to(end);
    pos_ = end;
    return tok;
}

Token Lexer::make_error(DiagnosticCode code, size_t start, size_t end, std::string message) {
    Token tok = make(TokenType::Error, start, end);
    tok.payload = code;
    diagnostics_.push_back({code, std::move(message), tok.span, std::nullopt});
    return tok;
}

Token Lexer::next() {
    skip_whitespace();
    if (pos_ >= src_.size()) {
        done_ = true;
        return make(TokenType::Eof, src_.size(), src_.size());
    }

    size_t start = pos_;
    char c = src_[pos_];

    // Lex in this order:
    // * group characters, if enabled
    // * line comment ';', if enabled
    // * string '"'
    // * byte string '#', if enabled
    // * number, including the `_12` malformed form
    // * atom
    if (c == '(' || c == ')') {
        return lex_delimiter(start, GroupKind::Paren, c == '(');
    }
    if (config_.brace_groups && (c == '{' || c == '}')) {
        return lex_delimiter(start, GroupKind::Brace, c == '{');
    }
    if (config_.bracket_groups && (c == '[' || c == ']')) {
        return lex_delimiter(start, GroupKind::Bracket, c == '[');
    }
    if (config_.line_comments && c == ';') {
        return lex_comment(start);
    }
    if (c == '"') {
        return lex_string(start);
    }
    if (config_.byte_strings && c == '#') {
        return lex_bytes(start);
    }
    if (is_ascii_digit(c) || (c == '_' && underscore_number_ahead(start))) {
        return lex_number(start);
    }

    auto d = utf8::decode(src_, start);
    if (!d.ok()) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "invalid UTF-8 byte 0x%02X",
                      static_cast<unsigned>(static_cast<unsigned char>(c)));
        return make_error(DiagnosticCode::InvalidCharacter, start, start + 1, buf);
    }
    if (is_atom_start(d.cp)) {
        return lex_atom(start);
    }
    return make_error(DiagnosticCode::InvalidCharacter, start, start + d.width,
                      describe_codepoint(d.cp));
}

Token Lexer::lex_delimiter(size_t start, GroupKind kind, bool is_open) {
    Token tok = make(is_open ? TokenType::Open : TokenType::Close, start, start + 1);
    tok.payload = kind;
    return tok;
}

Token Lexer::lex_comment(size_t start) {
    size_t end = start + 1;
    while (end < src_.size() && src_[end] != '\n') {
        // \r\n ends the line; a lone \r is ordinary comment text
        if (src_[end] == '\r' && end + 1 < src_.size() && src_[end + 1] == '\n') break;
        ++end;
    }
    return make(TokenType::Comment, start, end);
}

Token Lexer::lex_string(size_t start) {
    StringLit lit;
    size_t i = start + 1;
    while (i < src_.size()) {
        char c = src_[i];
        if (c == '\\') {
            lit.has_escape = true;
            i += 2;
            continue;
        }
        if (c == '"') {
            lit.raw = std::string(src_.substr(start + 1, i - start - 1));
            Token tok = make(TokenType::String, start, i + 1);
            tok.payload = std::move(lit);
            return tok;
        }
        ++i;
    }
    return make_error(DiagnosticCode::UnterminatedString, start, src_.size(),
                      "unterminated string literal");
}

Token Lexer::lex_bytes(size_t start) {
    size_t i = start + 1;
    while (i < src_.size() && src_[i] != '#' && !is_terminator(src_[i])) {
        ++i;
    }
    if (i >= src_.size() || src_[i] != '#') {
        return make_error(DiagnosticCode::MalformedNumber, start, i,
                          "unterminated byte string (missing closing '#')");
    }

    size_t end = i + 1;
    std::string_view interior = src_.substr(start + 1, i - start - 1);
    for (char c : interior) {
        if (hex_value(c) < 0) {
            std::string msg = "invalid hex digit ";
            if (std::isprint(static_cast<unsigned char>(c))) {
                msg += "'" + std::string(1, c) + "'";
            } else {
                msg += "byte";
            }
            return make_error(DiagnosticCode::MalformedNumber, start, end,
                              msg + " in byte string");
        }
    }
    if (interior.size() % 2 != 0) {
        return make_error(DiagnosticCode::MalformedNumber, start, end,
                          "byte string has an odd number of hex digits");
    }

    Bytes bytes;
    bytes.data.reserve(interior.size() / 2);
    for (size_t k = 0; k < interior.size(); k += 2) {
        bytes.data.push_back(static_cast<uint8_t>(
            hex_value(interior[k]) * 16 + hex_value(interior[k + 1])));
    }
    Token tok = make(TokenType::Bytes, start, end);
    tok.payload = std::move(bytes);
    return tok;
}

Token Lexer::lex_number(size_t start) {
    auto scan = scan_number(src_, start);
    size_t end = start + scan.length;
    if (!scan.number) {
        return make_error(DiagnosticCode::MalformedNumber, start, end,
                          "malformed number '" + std::string(src_.substr(start, scan.length)) +
                          "': " + scan.error);
    }
    Token tok = make(TokenType::Number, start, end);
    tok.payload = std::move(*scan.number);
    return tok;
}

Token Lexer::lex_atom(size_t start) {
    size_t i = start + utf8::decode(src_, start).width;
    while (i < src_.size()) {
        auto d = utf8::decode(src_, i);
        if (!d.ok() || !is_atom_continue(d.cp)) break;
        i += d.width;
    }
    return make(TokenType::Atom, start, i);
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Result<LexResult> lex(std::string_view source, const Config& config) {
    SEXPR_TRY(check_input(source));

    Lexer lexer(source, config);
    LexResult result;
    for (;;) {
        Token tok = lexer.next();
        if (tok.type == TokenType::Comment) {
            result.comments.push_back({tok.text.substr(1), tok.span});
            continue;
        }
        bool eof = tok.type == TokenType::Eof;
        result.tokens.push_back(std::move(tok));
        if (eof) break;
    }
    result.diagnostics = lexer.take_diagnostics();

    log::debug("lexed %zu tokens, %zu comments, %zu diagnostics",
               result.tokens.size(), result.comments.size(),
               result.diagnostics.size());
    return Result<LexResult>::ok(std::move(result));
}

} // namespace sexpr
