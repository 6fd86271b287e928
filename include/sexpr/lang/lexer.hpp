#pragma once

#include <sexpr/config.hpp>
#include <sexpr/lang/span.hpp>
#include <sexpr/lang/token.hpp>
#include <sexpr/result.hpp>
#include <string_view>
#include <vector>

namespace sexpr {

struct LexResult {
    std::vector<Token> tokens;          // everything but comments, Eof last
    std::vector<Comment> comments;
    std::vector<Diagnostic> diagnostics;
};

// The only hard precondition on input: it must be text, i.e. free of NUL
// bytes. Everything else is reported as a recoverable diagnostic.
Status check_input(std::string_view source);

// Pull-based tokenizer over a caller-owned buffer. Each call to next()
// produces one token; once the input is exhausted it keeps returning Eof.
// Malformed input yields Error tokens (with a diagnostic) and lexing
// carries on after the offending unit.
class Lexer {
public:
    Lexer(std::string_view source, const Config& config);

    Token next();

    bool at_end() const { return done_; }

    const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }
    std::vector<Diagnostic> take_diagnostics();

    const Config& config() const { return config_; }

private:
    std::string_view src_;
    Config config_;
    SpanTracker tracker_;
    size_t pos_ = 0;
    bool done_ = false;
    std::vector<Diagnostic> diagnostics_;

    void skip_whitespace();

    Token make(TokenType type, size_t start, size_t end);
    Token make_error(DiagnosticCode code, size_t start, size_t end, std::string message);

    Token lex_delimiter(size_t start, GroupKind kind, bool is_open);
    Token lex_comment(size_t start);
    Token lex_string(size_t start);
    Token lex_bytes(size_t start);
    Token lex_number(size_t start);
    Token lex_atom(size_t start);

    bool is_atom_start(char32_t cp) const;
    bool is_atom_continue(char32_t cp) const;
    bool is_terminator(char c) const;
    bool underscore_number_ahead(size_t start) const;
};

// Lex a whole buffer. Fails only when check_input() fails.
Result<LexResult> lex(std::string_view source, const Config& config = Config{});

} // namespace sexpr
