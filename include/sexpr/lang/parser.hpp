#pragma once

#include <sexpr/config.hpp>
#include <sexpr/lang/lexer.hpp>
#include <sexpr/lang/tree.hpp>
#include <sexpr/result.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace sexpr {

// Grouping parser. Pulls one token at a time and yields one top-level node
// at a time. Delimiter errors are recorded as diagnostics and parsing goes
// on, so a best-effort tree is always produced.
class Parser {
public:
    // Parse straight from source text; fails only if check_input() does
    static Result<Parser> open(std::string_view source, const Config& config);

    // Group an already-lexed token vector (Eof-terminated or not).
    // `tokens` must outlive the parser.
    explicit Parser(const std::vector<Token>& tokens);

    // Next top-level node, or nullopt once the input is exhausted
    std::optional<Node> next();

    bool at_end() const { return finished_ && !pending_; }

    // Lexer and grouping diagnostics in the order they were found
    const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }
    std::vector<Diagnostic> take_diagnostics();
    std::vector<Comment> take_comments();

private:
    Parser(std::string_view source, const Config& config);

    struct Frame {
        GroupKind kind;
        Span open;
        std::vector<Node> children;
    };

    std::optional<Lexer> lexer_;
    const std::vector<Token>* tokens_ = nullptr;
    size_t index_ = 0;

    std::vector<Frame> stack_;
    std::optional<Node> pending_;
    std::vector<Comment> comments_;
    std::vector<Diagnostic> diagnostics_;
    bool finished_ = false;

    Token pull();
    std::optional<Node> append(Node node);
    std::optional<Node> close_group(const Token& tok);
    void finish(const Span& eof);
};

// Lex and group a whole buffer
Result<ParseResult> parse(std::string_view source, const Config& config = Config{});

// Group a token vector produced by lex()
ParseResult parse_tokens(const std::vector<Token>& tokens);

} // namespace sexpr
