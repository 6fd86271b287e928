#pragma once

#include <sexpr/config.hpp>
#include <sexpr/lang/tree.hpp>
#include <sexpr/result.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace sexpr {

// Text builder. Items are separated by the configured separator; nothing
// is inserted after an opening delimiter or before a closing one. A comment
// runs to the end of its line, so the builder breaks the line after it.
class Printer {
public:
    explicit Printer(PrintOptions options = PrintOptions{});

    void open(GroupKind kind);
    void close(GroupKind kind);
    void text(std::string_view s);
    void comment(std::string_view text);   // `text` excludes the ';'

    const std::string& str() const { return buf_; }
    std::string take();

private:
    enum class State { Fresh, Item };

    PrintOptions options_;
    std::string buf_;
    State prev_ = State::Fresh;

    void separate();
};

// Separator must be non-empty whitespace, or re-lexing would not split items
Status check_print_options(const PrintOptions& options);

// Render text that lexes and parses back (under `config`) to a structurally
// equal tree. Fails with ConfigMismatch when the tree uses a form `config`
// cannot express, e.g. a { } group with brace grouping disabled.
Result<std::string> print(const std::vector<Node>& nodes, const Config& config,
                          const PrintOptions& options = PrintOptions{});
Result<std::string> print(const Node& node, const Config& config,
                          const PrintOptions& options = PrintOptions{});

// As above, re-inserting each comment before the first item that starts
// after it.
Result<std::string> print(const ParseResult& result, const Config& config,
                          const PrintOptions& options = PrintOptions{});

// Render a flat token sequence (Eof and anything after it is ignored)
Result<std::string> print_tokens(const std::vector<Token>& tokens, const Config& config,
                                 const PrintOptions& options = PrintOptions{});

} // namespace sexpr
