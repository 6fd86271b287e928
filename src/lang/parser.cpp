#include <sexpr/lang/parser.hpp>
#include <sexpr/log.hpp>

namespace sexpr {

namespace {

std::string quoted(char c) {
    return std::string("'") + c + "'";
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

Parser::Parser(std::string_view source, const Config& config)
    : lexer_(std::in_place, source, config) {}

Parser::Parser(const std::vector<Token>& tokens)
    : tokens_(&tokens) {}

Result<Parser> Parser::open(std::string_view source, const Config& config) {
    SEXPR_TRY(check_input(source));
    return Result<Parser>::ok(Parser(source, config));
}

std::vector<Diagnostic> Parser::take_diagnostics() {
    std::vector<Diagnostic> out;
    out.swap(diagnostics_);
    return out;
}

std::vector<Comment> Parser::take_comments() {
    std::vector<Comment> out;
    out.swap(comments_);
    return out;
}

// ---------------------------------------------------------------------------
// Token source
// ---------------------------------------------------------------------------

Token Parser::pull() {
    if (lexer_) {
        Token tok = lexer_->next();
        // Keep lexer diagnostics interleaved with grouping ones
        for (auto& d : lexer_->take_diagnostics()) {
            diagnostics_.push_back(std::move(d));
        }
        return tok;
    }

    if (index_ < tokens_->size()) {
        return (*tokens_)[index_++];
    }
    Token eof;
    if (!tokens_->empty()) {
        eof.span = Span(tokens_->back().span.end, tokens_->back().span.end);
    }
    return eof;
}

// ---------------------------------------------------------------------------
// Grouping
// ---------------------------------------------------------------------------

std::optional<Node> Parser::next() {
    while (!finished_) {
        Token tok = pull();
        std::optional<Node> done;

        switch (tok.type) {
        case TokenType::Eof:
            finish(tok.span);
            break;
        case TokenType::Comment:
            comments_.push_back({tok.text.substr(1), tok.span});
            break;
        case TokenType::Error:
            // already reported by the lexer; nothing to put in the tree
            break;
        case TokenType::Atom:
            done = append(Node{Atom{tok.text}, tok.span});
            break;
        case TokenType::Number:
            done = append(Node{std::get<Number>(std::move(tok.payload)), tok.span});
            break;
        case TokenType::String:
            done = append(Node{std::get<StringLit>(std::move(tok.payload)), tok.span});
            break;
        case TokenType::Bytes:
            done = append(Node{std::get<Bytes>(std::move(tok.payload)), tok.span});
            break;
        case TokenType::Open:
            stack_.push_back({*tok.group(), tok.span, {}});
            break;
        case TokenType::Close:
            done = close_group(tok);
            break;
        }

        if (done) return done;
    }

    std::optional<Node> out;
    out.swap(pending_);
    return out;
}

std::optional<Node> Parser::append(Node node) {
    if (stack_.empty()) return node;
    stack_.back().children.push_back(std::move(node));
    return std::nullopt;
}

std::optional<Node> Parser::close_group(const Token& tok) {
    GroupKind kind = *tok.group();

    if (stack_.empty()) {
        diagnostics_.push_back({DiagnosticCode::UnmatchedClose,
            "unmatched closing " + quoted(close_char(kind)),
            tok.span, std::nullopt});
        log::debug("dropping unmatched %c at %s", close_char(kind),
                   tok.span.start.to_string().c_str());
        return std::nullopt;
    }

    Frame frame = std::move(stack_.back());
    stack_.pop_back();

    if (frame.kind != kind) {
        diagnostics_.push_back({DiagnosticCode::MismatchedDelimiter,
            "expected " + quoted(close_char(frame.kind)) + " to close " +
            quoted(open_char(frame.kind)) + " but found " + quoted(close_char(kind)),
            tok.span, frame.open});
        log::debug("closing %c group opened at %s with mismatched %c",
                   open_char(frame.kind), frame.open.start.to_string().c_str(),
                   close_char(kind));
    }

    Group group{frame.kind, std::move(frame.children)};
    return append(Node{std::move(group), frame.open.merge(tok.span)});
}

void Parser::finish(const Span& eof) {
    finished_ = true;

    for (const auto& frame : stack_) {
        diagnostics_.push_back({DiagnosticCode::UnterminatedGroup,
            "unterminated " + quoted(open_char(frame.kind)) + " group",
            frame.open, std::nullopt});
    }
    if (!stack_.empty()) {
        log::debug("closing %zu unterminated group(s) at end of input", stack_.size());
    }

    while (!stack_.empty()) {
        Frame frame = std::move(stack_.back());
        stack_.pop_back();
        Group group{frame.kind, std::move(frame.children)};
        auto top = append(Node{std::move(group), Span(frame.open.start, eof.end)});
        if (top) pending_ = std::move(top);
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

namespace {

ParseResult drain(Parser& parser) {
    ParseResult result;
    while (auto node = parser.next()) {
        result.nodes.push_back(std::move(*node));
    }
    result.comments = parser.take_comments();
    result.diagnostics = parser.take_diagnostics();
    return result;
}

} // anonymous namespace

Result<ParseResult> parse(std::string_view source, const Config& config) {
    auto opened = Parser::open(source, config);
    SEXPR_TRY(opened);

    ParseResult result = drain(opened.value());
    log::debug("parsed %zu top-level nodes, %zu comments, %zu diagnostics",
               result.nodes.size(), result.comments.size(),
               result.diagnostics.size());
    return Result<ParseResult>::ok(std::move(result));
}

ParseResult parse_tokens(const std::vector<Token>& tokens) {
    Parser parser(tokens);
    return drain(parser);
}

} // namespace sexpr
