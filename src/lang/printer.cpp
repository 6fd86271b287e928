#include <sexpr/lang/printer.hpp>
#include <sexpr/log.hpp>
#include <cstdint>

namespace sexpr {

// ---------------------------------------------------------------------------
// Printer
// ---------------------------------------------------------------------------

Printer::Printer(PrintOptions options)
    : options_(std::move(options)) {}

void Printer::separate() {
    if (prev_ == State::Item) buf_ += options_.separator;
}

void Printer::open(GroupKind kind) {
    separate();
    buf_ += open_char(kind);
    prev_ = State::Fresh;
}

void Printer::close(GroupKind kind) {
    buf_ += close_char(kind);
    prev_ = State::Item;
}

void Printer::text(std::string_view s) {
    separate();
    buf_ += s;
    prev_ = State::Item;
}

void Printer::comment(std::string_view text) {
    separate();
    buf_ += ';';
    buf_ += text;
    buf_ += '\n';
    prev_ = State::Fresh;
}

std::string Printer::take() {
    std::string out;
    out.swap(buf_);
    prev_ = State::Fresh;
    return out;
}

Status check_print_options(const PrintOptions& options) {
    if (options.separator.empty()) {
        return SexprError{SexprError::InvalidArg, "printer separator is empty",
                          "use at least one whitespace character"};
    }
    for (char c : options.separator) {
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            return SexprError{SexprError::InvalidArg,
                "printer separator must be whitespace, got \"" + options.separator + "\"",
                "use spaces, tabs or newlines"};
        }
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Tree rendering
// ---------------------------------------------------------------------------

namespace {

SexprError mismatch(std::string msg, std::string hint) {
    log::warn("cannot print: %s", msg.c_str());
    return SexprError{SexprError::ConfigMismatch, std::move(msg), std::move(hint)};
}

Status check_group(GroupKind kind, const Config& config) {
    if (config.allows(kind)) return ok_status();
    const char* key = (kind == GroupKind::Brace) ? "brace-groups" : "bracket-groups";
    return mismatch(std::string("cannot print a ") + open_char(kind) + close_char(kind) +
                    " group: " + group_kind_name(kind) + " grouping is disabled",
                    std::string("enable ") + key + " in the target config");
}

// An atom printed verbatim must not contain characters the target config
// reserves, or it would lex back as other tokens.
Status check_atom(const std::string& text, const Config& config) {
    if (config.byte_strings && !text.empty() && text.front() == '#') {
        return mismatch("atom '" + text + "' starts with '#', which opens a byte string "
                        "under the target config",
                        "print with the config the atom was parsed with");
    }
    for (char c : text) {
        bool reserved = (config.brace_groups && (c == '{' || c == '}')) ||
                        (config.bracket_groups && (c == '[' || c == ']')) ||
                        (config.line_comments && c == ';');
        if (reserved) {
            return mismatch("atom '" + text + "' contains '" + std::string(1, c) +
                            "', which is reserved under the target config",
                            "print with the config the atom was parsed with");
        }
    }
    return ok_status();
}

Result<std::string> number_text(const Number& n, const PrintOptions& options) {
    if (sgn(n.value) < 0) {
        return SexprError{SexprError::InvalidArg,
            "negative number " + n.canonical() + " has no literal form"};
    }
    return Result<std::string>::ok(options.preserve_number_format ? n.to_string()
                                                                  : n.canonical());
}

struct Emitter {
    Printer& out;
    const Config& config;
    const PrintOptions& options;
    const std::vector<Comment>* comments = nullptr;
    size_t next_comment = 0;

    Status comments_before(size_t offset) {
        if (!comments) return ok_status();
        while (next_comment < comments->size() &&
               (*comments)[next_comment].span.start.offset < offset) {
            if (!config.line_comments) {
                return mismatch("cannot print comments: line comments are disabled",
                                "enable line-comments in the target config");
            }
            out.comment((*comments)[next_comment].text);
            ++next_comment;
        }
        return ok_status();
    }

    Status emit(const Node& node) {
        SEXPR_TRY(comments_before(node.span.start.offset));
        return std::visit([&](const auto& v) { return emit_value(v, node); }, node.value);
    }

    Status emit_value(const Atom& a, const Node&) {
        SEXPR_TRY(check_atom(a.text, config));
        out.text(a.text);
        return ok_status();
    }

    Status emit_value(const Number& n, const Node&) {
        auto text = number_text(n, options);
        SEXPR_TRY(text);
        out.text(text.value());
        return ok_status();
    }

    Status emit_value(const StringLit& s, const Node&) {
        out.text("\"" + s.raw + "\"");
        return ok_status();
    }

    Status emit_value(const Bytes& b, const Node&) {
        if (!config.byte_strings) {
            return mismatch("cannot print a byte string: byte strings are disabled",
                            "enable byte-strings in the target config");
        }
        out.text("#" + b.to_hex() + "#");
        return ok_status();
    }

    Status emit_value(const Group& g, const Node& node) {
        SEXPR_TRY(check_group(g.kind, config));
        out.open(g.kind);
        for (const auto& child : g.children) {
            SEXPR_TRY(emit(child));
        }
        SEXPR_TRY(comments_before(node.span.end.offset));
        out.close(g.kind);
        return ok_status();
    }

    Status emit_all(const std::vector<Node>& nodes) {
        for (const auto& node : nodes) {
            SEXPR_TRY(emit(node));
        }
        return comments_before(SIZE_MAX);
    }
};

} // anonymous namespace

Result<std::string> print(const std::vector<Node>& nodes, const Config& config,
                          const PrintOptions& options) {
    SEXPR_TRY(check_print_options(options));
    Printer printer(options);
    Emitter emitter{printer, config, options};
    SEXPR_TRY(emitter.emit_all(nodes));
    return Result<std::string>::ok(printer.take());
}

Result<std::string> print(const Node& node, const Config& config,
                          const PrintOptions& options) {
    SEXPR_TRY(check_print_options(options));
    Printer printer(options);
    Emitter emitter{printer, config, options};
    SEXPR_TRY(emitter.emit(node));
    return Result<std::string>::ok(printer.take());
}

Result<std::string> print(const ParseResult& result, const Config& config,
                          const PrintOptions& options) {
    SEXPR_TRY(check_print_options(options));
    Printer printer(options);
    Emitter emitter{printer, config, options, &result.comments};
    SEXPR_TRY(emitter.emit_all(result.nodes));
    return Result<std::string>::ok(printer.take());
}

// ---------------------------------------------------------------------------
// Token rendering
// ---------------------------------------------------------------------------

Result<std::string> print_tokens(const std::vector<Token>& tokens, const Config& config,
                                 const PrintOptions& options) {
    SEXPR_TRY(check_print_options(options));
    Printer printer(options);

    for (const auto& tok : tokens) {
        switch (tok.type) {
        case TokenType::Eof:
            return Result<std::string>::ok(printer.take());
        case TokenType::Open:
            SEXPR_TRY(check_group(*tok.group(), config));
            printer.open(*tok.group());
            break;
        case TokenType::Close:
            SEXPR_TRY(check_group(*tok.group(), config));
            printer.close(*tok.group());
            break;
        case TokenType::Atom:
            SEXPR_TRY(check_atom(tok.text, config));
            printer.text(tok.text);
            break;
        case TokenType::Number: {
            auto text = number_text(*tok.number(), options);
            SEXPR_TRY(text);
            printer.text(text.value());
            break;
        }
        case TokenType::String:
            printer.text("\"" + tok.string()->raw + "\"");
            break;
        case TokenType::Bytes:
            if (!config.byte_strings) {
                return mismatch("cannot print a byte string: byte strings are disabled",
                                "enable byte-strings in the target config");
            }
            printer.text("#" + tok.bytes()->to_hex() + "#");
            break;
        case TokenType::Comment:
            if (!config.line_comments) {
                return mismatch("cannot print comments: line comments are disabled",
                                "enable line-comments in the target config");
            }
            printer.comment(tok.text.substr(1));
            break;
        case TokenType::Error:
            // malformed source is passed through as written
            printer.text(tok.text);
            break;
        }
    }
    return Result<std::string>::ok(printer.take());
}

} // namespace sexpr
