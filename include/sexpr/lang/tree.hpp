#pragma once

#include <sexpr/lang/diagnostic.hpp>
#include <sexpr/lang/token.hpp>
#include <string>
#include <variant>
#include <vector>

namespace sexpr {

// ---------------------------------------------------------------------------
// Node payloads
// ---------------------------------------------------------------------------

struct Atom {
    std::string text;
};

struct Node;

struct Group {
    GroupKind kind = GroupKind::Paren;
    std::vector<Node> children;
};

// ---------------------------------------------------------------------------
// Expression tree node
// ---------------------------------------------------------------------------

struct Node {
    std::variant<Atom, Number, StringLit, Bytes, Group> value;
    Span span;

    const Atom* atom() const { return std::get_if<Atom>(&value); }
    const Number* number() const { return std::get_if<Number>(&value); }
    const StringLit* string() const { return std::get_if<StringLit>(&value); }
    const Bytes* bytes() const { return std::get_if<Bytes>(&value); }
    const Group* group() const { return std::get_if<Group>(&value); }

    // Children of a group of the given kind, nullptr otherwise
    const std::vector<Node>* group(GroupKind kind) const;
    const std::vector<Node>* paren() const { return group(GroupKind::Paren); }
    const std::vector<Node>* brace() const { return group(GroupKind::Brace); }
    const std::vector<Node>* bracket() const { return group(GroupKind::Bracket); }

    // Atom text, or "" for other kinds
    const std::string& atom_text() const;
};

// Same shape, group kinds, atom/string text, bytes and numeric values.
// Spans and number formatting (base, separators) are ignored.
bool structurally_equal(const Node& a, const Node& b);
bool structurally_equal(const std::vector<Node>& a, const std::vector<Node>& b);

// ---------------------------------------------------------------------------
// Parse result
// ---------------------------------------------------------------------------

struct ParseResult {
    std::vector<Node> nodes;
    std::vector<Comment> comments;
    std::vector<Diagnostic> diagnostics;

    bool ok() const { return diagnostics.empty(); }
};

} // namespace sexpr
