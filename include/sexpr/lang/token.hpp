#pragma once

#include <sexpr/lang/diagnostic.hpp>
#include <sexpr/lang/number.hpp>
#include <sexpr/lang/span.hpp>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace sexpr {

// Bracket flavour of a group. The three kinds behave the same; the kind is
// kept so a tree prints back with the brackets it was written with.
enum class GroupKind {
    Paren,    // ( )
    Brace,    // { }
    Bracket   // [ ]
};

char open_char(GroupKind kind);
char close_char(GroupKind kind);
const char* group_kind_name(GroupKind kind);

// #hex-pairs# literal
struct Bytes {
    std::vector<uint8_t> data;

    std::string to_hex() const;
    bool operator==(const Bytes& o) const { return data == o.data; }
};

// "..." literal; escapes are kept as written
struct StringLit {
    std::string raw;
    bool has_escape = false;
};

enum class TokenType {
    Atom,
    Number,
    String,
    Bytes,
    Comment,
    Open,
    Close,
    Error,
    Eof
};

const char* token_type_name(TokenType type);

struct Token {
    TokenType type = TokenType::Eof;
    std::string text;   // source slice covered by the token
    Span span;
    std::variant<std::monostate, GroupKind, Number, Bytes, StringLit, DiagnosticCode> payload;

    // Payload projections; nullptr when the token is of another type
    const GroupKind* group() const { return std::get_if<GroupKind>(&payload); }
    const Number* number() const { return std::get_if<Number>(&payload); }
    const Bytes* bytes() const { return std::get_if<Bytes>(&payload); }
    const StringLit* string() const { return std::get_if<StringLit>(&payload); }
    const DiagnosticCode* error() const { return std::get_if<DiagnosticCode>(&payload); }

    bool is(TokenType t) const { return type == t; }
};

// Line comment, kept out of the tree. `text` excludes the leading ';'.
struct Comment {
    std::string text;
    Span span;
};

} // namespace sexpr
