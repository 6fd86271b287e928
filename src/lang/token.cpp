#include <sexpr/lang/token.hpp>

namespace sexpr {

char open_char(GroupKind kind) {
    switch (kind) {
    case GroupKind::Paren:   return '(';
    case GroupKind::Brace:   return '{';
    case GroupKind::Bracket: return '[';
    }
    return '(';
}

char close_char(GroupKind kind) {
    switch (kind) {
    case GroupKind::Paren:   return ')';
    case GroupKind::Brace:   return '}';
    case GroupKind::Bracket: return ']';
    }
    return ')';
}

const char* group_kind_name(GroupKind kind) {
    switch (kind) {
    case GroupKind::Paren:   return "paren";
    case GroupKind::Brace:   return "brace";
    case GroupKind::Bracket: return "bracket";
    }
    return "?";
}

std::string Bytes::to_hex() const {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t b : data) {
        out += digits[b >> 4];
        out += digits[b & 0x0F];
    }
    return out;
}

const char* token_type_name(TokenType type) {
    switch (type) {
    case TokenType::Atom:    return "Atom";
    case TokenType::Number:  return "Number";
    case TokenType::String:  return "String";
    case TokenType::Bytes:   return "Bytes";
    case TokenType::Comment: return "Comment";
    case TokenType::Open:    return "Open";
    case TokenType::Close:   return "Close";
    case TokenType::Error:   return "Error";
    case TokenType::Eof:     return "Eof";
    }
    return "Unknown";
}

} // namespace sexpr
