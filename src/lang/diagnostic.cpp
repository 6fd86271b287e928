#include <sexpr/lang/diagnostic.hpp>

namespace sexpr {

const char* diagnostic_code_name(DiagnosticCode code) {
    switch (code) {
    case DiagnosticCode::InvalidCharacter:    return "InvalidCharacter";
    case DiagnosticCode::MalformedNumber:     return "MalformedNumber";
    case DiagnosticCode::UnterminatedString:  return "UnterminatedString";
    case DiagnosticCode::UnmatchedClose:      return "UnmatchedClose";
    case DiagnosticCode::MismatchedDelimiter: return "MismatchedDelimiter";
    case DiagnosticCode::UnterminatedGroup:   return "UnterminatedGroup";
    }
    return "Unknown";
}

std::string Diagnostic::format(const std::string& filename) const {
    std::string out = filename;
    out += ":";
    out += span.start.to_string();
    out += ": error[";
    out += diagnostic_code_name(code);
    out += "]: ";
    out += message;
    if (related) {
        out += "\n  note: opened at ";
        out += filename;
        out += ":";
        out += related->start.to_string();
    }
    return out;
}

} // namespace sexpr
