#pragma once

#include <sexpr/lang/span.hpp>
#include <optional>
#include <string>

namespace sexpr {

// Recoverable problems found while lexing or grouping. None of them stop
// the pass; each is reported beside the best-effort result.
enum class DiagnosticCode {
    InvalidCharacter,
    MalformedNumber,
    UnterminatedString,
    UnmatchedClose,
    MismatchedDelimiter,
    UnterminatedGroup
};

const char* diagnostic_code_name(DiagnosticCode code);

struct Diagnostic {
    DiagnosticCode code;
    std::string message;
    Span span;
    std::optional<Span> related;  // opening delimiter for MismatchedDelimiter

    // "file:line:col: error[Code]: message"
    std::string format(const std::string& filename = "<input>") const;
};

} // namespace sexpr
