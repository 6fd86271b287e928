#pragma once

#include <sexpr/lang/token.hpp>
#include <sexpr/result.hpp>
#include <string>

namespace sexpr {

// Optional syntax features. Plain ( ) grouping is always on. A Config is
// built once and handed by const reference to the lexer, parser and printer.
struct Config {
    bool line_comments = false;
    bool byte_strings = false;
    bool brace_groups = false;
    bool bracket_groups = false;

    // Every optional feature enabled
    static Config all();

    Config with_line_comments(bool on = true) const;
    Config with_byte_strings(bool on = true) const;
    Config with_brace_groups(bool on = true) const;
    Config with_bracket_groups(bool on = true) const;

    bool allows(GroupKind kind) const;

    bool operator==(const Config& o) const;
    bool operator!=(const Config& o) const { return !(*this == o); }
};

struct PrintOptions {
    std::string separator = " ";
    bool preserve_number_format = true;  // false: canonical number text
};

// Syntax + printer settings as read from a TOML file:
//
//   [syntax]
//   line-comments = true
//   byte-strings = true
//   brace-groups = true
//   bracket-groups = true
//
//   [printer]
//   separator = " "
//   preserve-number-format = true
struct Settings {
    Config syntax;
    PrintOptions printer;

    // Parse from TOML text; `filename` only decorates errors
    static Result<Settings> parse(const std::string& toml_str,
                                  const std::string& filename = "");

    static Result<Settings> load(const std::string& path);
};

} // namespace sexpr
