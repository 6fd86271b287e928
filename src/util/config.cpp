#include <sexpr/config.hpp>
#include <sexpr/log.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>

namespace sexpr {

Config Config::all() {
    Config c;
    c.line_comments = true;
    c.byte_strings = true;
    c.brace_groups = true;
    c.bracket_groups = true;
    return c;
}

Config Config::with_line_comments(bool on) const {
    Config c = *this;
    c.line_comments = on;
    return c;
}

Config Config::with_byte_strings(bool on) const {
    Config c = *this;
    c.byte_strings = on;
    return c;
}

Config Config::with_brace_groups(bool on) const {
    Config c = *this;
    c.brace_groups = on;
    return c;
}

Config Config::with_bracket_groups(bool on) const {
    Config c = *this;
    c.bracket_groups = on;
    return c;
}

bool Config::allows(GroupKind kind) const {
    switch (kind) {
    case GroupKind::Paren:   return true;
    case GroupKind::Brace:   return brace_groups;
    case GroupKind::Bracket: return bracket_groups;
    }
    return false;
}

bool Config::operator==(const Config& o) const {
    return line_comments == o.line_comments &&
           byte_strings == o.byte_strings &&
           brace_groups == o.brace_groups &&
           bracket_groups == o.bracket_groups;
}

namespace {

int line_of(const toml::node& node) {
    return static_cast<int>(node.source().begin.line);
}

SexprError config_error(const std::string& msg, const std::string& hint,
                        const std::string& filename, const toml::node& node) {
    return SexprError{SexprError::Config, msg, hint, filename, line_of(node)};
}

Result<bool> read_bool(const std::string& section, const std::string& key,
                       const toml::node& val, const std::string& filename) {
    if (auto b = val.as_boolean()) {
        return Result<bool>::ok(b->get());
    }
    return config_error("[" + section + "] " + key + " must be a boolean",
                        "use true or false", filename, val);
}

Status read_syntax(const toml::table& tbl, Config& cfg, const std::string& filename) {
    for (const auto& [key, val] : tbl) {
        std::string k(key.str());
        bool* target = nullptr;
        if (k == "line-comments")       target = &cfg.line_comments;
        else if (k == "byte-strings")   target = &cfg.byte_strings;
        else if (k == "brace-groups")   target = &cfg.brace_groups;
        else if (k == "bracket-groups") target = &cfg.bracket_groups;
        else {
            return config_error("unknown key '" + k + "' in [syntax]",
                "valid keys: line-comments, byte-strings, brace-groups, bracket-groups",
                filename, val);
        }

        auto b = read_bool("syntax", k, val, filename);
        SEXPR_TRY(b);
        *target = b.value();
    }
    return ok_status();
}

Status read_printer(const toml::table& tbl, PrintOptions& opts, const std::string& filename) {
    for (const auto& [key, val] : tbl) {
        std::string k(key.str());
        if (k == "separator") {
            auto s = val.as_string();
            if (!s) {
                return config_error("[printer] separator must be a string",
                                    "e.g. separator = \" \"", filename, val);
            }
            opts.separator = s->get();
        } else if (k == "preserve-number-format") {
            auto b = read_bool("printer", k, val, filename);
            SEXPR_TRY(b);
            opts.preserve_number_format = b.value();
        } else {
            return config_error("unknown key '" + k + "' in [printer]",
                                "valid keys: separator, preserve-number-format",
                                filename, val);
        }
    }
    return ok_status();
}

} // anonymous namespace

Result<Settings> Settings::parse(const std::string& toml_str, const std::string& filename) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, filename);
    } catch (const toml::parse_error& e) {
        return SexprError{SexprError::Config,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", filename, static_cast<int>(e.source().begin.line)};
    }

    Settings settings;

    for (const auto& [key, val] : doc) {
        std::string section(key.str());
        auto tbl = val.as_table();
        if (!tbl || (section != "syntax" && section != "printer")) {
            return config_error("unexpected top-level entry '" + section + "'",
                                "expected [syntax] and/or [printer] tables",
                                filename, val);
        }
        if (section == "syntax") {
            SEXPR_TRY(read_syntax(*tbl, settings.syntax, filename));
        } else {
            SEXPR_TRY(read_printer(*tbl, settings.printer, filename));
        }
    }

    return Result<Settings>::ok(std::move(settings));
}

Result<Settings> Settings::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return SexprError{SexprError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto r = Settings::parse(ss.str(), path);
    if (r.is_ok()) {
        log::debug("loaded settings from %s", path.c_str());
    }
    return r;
}

} // namespace sexpr
