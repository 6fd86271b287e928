#pragma once

#include <gmpxx.h>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sexpr {

enum class NumberBase {
    Binary = 2,
    Decimal = 10,
    Hexadecimal = 16
};

// "0b", "", "0x"
const char* base_prefix(NumberBase base);
const char* base_name(NumberBase base);

// Integral or decimal literal of unbounded size. The literal's value is
// `value / 10^scale`; integers always have scale 0. `raw` is the exact
// source text (prefix and separators included) and is empty for numbers
// built in code.
struct Number {
    NumberBase base = NumberBase::Decimal;
    mpz_class value;
    size_t scale = 0;
    bool is_decimal = false;
    bool has_underscores = false;
    std::string raw;

    static Number integer(const mpz_class& v, NumberBase base = NumberBase::Decimal);
    static Number decimal(const mpz_class& mantissa, size_t scale);

    int radix() const { return static_cast<int>(base); }

    // Source digits without prefix and separators ("" for built numbers)
    std::string digits() const;

    // Minimal base-10 form: no prefix, no separators, no superfluous zeros
    std::string canonical() const;

    // `raw` when available, otherwise the value rendered in `base`
    std::string to_string() const;

    std::optional<uint64_t> to_u64() const;

    // Same kind (integral/decimal) and same numeric value; base and layout
    // are ignored.
    bool same_value(const Number& other) const;
};

struct NumberScan {
    size_t length = 0;              // bytes covered by the literal
    std::optional<Number> number;   // empty when malformed
    std::string error;              // reason when malformed
};

// Scan the literal starting at `offset`. The literal covers the maximal run
// of ASCII alphanumerics and '_' (plus one ".digits" tail for unprefixed
// numbers); any part of that run that is not a valid digit for the base,
// or a leading/trailing separator, makes the whole run malformed.
NumberScan scan_number(std::string_view src, size_t offset);

} // namespace sexpr
