#include <sexpr/lang/number.hpp>
#include <cctype>

namespace sexpr {

const char* base_prefix(NumberBase base) {
    switch (base) {
    case NumberBase::Binary:      return "0b";
    case NumberBase::Decimal:     return "";
    case NumberBase::Hexadecimal: return "0x";
    }
    return "";
}

const char* base_name(NumberBase base) {
    switch (base) {
    case NumberBase::Binary:      return "binary";
    case NumberBase::Decimal:     return "decimal";
    case NumberBase::Hexadecimal: return "hexadecimal";
    }
    return "?";
}

namespace {

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_digit_of(char c, NumberBase base) {
    auto uc = static_cast<unsigned char>(c);
    switch (base) {
    case NumberBase::Binary:      return c == '0' || c == '1';
    case NumberBase::Decimal:     return std::isdigit(uc) != 0;
    case NumberBase::Hexadecimal: return std::isxdigit(uc) != 0;
    }
    return false;
}

size_t word_end(std::string_view src, size_t i) {
    while (i < src.size() && is_word_char(src[i])) ++i;
    return i;
}

// Check one digit group and append its digits (separators dropped) to `out`.
// Returns an empty string on success, otherwise the reason.
std::string collect_digits(std::string_view part, NumberBase base,
                           const char* what, std::string& out) {
    if (part.empty()) {
        return std::string("missing digits in ") + what;
    }
    if (part.front() == '_') {
        return std::string("leading '_' in ") + what;
    }
    if (part.back() == '_') {
        return std::string("trailing '_' in ") + what;
    }
    for (char c : part) {
        if (c == '_') continue;
        if (!is_digit_of(c, base)) {
            return std::string("invalid digit '") + c + "' for " +
                   base_name(base) + " literal";
        }
        out += c;
    }
    return {};
}

mpz_class pow10(size_t n) {
    mpz_class r;
    mpz_ui_pow_ui(r.get_mpz_t(), 10, static_cast<unsigned long>(n));
    return r;
}

} // anonymous namespace

Number Number::integer(const mpz_class& v, NumberBase base) {
    Number n;
    n.base = base;
    n.value = v;
    return n;
}

Number Number::decimal(const mpz_class& mantissa, size_t scale) {
    Number n;
    n.value = mantissa;
    n.scale = scale;
    n.is_decimal = true;
    return n;
}

std::string Number::digits() const {
    std::string out;
    size_t skip = std::string(base_prefix(base)).size();
    for (size_t i = skip; i < raw.size(); ++i) {
        if (raw[i] != '_') out += raw[i];
    }
    return out;
}

std::string Number::canonical() const {
    if (!is_decimal) {
        return value.get_str(10);
    }

    std::string mant = value.get_str(10);
    bool negative = !mant.empty() && mant[0] == '-';
    if (negative) mant.erase(0, 1);
    if (mant.size() < scale + 1) {
        mant.insert(0, scale + 1 - mant.size(), '0');
    }

    std::string int_part = mant.substr(0, mant.size() - scale);
    std::string frac_part = mant.substr(mant.size() - scale);
    while (frac_part.size() > 1 && frac_part.back() == '0') {
        frac_part.pop_back();
    }
    if (frac_part.empty()) frac_part = "0";

    return (negative ? "-" : "") + int_part + "." + frac_part;
}

std::string Number::to_string() const {
    if (!raw.empty()) return raw;
    if (is_decimal) return canonical();
    return base_prefix(base) + value.get_str(radix());
}

std::optional<uint64_t> Number::to_u64() const {
    if (is_decimal || sgn(value) < 0) return std::nullopt;
    if (mpz_sizeinbase(value.get_mpz_t(), 2) > 64) return std::nullopt;
    return static_cast<uint64_t>(std::stoull(value.get_str(10)));
}

bool Number::same_value(const Number& other) const {
    if (is_decimal != other.is_decimal) return false;
    if (scale == other.scale) return value == other.value;
    if (scale < other.scale) {
        return value * pow10(other.scale - scale) == other.value;
    }
    return value == other.value * pow10(scale - other.scale);
}

NumberScan scan_number(std::string_view src, size_t offset) {
    NumberScan scan;
    size_t i = offset;
    NumberBase base = NumberBase::Decimal;

    if (i + 1 < src.size() && src[i] == '0' && (src[i + 1] == 'b' || src[i + 1] == 'x')) {
        base = (src[i + 1] == 'b') ? NumberBase::Binary : NumberBase::Hexadecimal;
        i += 2;
    }
    bool prefixed = base != NumberBase::Decimal;

    size_t int_start = i;
    i = word_end(src, i);
    std::string_view int_part = src.substr(int_start, i - int_start);

    // Fraction: unprefixed only, and only when a digit follows the dot
    bool has_fraction = false;
    std::string_view frac_part;
    if (!prefixed && i + 1 < src.size() && src[i] == '.' &&
        std::isdigit(static_cast<unsigned char>(src[i + 1]))) {
        has_fraction = true;
        size_t frac_start = i + 1;
        i = word_end(src, frac_start);
        frac_part = src.substr(frac_start, i - frac_start);
    }

    scan.length = i - offset;

    std::string int_digits;
    std::string frac_digits;
    std::string err = collect_digits(int_part, base,
                                     prefixed ? "prefixed literal" : "integer part",
                                     int_digits);
    if (err.empty() && has_fraction) {
        err = collect_digits(frac_part, NumberBase::Decimal, "fractional part", frac_digits);
    }
    if (!err.empty()) {
        scan.error = std::move(err);
        return scan;
    }

    Number n;
    n.base = base;
    n.is_decimal = has_fraction;
    n.scale = frac_digits.size();
    n.raw = std::string(src.substr(offset, scan.length));
    n.has_underscores = n.raw.find('_') != std::string::npos;
    if (n.value.set_str(int_digits + frac_digits, n.radix()) != 0) {
        scan.error = "cannot convert '" + n.raw + "' to a number";
        return scan;
    }

    scan.number = std::move(n);
    return scan;
}

} // namespace sexpr
