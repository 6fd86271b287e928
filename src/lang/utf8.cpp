#include <sexpr/lang/utf8.hpp>

namespace sexpr::utf8 {

namespace {

bool is_cont(unsigned char b) {
    return (b & 0xC0) == 0x80;
}

} // anonymous namespace

size_t sequence_width(unsigned char lead) {
    if (lead < 0x80) return 1;
    if (lead < 0xC2) return 0;   // continuation byte or overlong C0/C1
    if (lead < 0xE0) return 2;
    if (lead < 0xF0) return 3;
    if (lead < 0xF5) return 4;
    return 0;
}

Decoded decode(std::string_view data, size_t offset) {
    Decoded d;
    if (offset >= data.size()) return d;

    auto lead = static_cast<unsigned char>(data[offset]);
    size_t width = sequence_width(lead);
    d.width = 1;

    if (width == 0) {
        d.status = DecodeStatus::InvalidLead;
        return d;
    }
    if (width == 1) {
        d.status = DecodeStatus::Ok;
        d.cp = lead;
        return d;
    }
    if (offset + width > data.size()) {
        d.status = DecodeStatus::Truncated;
        return d;
    }

    char32_t cp = lead & (0xFF >> (width + 1));
    for (size_t i = 1; i < width; ++i) {
        auto b = static_cast<unsigned char>(data[offset + i]);
        if (!is_cont(b)) {
            d.status = DecodeStatus::InvalidCont;
            return d;
        }
        cp = (cp << 6) | (b & 0x3F);
    }

    static const char32_t min_for_width[] = {0, 0, 0x80, 0x800, 0x10000};
    if (cp < min_for_width[width] || cp > 0x10FFFF ||
        (cp >= 0xD800 && cp <= 0xDFFF)) {
        d.status = DecodeStatus::InvalidScalar;
        return d;
    }

    d.status = DecodeStatus::Ok;
    d.cp = cp;
    d.width = width;
    return d;
}

} // namespace sexpr::utf8
