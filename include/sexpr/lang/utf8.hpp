#pragma once

#include <cstddef>
#include <string_view>

namespace sexpr::utf8 {

enum class DecodeStatus {
    Ok,
    End,            // offset is at end of input
    InvalidLead,    // byte cannot start a sequence
    Truncated,      // sequence runs past end of input
    InvalidCont,    // continuation byte missing
    InvalidScalar   // overlong, surrogate or above U+10FFFF
};

struct Decoded {
    DecodeStatus status = DecodeStatus::End;
    char32_t cp = 0;
    size_t width = 0;   // bytes consumed; 1 for any invalid sequence

    bool ok() const { return status == DecodeStatus::Ok; }
};

// Decode the scalar value starting at `offset`. Invalid input never consumes
// more than one byte so callers can resynchronise.
Decoded decode(std::string_view data, size_t offset);

// Width implied by a lead byte, 0 if it cannot start a sequence.
size_t sequence_width(unsigned char lead);

} // namespace sexpr::utf8
