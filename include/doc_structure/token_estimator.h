#pragma once

#include <cstddef>
#include <string>

namespace doc_structure {

// Length of UTF-8 text in UTF-16 code units: one per code point, two for
// code points outside the Basic Multilingual Plane (4-byte sequences).
inline size_t utf16_length(const std::string& text) {
    size_t units = 0;
    for (char c : text) {
        unsigned char byte = static_cast<unsigned char>(c);
        if ((byte & 0xC0) == 0x80) {
            continue;   // continuation byte
        }
        units += (byte >= 0xF0) ? 2 : 1;
    }
    return units;
}

// ~4 characters per token, rounded up.
inline int estimate_tokens(const std::string& text) {
    return static_cast<int>((utf16_length(text) + 3) / 4);
}

} // namespace doc_structure
