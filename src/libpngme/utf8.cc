//
// Created by igor on 15/08/2025.
//

#include "utf8.hh"

namespace pngme::utf8 {

    namespace {
        bool is_continuation(unsigned char c) {
            return (c & 0xC0) == 0x80;
        }
    }

    bool is_valid(const void* data, std::size_t size) noexcept {
        auto p = static_cast<const unsigned char*>(data);
        std::size_t i = 0;
        while (i < size) {
            unsigned char c = p[i];
            if (c < 0x80) {
                i++;
                continue;
            }

            std::size_t len;
            // Bounds for the second byte, they exclude overlongs, surrogates and > U+10FFFF
            unsigned char lo = 0x80;
            unsigned char hi = 0xBF;
            if (c >= 0xC2 && c <= 0xDF) {
                len = 2;
            } else if (c >= 0xE0 && c <= 0xEF) {
                len = 3;
                if (c == 0xE0) {
                    lo = 0xA0;
                } else if (c == 0xED) {
                    hi = 0x9F;
                }
            } else if (c >= 0xF0 && c <= 0xF4) {
                len = 4;
                if (c == 0xF0) {
                    lo = 0x90;
                } else if (c == 0xF4) {
                    hi = 0x8F;
                }
            } else {
                return false;
            }

            if (size - i < len) {
                return false;
            }
            if (p[i + 1] < lo || p[i + 1] > hi) {
                return false;
            }
            for (std::size_t k = 2; k < len; k++) {
                if (!is_continuation(p[i + k])) {
                    return false;
                }
            }
            i += len;
        }
        return true;
    }

} // namespace pngme::utf8
