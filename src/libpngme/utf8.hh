//
// Created by igor on 15/08/2025.
//

#pragma once

#include <cstddef>

namespace pngme::utf8 {

    // True if the bytes form well-formed UTF-8 (RFC 3629): no overlong
    // encodings, no surrogates, nothing above U+10FFFF, no cut sequences
    bool is_valid(const void* data, std::size_t size) noexcept;

} // namespace pngme::utf8
