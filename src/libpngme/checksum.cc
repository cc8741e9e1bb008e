//
// Created by igor on 15/08/2025.
//

#include <pngme/checksum.hh>

#include <algorithm>
#include <limits>
#include <zlib.h>

namespace pngme {

    std::uint32_t update_crc32(std::uint32_t crc, const void* data, std::size_t size) {
        auto p = static_cast<const Bytef*>(data);
        uLong c = crc;
        // zlib takes a 32-bit length, feed larger buffers in slices
        constexpr std::size_t max_block = std::numeric_limits<uInt>::max();
        while (size > 0) {
            auto block = static_cast<uInt>(std::min(size, max_block));
            c = ::crc32(c, p, block);
            p += block;
            size -= block;
        }
        return static_cast<std::uint32_t>(c);
    }

    std::uint32_t chunk_crc32(const chunk_type& type, const void* data, std::size_t size) {
        std::uint32_t crc = update_crc32(0, type.bytes().data(), 4);
        return update_crc32(crc, data, size);
    }

} // namespace pngme
