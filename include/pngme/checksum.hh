/**
 * @file checksum.hh
 * @brief CRC32 as used by PNG, zlib and gzip
 * @author Igor
 * @date 15/08/2025
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>
#include <pngme/export_pngme.h>
#include <pngme/chunk_type.hh>

namespace pngme {

    /**
     * @brief Continue a CRC32 over another block of bytes
     * @param crc CRC of the bytes seen so far (0 to start)
     * @param data Bytes to add
     * @param size Number of bytes
     * @return Updated CRC, final XOR already applied
     *
     * update_crc32(update_crc32(0, a), b) equals the CRC of a followed by b.
     */
    PNGME_EXPORT std::uint32_t update_crc32(std::uint32_t crc, const void* data, std::size_t size);

    /**
     * @brief CRC32 of a single block of bytes
     */
    inline std::uint32_t crc32(const void* data, std::size_t size) {
        return update_crc32(0, data, size);
    }

    /**
     * @brief CRC32 stored in a chunk trailer: covers type code then payload
     */
    PNGME_EXPORT std::uint32_t chunk_crc32(const chunk_type& type, const void* data, std::size_t size);

    inline std::uint32_t chunk_crc32(const chunk_type& type, const std::vector<std::byte>& data) {
        return chunk_crc32(type, data.data(), data.size());
    }

} // namespace pngme
