//
// Created by igor on 15/08/2025.
//

#include <pngme/chunk.hh>
#include <pngme/checksum.hh>
#include <pngme/endian.hh>

#include <ostream>
#include <iomanip>
#include <cstring>

#include "utf8.hh"

namespace pngme {

    chunk::chunk(chunk_type type, std::vector<std::byte> data)
        : m_type(type), m_data(std::move(data)) {
    }

    chunk chunk::from_text(chunk_type type, std::string_view text) {
        auto first = reinterpret_cast<const std::byte*>(text.data());
        return {type, std::vector<std::byte>(first, first + text.size())};
    }

    chunk chunk::parse(const void* data, std::size_t size, const codec_options& options) {
        auto p = static_cast<const std::byte*>(data);

        THROW_PARSE_IF(size < overhead, error_kind::too_short,
                       "Chunk needs at least ", overhead, " bytes, only ", size, " available");

        // Type code: 4 ASCII letters with the reserved bit clear
        auto type = chunk_type::from_bytes(p + 4);
        THROW_PARSE_UNLESS(type.is_alphabetic(), error_kind::malformed_tag,
                           "invalid chunk type ", type, ": only ASCII letters are allowed");
        if (!type.is_reserved_bit_valid()) {
            if (options.strict) {
                THROW_PARSE(error_kind::invalid_tag_bits,
                            "invalid chunk type ", type, ": reserved bit not set");
            } else if (options.on_warning) {
                options.on_warning(4, "reserved_bit",
                    "Chunk type '" + type.to_string() + "' reserved bit not set, accepting it");
            }
        }

        // Declared length must fit in the buffer (64-bit sum, cannot wrap)
        std::uint64_t length = load_be32(p);
        THROW_PARSE_IF(overhead + length > size, error_kind::truncated_payload,
                       "Chunk ", type, " declares ", length, " payload bytes but only ",
                       size - overhead, " are available");
        THROW_PARSE_IF(length > options.max_chunk_size, error_kind::payload_too_large,
                       "Chunk ", type, " has size ", length,
                       " bytes, which exceeds maximum allowed size of ", options.max_chunk_size, " bytes");

        auto payload = p + 8;
        std::uint32_t stored = load_be32(payload + length);
        std::uint32_t computed = chunk_crc32(type, payload, static_cast<std::size_t>(length));
        THROW_PARSE_IF(stored != computed, error_kind::checksum_mismatch,
                       "Chunk ", type, " checksum mismatch: stored 0x", std::hex, std::setfill('0'),
                       std::setw(8), stored, ", computed 0x", std::setw(8), computed);

        return {type, std::vector<std::byte>(payload, payload + length)};
    }

    chunk chunk::parse(const std::vector<std::byte>& bytes, const codec_options& options) {
        return parse(bytes.data(), bytes.size(), options);
    }

    std::optional<chunk> chunk::try_parse(const void* data, std::size_t size,
                                          error_kind* kind, const codec_options& options) {
        try {
            return parse(data, size, options);
        } catch (const parse_error& e) {
            if (kind) {
                *kind = e.kind();
            }
            return std::nullopt;
        }
    }

    std::uint32_t chunk::length() const {
        THROW_PARSE_IF(m_data.size() > max_length, error_kind::payload_too_large,
                       "Chunk ", m_type, " payload of ", m_data.size(),
                       " bytes does not fit the 32-bit length field");
        return static_cast<std::uint32_t>(m_data.size());
    }

    std::uint32_t chunk::crc() const {
        return chunk_crc32(m_type, m_data);
    }

    std::string chunk::data_as_string() const {
        THROW_PARSE_UNLESS(m_type.is_valid(), error_kind::invalid_chunk_data,
                           "Chunk type ", m_type, " is not valid, refusing to read payload as text");
        THROW_PARSE_UNLESS(utf8::is_valid(m_data.data(), m_data.size()), error_kind::invalid_chunk_data,
                           "Chunk ", m_type, " payload is not valid UTF-8 text");
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    std::vector<std::byte> chunk::as_bytes() const {
        std::uint32_t len = length();
        std::vector<std::byte> out(serialized_size());
        store_be32(out.data(), len);
        m_type.to_bytes(out.data() + 4);
        if (!m_data.empty()) {
            std::memcpy(out.data() + 8, m_data.data(), m_data.size());
        }
        store_be32(out.data() + 8 + m_data.size(), crc());
        return out;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        auto flags = os.flags();
        auto fill = os.fill();
        os << "Chunk " << c.type() << " (" << std::dec << c.data().size() << " bytes, crc 0x"
           << std::hex << std::setfill('0') << std::setw(8) << c.crc() << ")";
        os.flags(flags);
        os.fill(fill);
        return os;
    }

} // namespace pngme
