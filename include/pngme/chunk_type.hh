//
// Created by igor on 10/08/2025.
//
#pragma once
#include <array>
#include <cstring>
#include <cstdint>
#include <string>
#include <string_view>
#include <iosfwd>
#include <pngme/export_pngme.h>

namespace pngme {

    /**
     * @class chunk_type
     * @brief Four byte PNG chunk type code
     *
     * The case of each letter carries one property bit (bit 5 of the byte):
     * byte 0 ancillary, byte 1 private, byte 2 reserved, byte 3 safe-to-copy.
     * A value built from raw bytes is not checked; use is_valid() before
     * trusting it.
     */
    class PNGME_EXPORT chunk_type {
    public:
        // Constructor from 4 individual chars (no validation)
        constexpr chunk_type(char c0, char c1, char c2, char c3)
            : m_bytes{ c0, c1, c2, c3 } {}

        // Constructor from raw byte array (no validation)
        constexpr explicit chunk_type(const std::array<char, 4>& bytes)
            : m_bytes(bytes) {}

        // Constructor from text, throws parse_error(malformed_tag) unless
        // the text is exactly 4 ASCII letters
        explicit chunk_type(std::string_view text);

        // Constructor from raw bytes (no validation)
        static chunk_type from_bytes(const void* data) {
            std::array<char, 4> bytes;
            std::memcpy(bytes.data(), data, 4);
            return chunk_type(bytes);
        }

        [[nodiscard]] constexpr const std::array<char, 4>& bytes() const { return m_bytes; }

        // Write to bytes
        void to_bytes(void* dest) const {
            std::memcpy(dest, m_bytes.data(), 4);
        }

        [[nodiscard]] std::string to_string() const {
            return {m_bytes.data(), 4};
        }

        [[nodiscard]] std::string_view to_string_view() const {
            return {m_bytes.data(), 4};
        }

        constexpr char operator[](std::size_t i) const { return m_bytes[i]; }

        [[nodiscard]] constexpr auto begin() const { return m_bytes.begin(); }
        [[nodiscard]] constexpr auto end() const { return m_bytes.end(); }

        // Ancillary bit clear: decoders must understand this chunk
        [[nodiscard]] constexpr bool is_critical() const { return is_upper(m_bytes[0]); }

        // Private bit clear: registered in the PNG specification
        [[nodiscard]] constexpr bool is_public() const { return is_upper(m_bytes[1]); }

        // Reserved bit must be clear in every conforming chunk type
        [[nodiscard]] constexpr bool is_reserved_bit_valid() const { return is_upper(m_bytes[2]); }

        // Editors unaware of the chunk may copy it into modified files
        [[nodiscard]] constexpr bool is_safe_to_copy() const { return is_lower(m_bytes[3]); }

        // All four bytes are ASCII letters
        [[nodiscard]] constexpr bool is_alphabetic() const {
            return is_letter(m_bytes[0]) && is_letter(m_bytes[1]) &&
                   is_letter(m_bytes[2]) && is_letter(m_bytes[3]);
        }

        [[nodiscard]] constexpr bool is_valid() const {
            return is_alphabetic() && is_reserved_bit_valid();
        }

        // Comparison operators
        bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_bytes < o.m_bytes; }

        static constexpr bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }
        static constexpr bool is_lower(char c) { return c >= 'a' && c <= 'z'; }
        static constexpr bool is_letter(char c) { return is_upper(c) || is_lower(c); }

    private:
        std::array<char, 4> m_bytes;
    };

    // Stream output as quoted string with non-printable bytes escaped
    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const chunk_type& t);

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v;
            std::memcpy(&v, t.bytes().data(), 4);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // Chunk types defined by the PNG specification that the container relies on
    namespace chunk_id {
        inline constexpr chunk_type IHDR('I', 'H', 'D', 'R');
        inline constexpr chunk_type PLTE('P', 'L', 'T', 'E');
        inline constexpr chunk_type IDAT('I', 'D', 'A', 'T');
        inline constexpr chunk_type IEND('I', 'E', 'N', 'D');
    }

}
// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngme::chunk_type> {
        std::size_t operator()(const pngme::chunk_type& t) const noexcept {
            return pngme::chunk_type_hash{}(t);
        }
    };
}
