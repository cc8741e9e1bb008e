//
// Created by igor on 10/08/2025.
//

#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>

#include <ostream>
#include <iomanip>
#include <algorithm>

namespace pngme {

    chunk_type::chunk_type(std::string_view text)
        : m_bytes{' ', ' ', ' ', ' '} {
        THROW_PARSE_IF(text.size() != 4, error_kind::malformed_tag,
                       "invalid chunk type '", text, "': expected 4 characters, got ", text.size());
        THROW_PARSE_UNLESS(std::all_of(text.begin(), text.end(), is_letter), error_kind::malformed_tag,
                           "invalid chunk type '", text, "': only ASCII letters are allowed");
        std::copy_n(text.begin(), 4, m_bytes.begin());
    }

    std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
        auto flags = os.flags();
        auto fill = os.fill();
        os << '\'';
        for (char c : t) {
            if (c >= 32 && c <= 126) {
                os << c;
            } else {
                os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                   << static_cast<unsigned>(static_cast<unsigned char>(c));
            }
        }
        os << '\'';
        os.flags(flags);
        os.fill(fill);
        return os;
    }

} // namespace pngme
