//
// Created by igor on 16/08/2025.
//

#include <pngme/png.hh>
#include <pngme/exceptions.hh>

#include <algorithm>
#include <cstring>
#include <iterator>
#include <utility>
#include <istream>
#include <ostream>

namespace pngme {

    png::png(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {
    }

    png png::parse(const void* data, std::size_t size, const codec_options& options) {
        auto p = static_cast<const std::byte*>(data);

        THROW_PARSE_IF(size < signature.size() || std::memcmp(p, signature.data(), signature.size()) != 0,
                       error_kind::invalid_signature, "Not a PNG file: signature mismatch");

        std::uint64_t offset = signature.size();

        // Chunk warnings carry offsets relative to the chunk, rebase them on the file
        codec_options chunk_options = options;
        if (options.on_warning) {
            chunk_options.on_warning = [&options, &offset](std::uint64_t rel, std::string_view category,
                                                           std::string_view message) {
                options.on_warning(offset + rel, category, message);
            };
        }

        png result;
        bool seen_end = false;
        while (offset < size) {
            try {
                result.m_chunks.push_back(chunk::parse(p + offset, size - offset, chunk_options));
            } catch (const parse_error& e) {
                THROW_PARSE(e.kind(), "At offset ", offset, ": ", e.what());
            }

            const chunk& last = result.m_chunks.back();
            offset += last.serialized_size();

            if (last.type() == chunk_id::IEND) {
                seen_end = true;
                break;
            }
        }

        if (seen_end && offset < size && options.on_warning) {
            options.on_warning(offset, "trailing_data",
                std::to_string(size - offset) + " bytes after IEND ignored");
        }
        if (!seen_end && options.on_warning) {
            options.on_warning(offset, "missing_iend", "PNG file ends without an IEND chunk");
        }

        return result;
    }

    png png::parse(const std::vector<std::byte>& bytes, const codec_options& options) {
        return parse(bytes.data(), bytes.size(), options);
    }

    png png::load(std::istream& is, const codec_options& options) {
        THROW_IO_IF(!is, "Stream in bad state");

        std::vector<char> buffer{std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>()};
        THROW_IO_IF(is.bad(), "Stream read failed");

        return parse(buffer.data(), buffer.size(), options);
    }

    void png::save(std::ostream& os) const {
        auto bytes = as_bytes();
        os.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        os.flush();
        THROW_IO_IF(!os, "Stream write failed after ", bytes.size(), " bytes");
    }

    void png::append_chunk(chunk c) {
        THROW_PARSE_UNLESS(c.type().is_valid(), error_kind::invalid_tag_bits,
                           "Chunk type ", c.type(), " is not valid, refusing to append it");
        auto it = std::find_if(m_chunks.rbegin(), m_chunks.rend(), [](const chunk& x) {
            return x.type() == chunk_id::IEND;
        });
        if (it == m_chunks.rend()) {
            m_chunks.push_back(std::move(c));
        } else {
            m_chunks.insert(std::prev(it.base()), std::move(c));
        }
    }

    chunk png::remove_first_chunk(std::string_view type) {
        chunk_type wanted(type);
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [&wanted](const chunk& x) {
            return x.type() == wanted;
        });
        if (it == m_chunks.end()) {
            throw pngme_error(error_kind::chunk_not_found,
                              build_error_msg("No chunk of type ", wanted, " in file"));
        }
        chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

    const chunk* png::chunk_by_type(std::string_view type) const {
        chunk_type wanted(type);
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [&wanted](const chunk& x) {
            return x.type() == wanted;
        });
        return it == m_chunks.end() ? nullptr : &*it;
    }

    std::vector<std::byte> png::as_bytes() const {
        std::size_t total = signature.size();
        for (const auto& c : m_chunks) {
            total += c.serialized_size();
        }

        std::vector<std::byte> out;
        out.reserve(total);
        auto sig = reinterpret_cast<const std::byte*>(signature.data());
        out.insert(out.end(), sig, sig + signature.size());
        for (const auto& c : m_chunks) {
            auto bytes = c.as_bytes();
            out.insert(out.end(), bytes.begin(), bytes.end());
        }
        return out;
    }

    std::ostream& operator<<(std::ostream& os, const png& p) {
        os << "PNG file with " << p.chunks().size() << " chunk(s)\n";
        std::size_t index = 0;
        for (const auto& c : p.chunks()) {
            os << "  [" << index++ << "] " << c << "\n";
        }
        return os;
    }

} // namespace pngme
