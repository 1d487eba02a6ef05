/*
 * chunkguard C++17 - Chunking Engine Implementation
 */
#include <chunkguard/chunking/chunking_engine.hpp>
#include <chunkguard/core/utils.hpp>

#include <algorithm>
#include <stdexcept>

namespace chunkguard {

// ============================================================================
// Encodings
// ============================================================================

bool parse_encoding(const std::string& name, TextEncoding& out) {
    std::string n = to_lower(trim(name));
    if (n == "utf8" || n == "utf-8") {
        out = TextEncoding::UTF8;
    } else if (n == "ascii") {
        out = TextEncoding::ASCII;
    } else if (n == "latin1" || n == "binary") {
        out = TextEncoding::LATIN1;
    } else if (n == "utf16le" || n == "utf-16le" || n == "ucs2" || n == "ucs-2") {
        out = TextEncoding::UTF16LE;
    } else {
        return false;
    }
    return true;
}

const char* encoding_name(TextEncoding encoding) {
    switch (encoding) {
        case TextEncoding::UTF8: return "utf-8";
        case TextEncoding::ASCII: return "ascii";
        case TextEncoding::LATIN1: return "latin1";
        case TextEncoding::UTF16LE: return "utf-16le";
    }
    return "unknown";
}

namespace {

inline uint16_t utf16_unit(const unsigned char* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

inline bool is_high_surrogate(uint16_t u) { return u >= 0xD800 && u <= 0xDBFF; }
inline bool is_low_surrogate(uint16_t u) { return u >= 0xDC00 && u <= 0xDFFF; }

bool decode_utf16le(const unsigned char* data, size_t len, std::string& out) {
    if (len % 2 != 0) return false;
    out.clear();
    out.reserve(len);
    for (size_t i = 0; i < len; i += 2) {
        uint16_t u = utf16_unit(data + i);
        if (is_high_surrogate(u)) {
            if (i + 4 > len) return false;
            uint16_t lo = utf16_unit(data + i + 2);
            if (!is_low_surrogate(lo)) return false;
            uint32_t cp = 0x10000 + ((static_cast<uint32_t>(u) - 0xD800) << 10) + (lo - 0xDC00);
            append_utf8(out, cp);
            i += 2;
        } else if (is_low_surrogate(u)) {
            return false;
        } else {
            append_utf8(out, u);
        }
    }
    return true;
}

// Largest character boundary in [floor, candidate]. candidate must be
// inside the buffer.
size_t align_down(const unsigned char* data, size_t origin, size_t candidate, size_t floor,
                  TextEncoding encoding) {
    size_t c = candidate;
    if (encoding == TextEncoding::UTF8) {
        int backed = 0;
        while (c > floor && backed < 3 && (data[c] & 0xC0) == 0x80) {
            --c;
            ++backed;
        }
    } else if (encoding == TextEncoding::UTF16LE) {
        c = origin + ((c - origin) & ~static_cast<size_t>(1));
        if (c >= origin + 2 && c > floor && is_high_surrogate(utf16_unit(data + c - 2))) {
            c -= 2;
        }
    }
    return c < floor ? floor : c;
}

// End of the character starting at pos. A malformed lead still moves one
// byte forward so the following decode fails instead of looping.
size_t next_boundary(const unsigned char* data, size_t len, size_t pos, TextEncoding encoding) {
    if (encoding == TextEncoding::UTF8) {
        size_t n = utf8_sequence_length(data, len, pos);
        return pos + (n == 0 ? 1 : n);
    }
    if (encoding == TextEncoding::UTF16LE) {
        if (pos + 2 <= len && is_high_surrogate(utf16_unit(data + pos))) {
            return pos + 4;
        }
        return pos + 2;
    }
    return pos + 1;
}

} // anonymous namespace

bool decode_bytes(const unsigned char* data, size_t len, TextEncoding encoding, std::string& out) {
    switch (encoding) {
        case TextEncoding::UTF8:
            if (!is_valid_utf8(data, len)) return false;
            out.assign(reinterpret_cast<const char*>(data), len);
            return true;
        case TextEncoding::ASCII:
            for (size_t i = 0; i < len; ++i) {
                if (data[i] > 0x7F) return false;
            }
            out.assign(reinterpret_cast<const char*>(data), len);
            return true;
        case TextEncoding::LATIN1:
            out.clear();
            out.reserve(len);
            for (size_t i = 0; i < len; ++i) {
                append_utf8(out, data[i]);
            }
            return true;
        case TextEncoding::UTF16LE:
            return decode_utf16le(data, len, out);
    }
    return false;
}

// ============================================================================
// ChunkingEngine
// ============================================================================

ChunkingEngine::ChunkingEngine(size_t probe_step)
    : probe_step_(probe_step)
{
    if (probe_step_ == 0) {
        throw std::invalid_argument("ChunkingEngine: probe_step must be positive");
    }
}

LineChunk ChunkingEngine::chunk_lines(const std::string& text, SizeMonitor& monitor, size_t start_line,
                                      size_t max_lines) const {
    std::vector<std::string> lines;
    if (!text.empty()) {
        lines = split(text, '\n');
        if (text[text.size() - 1] == '\n') {
            lines.pop_back();
        }
    }

    LineChunk result;
    result.total_lines = lines.size();
    if (start_line > lines.size()) {
        LOG_WARN("[ChunkingEngine] start_line %zu past end (%zu lines)", start_line, lines.size());
        start_line = lines.size();
    }
    result.start_line = start_line;

    size_t current = start_line;
    while (current < lines.size()) {
        if (max_lines > 0 && current - start_line >= max_lines) {
            break;
        }
        Json probe;
        probe["line"] = lines[current] + "\n";
        if (!monitor.can_add(probe)) {
            break;
        }
        monitor.add(probe);
        if (current > start_line) {
            result.text += '\n';
        }
        result.text += lines[current];
        ++current;
    }

    result.next_line = current;
    result.has_more = current < lines.size();

    LOG_DEBUG("[ChunkingEngine] Lines %zu-%zu of %zu (has_more=%d)",
              start_line, current, lines.size(), result.has_more ? 1 : 0);
    return result;
}

ByteChunk ChunkingEngine::chunk_bytes(const std::string& buffer, SizeMonitor& monitor,
                                      size_t start_offset, TextEncoding encoding,
                                      size_t max_read) const {
    const unsigned char* data = reinterpret_cast<const unsigned char*>(buffer.data());
    const size_t len = buffer.size();

    if (start_offset > len) {
        LOG_WARN("[ChunkingEngine] start_offset %zu past end (%zu bytes)", start_offset, len);
        start_offset = len;
    }

    // Half the remaining budget leaves room for the margin and re-encoding
    const size_t available = len - start_offset;
    const double half_budget = monitor.remaining_bytes() / 2.0;
    size_t max_span = half_budget >= static_cast<double>(available)
        ? available
        : static_cast<size_t>(half_budget);
    if (max_read > 0 && max_read < max_span) {
        max_span = max_read;
    }
    const size_t limit = start_offset + max_span;
    const size_t step = std::min(probe_step_, max_span);

    size_t safe = start_offset;
    std::string accepted;
    bool decode_stopped = false;

    if (step > 0) {
        // Each probe either advances or ends the scan
        const size_t max_probes = 2 * (max_span / step) + 2;
        for (size_t probe = 0; probe < max_probes && safe < limit; ++probe) {
            size_t candidate = std::min(safe + step, limit);
            if (candidate < len) {
                size_t aligned = align_down(data, start_offset, candidate, safe, encoding);
                if (aligned <= safe) {
                    aligned = next_boundary(data, len, safe, encoding);
                }
                if (aligned > limit) {
                    LOG_DEBUG("[ChunkingEngine] Character at %zu does not fit remaining span", safe);
                    break;
                }
                candidate = aligned;
            }

            std::string decoded;
            if (!decode_bytes(data + start_offset, candidate - start_offset, encoding, decoded)) {
                LOG_DEBUG("[ChunkingEngine] %s decode failed in [%zu, %zu), keeping %zu",
                          encoding_name(encoding), start_offset, candidate, safe);
                decode_stopped = true;
                break;
            }

            Json probe_value;
            probe_value["content"] = decoded;
            if (!monitor.can_add(probe_value)) {
                break;
            }

            safe = candidate;
            accepted.swap(decoded);
        }
    }

    // Only text that passed can_add is committed; an empty cut adds nothing
    if (safe > start_offset) {
        Json committed;
        committed["content"] = accepted;
        monitor.add(committed);
    }

    ByteChunk result;
    result.text.swap(accepted);
    result.start_offset = start_offset;
    result.next_offset = safe;
    result.bytes_consumed = safe - start_offset;
    result.has_more = safe < len;
    result.decode_stopped = decode_stopped;

    LOG_DEBUG("[ChunkingEngine] Bytes [%zu, %zu) of %zu (has_more=%d)",
              start_offset, safe, len, result.has_more ? 1 : 0);
    return result;
}

} // namespace chunkguard
