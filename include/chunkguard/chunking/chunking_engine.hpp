/*
 * chunkguard C++17 - Chunking Engine
 *
 * Finds where to cut oversized output so each chunk fits a SizeMonitor
 * budget. Three algorithms, all stateless per call:
 *   chunk_sequence - whole items, never split
 *   chunk_lines    - whole lines of text
 *   chunk_bytes    - byte ranges that always decode cleanly
 *
 * A unit larger than the whole remaining budget yields an empty chunk with
 * has_more set and the cursor unchanged. Callers must detect that
 * non-progress themselves before resuming.
 */
#ifndef chunkguard_CHUNKING_CHUNKING_ENGINE_HPP
#define chunkguard_CHUNKING_CHUNKING_ENGINE_HPP

#include <chunkguard/chunking/size_monitor.hpp>
#include <chunkguard/core/json.hpp>
#include <chunkguard/core/logger.hpp>
#include <string>
#include <vector>
#include <cstddef>

namespace chunkguard {

// ============================================================================
// Text encodings for byte chunking
// ============================================================================

enum class TextEncoding {
    UTF8,
    ASCII,
    LATIN1,
    UTF16LE
};

// Accepts utf8/utf-8, ascii, latin1/binary, utf16le/utf-16le/ucs2 (any case)
bool parse_encoding(const std::string& name, TextEncoding& out);
const char* encoding_name(TextEncoding encoding);

// Decode [data, data+len) into UTF-8. Returns false on malformed input or
// an incomplete trailing sequence; out is unspecified then.
bool decode_bytes(const unsigned char* data, size_t len, TextEncoding encoding, std::string& out);

// ============================================================================
// Chunk results
// ============================================================================

template<typename T>
struct SequenceChunk {
    std::vector<T> items;      // Accepted items, in order
    bool has_more;
    std::vector<T> remainder;  // items ++ remainder == input

    SequenceChunk() : has_more(false) {}
};

struct LineChunk {
    std::string text;          // Accepted lines joined with '\n'
    bool has_more;
    size_t start_line;
    size_t next_line;          // First line not delivered
    size_t total_lines;

    LineChunk() : has_more(false), start_line(0), next_line(0), total_lines(0) {}

    size_t lines_read() const { return next_line - start_line; }
};

struct ByteChunk {
    std::string text;          // Decoded content, always UTF-8
    bool has_more;
    size_t start_offset;
    size_t next_offset;        // Safe offset to resume from
    size_t bytes_consumed;     // next_offset - start_offset
    bool decode_stopped;       // Scan ended on bytes that do not decode

    ByteChunk()
        : has_more(false)
        , start_offset(0)
        , next_offset(0)
        , bytes_consumed(0)
        , decode_stopped(false) {}
};

// ============================================================================
// Chunking Engine
// ============================================================================

class ChunkingEngine {
public:
    static constexpr size_t DEFAULT_PROBE_STEP = 4096;

    // Throws std::invalid_argument when probe_step is 0
    explicit ChunkingEngine(size_t probe_step = DEFAULT_PROBE_STEP);

    // Greedy walk: each item is measured as size_fn(item) (a Json value),
    // accepted while it fits, and the walk stops at the first misfit.
    template<typename T, typename SizeFn>
    SequenceChunk<T> chunk_sequence(const std::vector<T>& items, SizeMonitor& monitor,
                                    SizeFn size_fn) const {
        SequenceChunk<T> result;
        size_t i = 0;
        while (i < items.size()) {
            Json estimated = size_fn(items[i]);
            if (!monitor.can_add(estimated)) {
                break;
            }
            monitor.add(estimated);
            result.items.push_back(items[i]);
            ++i;
        }
        result.has_more = i < items.size();
        result.remainder.assign(items.begin() + static_cast<std::ptrdiff_t>(i), items.end());

        if (result.has_more) {
            LOG_DEBUG("[ChunkingEngine] Sequence cut after %zu of %zu items", i, items.size());
        }
        return result;
    }

    // Lines are split at '\n'; a single trailing newline ends the last line
    // rather than opening an empty one. Each line is measured with its
    // newline re-appended. max_lines caps the chunk (0 for no cap).
    LineChunk chunk_lines(const std::string& text, SizeMonitor& monitor, size_t start_line = 0,
                          size_t max_lines = 0) const;

    // Probes forward from start_offset in probe_step increments, bounded by
    // half the remaining budget, and stops at the last end offset that both
    // decoded and fit. Probe ends are first moved back to a character
    // boundary, so only malformed bytes (or a truncated final character)
    // stop the scan early; decode_stopped tells that apart from running out
    // of budget. max_read caps the bytes consumed (0 for no cap). Accepted
    // text is committed to the monitor once.
    ByteChunk chunk_bytes(const std::string& buffer, SizeMonitor& monitor,
                          size_t start_offset = 0,
                          TextEncoding encoding = TextEncoding::UTF8,
                          size_t max_read = 0) const;

    size_t probe_step() const { return probe_step_; }

private:
    size_t probe_step_;
};

} // namespace chunkguard

#endif // chunkguard_CHUNKING_CHUNKING_ENGINE_HPP
