#ifndef chunkguard_CORE_UTILS_HPP
#define chunkguard_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace chunkguard {

// ============ Time utilities ============

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Format timestamp (unix ms) as ISO 8601 string (YYYY-MM-DDTHH:MM:SSZ)
std::string format_timestamp_ms(int64_t timestamp_ms);

// ============ String utilities ============

std::string trim(const std::string& s);
std::string to_lower(const std::string& s);
bool starts_with(const std::string& s, const std::string& prefix);

// Split string by delimiter. Unlike std::getline, a trailing delimiter
// yields a trailing empty element ("a\n" -> {"a", ""}).
std::vector<std::string> split(const std::string& s, char delimiter);

// Human-readable byte count ("512 B", "1.50 KB", "2.00 MB")
std::string format_size(uint64_t bytes);

// ============ UTF-8 utilities ============

// Length of the UTF-8 sequence starting at s[i], or 0 if s[i..] does not
// hold a complete, well-formed sequence (overlongs and surrogates rejected).
size_t utf8_sequence_length(const unsigned char* s, size_t len, size_t i);

// True when every byte of [data, data+len) belongs to a well-formed sequence
bool is_valid_utf8(const unsigned char* data, size_t len);

// Append a code point as UTF-8
void append_utf8(std::string& out, uint32_t codepoint);

// ============ Random utilities ============

// Lowercase base-36 string of the given length built from RAND_bytes.
// Not meant for secrets.
std::string random_base36(size_t length);

} // namespace chunkguard

#endif // chunkguard_CORE_UTILS_HPP
