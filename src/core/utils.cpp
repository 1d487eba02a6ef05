#include <chunkguard/core/utils.hpp>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <openssl/rand.h>

namespace chunkguard {

// ============ Time utilities ============

int64_t current_timestamp_ms() {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

std::string format_timestamp_ms(int64_t timestamp_ms) {
    time_t t = static_cast<time_t>(timestamp_ms / 1000);
    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return std::string(buf);
}

// ============ String utilities ============

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() &&
           std::equal(prefix.begin(), prefix.end(), s.begin());
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t end;
    while ((end = s.find(delimiter, start)) != std::string::npos) {
        parts.push_back(s.substr(start, end - start));
        start = end + 1;
    }
    parts.push_back(s.substr(start));
    return parts;
}

std::string format_size(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    char buf[32];
    snprintf(buf, sizeof(buf), "%.2f %s", value, units[unit]);
    return std::string(buf);
}

// ============ UTF-8 utilities ============

size_t utf8_sequence_length(const unsigned char* s, size_t len, size_t i) {
    if (i >= len) return 0;
    unsigned char c = s[i];

    if (c < 0x80) return 1;

    size_t expected;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;

    if (c >= 0xC2 && c <= 0xDF) {
        expected = 2;
    } else if (c == 0xE0) {
        expected = 3; lo = 0xA0;            // no overlongs
    } else if (c >= 0xE1 && c <= 0xEC) {
        expected = 3;
    } else if (c == 0xED) {
        expected = 3; hi = 0x9F;            // no surrogates
    } else if (c >= 0xEE && c <= 0xEF) {
        expected = 3;
    } else if (c == 0xF0) {
        expected = 4; lo = 0x90;
    } else if (c >= 0xF1 && c <= 0xF3) {
        expected = 4;
    } else if (c == 0xF4) {
        expected = 4; hi = 0x8F;            // <= U+10FFFF
    } else {
        return 0;
    }

    if (i + expected > len) return 0;

    unsigned char second = s[i + 1];
    if (second < lo || second > hi) return 0;
    for (size_t j = 2; j < expected; ++j) {
        if ((s[i + j] & 0xC0) != 0x80) return 0;
    }
    return expected;
}

bool is_valid_utf8(const unsigned char* data, size_t len) {
    size_t i = 0;
    while (i < len) {
        size_t n = utf8_sequence_length(data, len, i);
        if (n == 0) return false;
        i += n;
    }
    return true;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// ============ Random utilities ============

std::string random_base36(size_t length) {
    static const char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";

    std::vector<unsigned char> bytes(length);
    if (length > 0 && RAND_bytes(bytes.data(), static_cast<int>(length)) != 1) {
        throw std::runtime_error("RAND_bytes failed to produce random data");
    }

    std::string out;
    out.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        out.push_back(alphabet[bytes[i] % 36]);
    }
    return out;
}

} // namespace chunkguard
