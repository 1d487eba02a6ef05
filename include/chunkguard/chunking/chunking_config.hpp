/*
 * chunkguard C++17 - Chunking Configuration
 */
#ifndef chunkguard_CHUNKING_CHUNKING_CONFIG_HPP
#define chunkguard_CHUNKING_CHUNKING_CONFIG_HPP

#include <string>
#include <cstddef>
#include <cstdint>

namespace chunkguard {

class Config;

struct ChunkingConfig {
    double max_bytes;        // Byte budget per response (default: 0.9 MiB)
    double warning_ratio;    // Near-limit threshold as a fraction of max_bytes (default: 0.85)
    double safety_margin;    // Multiplier applied to every size estimate (default: 1.2)
    size_t probe_step;       // Byte-chunking probe increment (default: 4096)
    int64_t token_ttl_ms;    // Continuation token lifetime (default: 30 minutes)
    
    ChunkingConfig()
        : max_bytes(0.9 * 1024 * 1024)
        , warning_ratio(0.85)
        , safety_margin(1.2)
        , probe_step(4096)
        , token_ttl_ms(30LL * 60 * 1000) {}
    
    // Reads chunking.max_bytes, chunking.warning_ratio, chunking.safety_margin,
    // chunking.probe_step and tokens.ttl_minutes; absent keys keep defaults.
    static ChunkingConfig from_config(const Config& cfg);
    
    // Returns false and describes the first offending field.
    bool validate(std::string& error) const;
};

} // namespace chunkguard

#endif // chunkguard_CHUNKING_CHUNKING_CONFIG_HPP
