#include <chunkguard/chunking/chunking_config.hpp>
#include <chunkguard/core/config.hpp>
#include <chunkguard/core/logger.hpp>

#include <cmath>

namespace chunkguard {

ChunkingConfig ChunkingConfig::from_config(const Config& cfg) {
    ChunkingConfig c;
    c.max_bytes = cfg.get_double("chunking.max_bytes", c.max_bytes);
    c.warning_ratio = cfg.get_double("chunking.warning_ratio", c.warning_ratio);
    c.safety_margin = cfg.get_double("chunking.safety_margin", c.safety_margin);

    // Non-positive or out-of-range steps become 0 so validate() rejects them
    double step = cfg.get_double("chunking.probe_step", static_cast<double>(c.probe_step));
    if (step >= 1.0 && step < 9223372036854775808.0) {
        c.probe_step = static_cast<size_t>(step);
    } else {
        LOG_ERROR("chunking.probe_step is out of range");
        c.probe_step = 0;
    }

    // Out-of-range TTLs become 0 so validate() rejects them
    double ttl_ms = cfg.get_double("tokens.ttl_minutes", 30.0) * 60.0 * 1000.0;
    if (ttl_ms >= 1.0 && ttl_ms < 9223372036854775808.0) {
        c.token_ttl_ms = static_cast<int64_t>(ttl_ms);
    } else {
        LOG_ERROR("tokens.ttl_minutes is out of range");
        c.token_ttl_ms = 0;
    }

    LOG_DEBUG("Chunking config: max_bytes=%.0f, warning_ratio=%.2f, safety_margin=%.2f, "
              "probe_step=%zu, token_ttl_ms=%lld",
              c.max_bytes, c.warning_ratio, c.safety_margin, c.probe_step,
              static_cast<long long>(c.token_ttl_ms));
    return c;
}

bool ChunkingConfig::validate(std::string& error) const {
    if (!(max_bytes > 0) || !std::isfinite(max_bytes)) {
        error = "chunking.max_bytes must be a positive number";
        return false;
    }
    if (!(warning_ratio > 0.0 && warning_ratio <= 1.0)) {
        error = "chunking.warning_ratio must be in (0, 1]";
        return false;
    }
    if (!(safety_margin >= 1.0) || !std::isfinite(safety_margin)) {
        error = "chunking.safety_margin must be >= 1.0";
        return false;
    }
    if (probe_step == 0) {
        error = "chunking.probe_step must be positive";
        return false;
    }
    if (token_ttl_ms <= 0) {
        error = "tokens.ttl_minutes must be positive";
        return false;
    }
    return true;
}

} // namespace chunkguard
