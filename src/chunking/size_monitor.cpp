/*
 * chunkguard C++17 - Response Size Monitor Implementation
 */
#include <chunkguard/chunking/size_monitor.hpp>
#include <chunkguard/core/logger.hpp>

#include <cmath>
#include <stdexcept>

namespace chunkguard {

SizeMonitor::SizeMonitor(double max_bytes, double warning_ratio, double safety_margin)
    : max_(0), warning_ratio_(0), margin_(0), current_(0)
{
    init(max_bytes, warning_ratio, safety_margin);
}

SizeMonitor::SizeMonitor(const ChunkingConfig& config)
    : max_(0), warning_ratio_(0), margin_(0), current_(0)
{
    init(config.max_bytes, config.warning_ratio, config.safety_margin);
}

void SizeMonitor::init(double max_bytes, double warning_ratio, double safety_margin) {
    if (!(max_bytes > 0) || !std::isfinite(max_bytes)) {
        throw std::invalid_argument("SizeMonitor: max_bytes must be positive");
    }
    if (!(warning_ratio > 0.0 && warning_ratio <= 1.0)) {
        throw std::invalid_argument("SizeMonitor: warning_ratio must be in (0, 1]");
    }
    if (!(safety_margin >= 1.0) || !std::isfinite(safety_margin)) {
        throw std::invalid_argument("SizeMonitor: safety_margin must be >= 1.0");
    }
    max_ = max_bytes;
    warning_ratio_ = warning_ratio;
    margin_ = safety_margin;
    current_ = 0;
    
    LOG_DEBUG("[SizeMonitor] budget=%.0f bytes, warning at %.0f%%, margin x%.2f",
              max_, warning_ratio_ * 100.0, margin_);
}

double SizeMonitor::estimate_size(const Json& value) const {
    // Replace rather than throw on invalid UTF-8: estimation must never fail
    std::string wire = value.dump(-1, ' ', false, Json::error_handler_t::replace);
    return static_cast<double>(wire.size()) * margin_;
}

bool SizeMonitor::can_add(const Json& value) const {
    return current_ + estimate_size(value) < max_;
}

bool SizeMonitor::add(const Json& value) {
    bool was_near = is_near_limit();
    current_ += estimate_size(value);
    if (!was_near && is_near_limit()) {
        LOG_WARN("[SizeMonitor] Response at %.1f%% of %.0f byte budget",
                 (current_ / max_) * 100.0, max_);
    }
    return current_ < max_;
}

bool SizeMonitor::is_near_limit() const {
    return current_ > max_ * warning_ratio_;
}

void SizeMonitor::reset() {
    current_ = 0;
}

double SizeMonitor::remaining_bytes() const {
    return current_ < max_ ? max_ - current_ : 0.0;
}

SizeInfo SizeMonitor::snapshot() const {
    SizeInfo info;
    info.current_size = current_;
    info.max_size = max_;
    info.remaining_size = remaining_bytes();
    info.usage_percentage = (current_ / max_) * 100.0;
    info.near_limit = is_near_limit();
    return info;
}

} // namespace chunkguard
