/*
 * chunkguard C++17 - Response Size Monitor
 * 
 * Tracks a running estimate of the serialized size of a response against
 * a fixed byte budget. One monitor per request; never shared.
 */
#ifndef chunkguard_CHUNKING_SIZE_MONITOR_HPP
#define chunkguard_CHUNKING_SIZE_MONITOR_HPP

#include <chunkguard/core/json.hpp>
#include <chunkguard/chunking/chunking_config.hpp>

namespace chunkguard {

// Read-only view of a monitor
struct SizeInfo {
    double current_size;
    double max_size;
    double remaining_size;
    double usage_percentage;     // 0.0 to 100.0+
    bool near_limit;
    
    SizeInfo()
        : current_size(0)
        , max_size(0)
        , remaining_size(0)
        , usage_percentage(0)
        , near_limit(false) {}
};

class SizeMonitor {
public:
    // Throws std::invalid_argument when max_bytes <= 0, warning_ratio is
    // outside (0, 1] or safety_margin < 1.0.
    explicit SizeMonitor(double max_bytes = 0.9 * 1024 * 1024,
                         double warning_ratio = 0.85,
                         double safety_margin = 1.2);
    explicit SizeMonitor(const ChunkingConfig& config);
    
    // Wire size of value as compact JSON, times the safety margin
    double estimate_size(const Json& value) const;
    
    // current + estimate < max. Never mutates.
    bool can_add(const Json& value) const;
    
    // Commits the estimate unconditionally; returns whether the new total
    // is still under budget.
    bool add(const Json& value);
    
    bool is_near_limit() const;
    void reset();
    SizeInfo snapshot() const;
    
    double current_bytes() const { return current_; }
    double max_bytes() const { return max_; }
    double remaining_bytes() const;
    double safety_margin() const { return margin_; }

private:
    void init(double max_bytes, double warning_ratio, double safety_margin);
    
    double max_;
    double warning_ratio_;
    double margin_;
    double current_;
};

} // namespace chunkguard

#endif // chunkguard_CHUNKING_SIZE_MONITOR_HPP
