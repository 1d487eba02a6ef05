#include <chunkguard/chunking/response_assembler.hpp>
#include <chunkguard/core/logger.hpp>

#include <cmath>

namespace chunkguard {

Json ResponseAssembler::assemble(const Json& payload,
                                 bool has_more,
                                 const SizeMonitor& monitor,
                                 const std::string& continuation_id,
                                 size_t chunk_index,
                                 size_t estimated_total) {
    Json response = Json::object();
    if (payload.is_object()) {
        response = payload;
        if (response.contains("chunking")) {
            LOG_WARN("[ResponseAssembler] Payload field 'chunking' is replaced by metadata");
        }
    } else if (!payload.is_null()) {
        response["data"] = payload;
    }

    Json chunk_info;
    chunk_info["current_chunk"] = chunk_index;
    if (estimated_total > 0) {
        chunk_info["estimated_total_chunks"] = estimated_total;
        chunk_info["progress_percentage"] =
            (static_cast<double>(chunk_index) / static_cast<double>(estimated_total)) * 100.0;
    }

    SizeInfo info = monitor.snapshot();
    Json size_info;
    size_info["current_size"] = static_cast<int64_t>(std::llround(info.current_size));
    size_info["max_size"] = static_cast<int64_t>(std::llround(info.max_size));
    size_info["remaining_size"] = static_cast<int64_t>(std::llround(info.remaining_size));
    size_info["usage_percentage"] = info.usage_percentage;
    size_info["is_near_limit"] = info.near_limit;

    Json chunking;
    chunking["has_more"] = has_more;
    if (has_more && !continuation_id.empty()) {
        chunking["continuation_token"] = continuation_id;
    }
    chunking["chunk_info"] = chunk_info;
    chunking["size_info"] = size_info;

    response["chunking"] = chunking;
    return response;
}

} // namespace chunkguard
