/*
 * chunkguard C++17 - Response Assembler
 * 
 * Wraps a chunk payload with its chunking metadata:
 * 
 *   {
 *     ...payload fields...,
 *     "chunking": {
 *       "has_more": bool,
 *       "continuation_token": string,          // only when has_more
 *       "chunk_info": { "current_chunk", "estimated_total_chunks", "progress_percentage" },
 *       "size_info": { "current_size", "max_size", "remaining_size",
 *                      "usage_percentage", "is_near_limit" }
 *     }
 *   }
 */
#ifndef chunkguard_CHUNKING_RESPONSE_ASSEMBLER_HPP
#define chunkguard_CHUNKING_RESPONSE_ASSEMBLER_HPP

#include <chunkguard/chunking/size_monitor.hpp>
#include <chunkguard/core/json.hpp>
#include <string>

namespace chunkguard {

class ResponseAssembler {
public:
    // payload: object whose fields are copied to the top level; any other
    //          value is placed under "data".
    // continuation_id: empty for none.
    // chunk_index: 1-based number of this chunk.
    // estimated_total: 0 when unknown; percentage is only reported when known.
    static Json assemble(const Json& payload,
                         bool has_more,
                         const SizeMonitor& monitor,
                         const std::string& continuation_id,
                         size_t chunk_index,
                         size_t estimated_total = 0);
};

} // namespace chunkguard

#endif // chunkguard_CHUNKING_RESPONSE_ASSEMBLER_HPP
