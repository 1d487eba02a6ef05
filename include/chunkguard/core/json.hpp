/*
 * chunkguard C++17 - JSON alias
 *
 * Every wire-facing structure (size estimates, tokens, envelopes, config)
 * goes through this single alias.
 */
#ifndef chunkguard_CORE_JSON_HPP
#define chunkguard_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace chunkguard {

typedef nlohmann::json Json;

} // namespace chunkguard

#endif // chunkguard_CORE_JSON_HPP
