/*
 * chunkguard C++17 - Continuation Token Store Implementation
 */
#include <chunkguard/chunking/token_store.hpp>
#include <chunkguard/core/logger.hpp>
#include <chunkguard/core/utils.hpp>

#include <stdexcept>

namespace chunkguard {

TokenStore::TokenStore(int64_t ttl_ms, ClockFn clock)
    : ttl_ms_(ttl_ms)
    , clock_(clock)
{
    if (ttl_ms_ <= 0) {
        throw std::invalid_argument("TokenStore: ttl must be positive");
    }
}

TokenStore::TokenStore(const ChunkingConfig& config, ClockFn clock)
    : ttl_ms_(config.token_ttl_ms)
    , clock_(clock)
{
    if (ttl_ms_ <= 0) {
        throw std::invalid_argument("TokenStore: tokens.ttl_minutes must be positive");
    }
    LOG_DEBUG("[TokenStore] Token TTL %lld ms", static_cast<long long>(ttl_ms_));
}

TokenStore::~TokenStore() {
    if (!tokens_.empty()) {
        LOG_DEBUG("[TokenStore] Dropping %zu outstanding token(s)", tokens_.size());
    }
}

int64_t TokenStore::now() const {
    return clock_ ? clock_() : current_timestamp_ms();
}

bool TokenStore::expired(const ContinuationToken& token, int64_t now) const {
    return now - token.created_at >= ttl_ms_;
}

size_t TokenStore::sweep(int64_t now) {
    size_t evicted = 0;
    std::map<std::string, ContinuationToken>::iterator it = tokens_.begin();
    while (it != tokens_.end()) {
        if (expired(it->second, now)) {
            it = tokens_.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }
    if (evicted > 0) {
        LOG_DEBUG("[TokenStore] Evicted %zu expired token(s), %zu live", evicted, tokens_.size());
    }
    return evicted;
}

std::string TokenStore::make_id(TokenKind kind, int64_t now) const {
    std::string id;
    do {
        id = std::string(kind_to_string(kind)) + "_" + std::to_string(now) + "_" + random_base36(11);
    } while (tokens_.find(id) != tokens_.end());
    return id;
}

std::string TokenStore::issue(TokenKind kind, const std::string& target_path,
                              const TokenCursor& cursor, const Json& params,
                              size_t chunk_index) {
    if (!cursor_matches_kind(kind, cursor)) {
        throw std::invalid_argument(std::string("TokenStore: cursor does not match kind ") +
                                    kind_to_string(kind));
    }
    
    int64_t ts = now();
    
    ContinuationToken token;
    token.id = make_id(kind, ts);
    token.kind = kind;
    token.target_path = target_path;
    token.cursor = cursor;
    token.params = params.is_object() ? params : Json::object();
    token.created_at = ts;
    token.chunk_index = chunk_index;
    
    std::string id = token.id;
    tokens_[id] = token;
    
    sweep(ts);
    
    LOG_DEBUG("[TokenStore] Issued %s for '%s' (chunk %zu)", id.c_str(), target_path.c_str(), chunk_index);
    return id;
}

bool TokenStore::get(const std::string& id, ContinuationToken& out) {
    std::map<std::string, ContinuationToken>::iterator it = tokens_.find(id);
    if (it == tokens_.end()) {
        return false;
    }
    if (expired(it->second, now())) {
        LOG_DEBUG("[TokenStore] Token %s expired", id.c_str());
        tokens_.erase(it);
        return false;
    }
    out = it->second;
    return true;
}

bool TokenStore::update(const std::string& id, const TokenUpdate& changes) {
    std::map<std::string, ContinuationToken>::iterator it = tokens_.find(id);
    if (it == tokens_.end()) {
        return false;
    }
    if (expired(it->second, now())) {
        LOG_DEBUG("[TokenStore] Token %s expired before update", id.c_str());
        tokens_.erase(it);
        return false;
    }
    
    // Build the new state on a copy so the stored token is swapped in whole
    ContinuationToken token = it->second;
    
    if (changes.target_path) token.target_path = *changes.target_path;
    if (changes.chunk_index) token.chunk_index = *changes.chunk_index;
    
    bool ignored = false;
    if (FileReadCursor* c = std::get_if<FileReadCursor>(&token.cursor)) {
        if (changes.line_start) {
            c->mode = FileReadMode::LINES;
            c->line_start = *changes.line_start;
        }
        if (changes.byte_offset) {
            c->mode = FileReadMode::BYTES;
            c->byte_offset = *changes.byte_offset;
        }
        ignored = changes.page || changes.last_item || changes.last_file ||
                  changes.last_position || changes.file_index;
    } else if (DirectoryCursor* c = std::get_if<DirectoryCursor>(&token.cursor)) {
        if (changes.page) c->page = *changes.page;
        if (changes.last_item) c->last_item = *changes.last_item;
        ignored = changes.line_start || changes.byte_offset || changes.last_file ||
                  changes.last_position || changes.file_index;
    } else if (SearchCursor* c = std::get_if<SearchCursor>(&token.cursor)) {
        if (changes.last_file) c->last_file = *changes.last_file;
        if (changes.last_position) c->last_position = *changes.last_position;
        if (changes.file_index) c->file_index = *changes.file_index;
        ignored = changes.line_start || changes.byte_offset || changes.page ||
                  changes.last_item;
    }
    if (ignored) {
        LOG_WARN("[TokenStore] Ignoring cursor fields that do not apply to %s token %s",
                 kind_to_string(token.kind), id.c_str());
    }
    
    if (changes.params.is_object()) {
        for (Json::const_iterator p = changes.params.begin(); p != changes.params.end(); ++p) {
            token.params[p.key()] = p.value();
        }
    }
    
    it->second = token;
    return true;
}

bool TokenStore::remove(const std::string& id) {
    bool erased = tokens_.erase(id) > 0;
    if (erased) {
        LOG_DEBUG("[TokenStore] Removed token %s", id.c_str());
    }
    return erased;
}

size_t TokenStore::active_count() {
    sweep(now());
    return tokens_.size();
}

void TokenStore::clear() {
    tokens_.clear();
    LOG_DEBUG("[TokenStore] Cleared all tokens");
}

void TokenStore::set_clock(ClockFn clock) {
    clock_ = clock;
}

} // namespace chunkguard
