/*
 * chunkguard C++17 - Continuation Token Store
 * 
 * Maps opaque token ids to resumable cursor state. Tokens expire
 * TTL after issue (default 30 minutes):
 *   - get/update evict an expired token lazily and report not-found
 *   - issue/active_count sweep the whole map
 * 
 * The sweep is O(live tokens) per issue. That is fine for one token per
 * in-flight paginated request; it does not scale to very large numbers of
 * concurrently open tokens.
 * 
 * Ids are "<kind>_<unix ms>_<random base36>". Unique among live tokens
 * (collisions are re-rolled) but not cryptographically unguessable.
 * 
 * Not thread-safe: meant to be owned by one event loop and passed by
 * reference to every call site. Every public call leaves the map in a
 * consistent state before returning.
 */
#ifndef chunkguard_CHUNKING_TOKEN_STORE_HPP
#define chunkguard_CHUNKING_TOKEN_STORE_HPP

#include <chunkguard/chunking/chunking_config.hpp>
#include <chunkguard/chunking/continuation_token.hpp>
#include <chunkguard/core/json.hpp>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace chunkguard {

typedef std::function<int64_t()> ClockFn;

// Partial update for a stored token; only engaged fields are written.
// Cursor fields that do not belong to the token's kind are ignored.
// params entries are shallow-merged into the stored params object.
struct TokenUpdate {
    std::optional<std::string> target_path;
    std::optional<size_t> chunk_index;
    
    std::optional<size_t> line_start;      // read_file, switches to line mode
    std::optional<size_t> byte_offset;     // read_file, switches to byte mode
    
    std::optional<size_t> page;            // list_directory
    std::optional<std::string> last_item;
    
    std::optional<std::string> last_file;  // search_*
    std::optional<size_t> last_position;
    std::optional<size_t> file_index;
    
    Json params;
};

class TokenStore {
public:
    static constexpr int64_t DEFAULT_TTL_MS = 30LL * 60 * 1000;
    
    // Throws std::invalid_argument when ttl_ms <= 0. An empty clock means
    // the wall clock.
    explicit TokenStore(int64_t ttl_ms = DEFAULT_TTL_MS, ClockFn clock = ClockFn());
    // TTL from config.token_ttl_ms (tokens.ttl_minutes)
    explicit TokenStore(const ChunkingConfig& config, ClockFn clock = ClockFn());
    ~TokenStore();
    
    // Store a new token and return its id. Throws std::invalid_argument if
    // the cursor alternative does not match the kind.
    std::string issue(TokenKind kind, const std::string& target_path,
                      const TokenCursor& cursor, const Json& params,
                      size_t chunk_index = 0);
    
    // Copy of the live token; false when unknown or expired
    bool get(const std::string& id, ContinuationToken& out);
    
    // False when unknown or expired
    bool update(const std::string& id, const TokenUpdate& changes);
    
    // False when the id was not stored
    bool remove(const std::string& id);
    
    // Sweeps, then counts
    size_t active_count();
    
    void clear();
    void set_clock(ClockFn clock);
    int64_t ttl_ms() const { return ttl_ms_; }

private:
    int64_t now() const;
    bool expired(const ContinuationToken& token, int64_t now) const;
    size_t sweep(int64_t now);
    std::string make_id(TokenKind kind, int64_t now) const;
    
    std::map<std::string, ContinuationToken> tokens_;
    int64_t ttl_ms_;
    ClockFn clock_;
};

} // namespace chunkguard

#endif // chunkguard_CHUNKING_TOKEN_STORE_HPP
