/*
 * chunkguard C++17 - Chunked Session
 * 
 * Drives resumable, size-bounded delivery for each kind of source:
 * 
 *   START -> CHUNK (has_more, token issued) -> ... -> FINAL CHUNK (no token)
 * 
 * Each call takes an optional continuation token from the previous call.
 * The consumed token is deleted once a newer one (or the final chunk) has
 * been produced, so at most one token is live per session.
 * 
 * Failures are reported through ChunkedResult, never thrown:
 *   token_not_found     unknown or expired token; restart from scratch
 *   token_mismatch      token belongs to another kind, mode, path or query
 *   cursor_stale        source changed under the cursor
 *   unit_exceeds_budget a single line/item/character cannot fit at all
 *   decode_error        bytes at the cursor do not decode in the session's
 *                       encoding; a larger budget will not help
 *   source_unavailable  no collaborator configured
 *   source_error        collaborator failed
 *   invalid_request     bad request fields
 */
#ifndef chunkguard_CHUNKING_CHUNKED_SESSION_HPP
#define chunkguard_CHUNKING_CHUNKED_SESSION_HPP

#include <chunkguard/chunking/chunking_config.hpp>
#include <chunkguard/chunking/chunking_engine.hpp>
#include <chunkguard/chunking/continuation_token.hpp>
#include <chunkguard/chunking/sources.hpp>
#include <chunkguard/chunking/token_store.hpp>
#include <chunkguard/core/json.hpp>
#include <string>

namespace chunkguard {

struct ChunkedResult {
    bool success;
    Json response;                   // Envelope, see ResponseAssembler
    std::string continuation_token;  // Empty on the final chunk
    std::string error_code;
    std::string error;
    
    ChunkedResult() : success(false) {}
    
    static ChunkedResult ok(const Json& response, const std::string& token) {
        ChunkedResult r;
        r.success = true;
        r.response = response;
        r.continuation_token = token;
        return r;
    }
    
    static ChunkedResult fail(const std::string& code, const std::string& message) {
        ChunkedResult r;
        r.success = false;
        r.error_code = code;
        r.error = message;
        return r;
    }
};

// Ordering applied to a listing before it is chunked
enum class DirectorySort {
    NAME,
    TYPE
};

bool parse_directory_sort(const std::string& name, DirectorySort& out);
const char* directory_sort_name(DirectorySort sort);

// Fields marked "replayed" are stored in the token and taken from there when
// resuming, whatever the resumed request says.
struct FileReadRequest {
    std::string path;
    size_t line_start;               // Ignored when resuming
    size_t byte_offset;              // Ignored when resuming
    size_t line_count;               // Line mode: lines per chunk, 0 for the default (replayed)
    size_t max_size;                 // Byte mode: bytes per chunk, 0 for the default (replayed)
    TextEncoding encoding;           // Byte mode only (replayed)
    Json params;                     // Replayed on resume
    std::string continuation_token;
    
    FileReadRequest()
        : line_start(0)
        , byte_offset(0)
        , line_count(0)
        , max_size(0)
        , encoding(TextEncoding::UTF8)
        , params(Json::object()) {}
};

// Filtering and ordering run over the whole listing before chunking, and
// are replayed so every page sees the same view.
struct DirectoryRequest {
    std::string path;
    size_t page_size;                // Entries per chunk, 0 for the default
    std::string pattern;             // Case-insensitive substring of the name
    bool show_hidden;                // Keep names starting with '.'
    DirectorySort sort_by;
    bool reverse;
    Json params;
    std::string continuation_token;
    
    DirectoryRequest()
        : page_size(0)
        , show_hidden(false)
        , sort_by(DirectorySort::NAME)
        , reverse(false)
        , params(Json::object()) {}
};

struct SearchRequest {
    std::string path;
    std::string query;               // May be empty when resuming
    TokenKind kind;                  // CONTENT_SEARCH or FILENAME_SEARCH
    Json params;
    std::string continuation_token;
    
    SearchRequest() : kind(TokenKind::CONTENT_SEARCH), params(Json::object()) {}
};

class ChunkedSession {
public:
    static constexpr size_t MAX_LINES_PER_CHUNK = 2000;
    static constexpr size_t MAX_BYTES_PER_CHUNK = 2 * 1024 * 1024;
    static constexpr size_t DEFAULT_PAGE_SIZE = 50;
    static constexpr size_t MAX_PAGE_SIZE = 1000;
    
    // The store must outlive the session. Throws std::invalid_argument on
    // an invalid config.
    ChunkedSession(TokenStore& store, const ChunkingConfig& config = ChunkingConfig());
    
    // Collaborators are not owned
    void set_file_source(FileSource* source) { file_source_ = source; }
    void set_directory_lister(DirectoryLister* lister) { directory_lister_ = lister; }
    void set_search_source(SearchSource* source) { search_source_ = source; }
    
    ChunkedResult read_file_lines(const FileReadRequest& request);
    ChunkedResult read_file_bytes(const FileReadRequest& request);
    ChunkedResult list_directory(const DirectoryRequest& request);
    ChunkedResult search(const SearchRequest& request);
    
    const ChunkingConfig& config() const { return config_; }

private:
    bool resolve_token(const std::string& id, TokenKind kind, const std::string& path,
                       ContinuationToken& out, ChunkedResult& failure);
    
    // Issues the follow-up token when more remains and retires the consumed one
    std::string advance(const ContinuationToken* consumed, bool has_more, TokenKind kind,
                        const std::string& path, const TokenCursor& cursor,
                        const Json& params, size_t chunk_index);
    
    TokenStore& store_;
    ChunkingConfig config_;
    ChunkingEngine engine_;
    FileSource* file_source_;
    DirectoryLister* directory_lister_;
    SearchSource* search_source_;
};

} // namespace chunkguard

#endif // chunkguard_CHUNKING_CHUNKED_SESSION_HPP
