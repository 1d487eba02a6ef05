/*
 * chunkguard C++17 - Continuation Tokens
 * 
 * A token remembers where a cut-off operation stopped. The cursor is a
 * closed union keyed by the token kind:
 *   read_file       -> FileReadCursor   (line_start or byte_offset)
 *   list_directory  -> DirectoryCursor  (page, last_item)
 *   search_files /
 *   search_code     -> SearchCursor     (last_file, last_position, file_index)
 */
#ifndef chunkguard_CHUNKING_CONTINUATION_TOKEN_HPP
#define chunkguard_CHUNKING_CONTINUATION_TOKEN_HPP

#include <chunkguard/core/json.hpp>
#include <string>
#include <variant>
#include <cstdint>
#include <cstddef>

namespace chunkguard {

enum class TokenKind {
    FILE_READ,
    DIRECTORY_LIST,
    CONTENT_SEARCH,
    FILENAME_SEARCH
};

const char* kind_to_string(TokenKind kind);
bool kind_from_string(const std::string& name, TokenKind& out);

enum class FileReadMode {
    LINES,
    BYTES
};

struct FileReadCursor {
    FileReadMode mode;
    size_t line_start;
    size_t byte_offset;
    
    FileReadCursor() : mode(FileReadMode::LINES), line_start(0), byte_offset(0) {}
    
    static FileReadCursor at_line(size_t line) {
        FileReadCursor c;
        c.mode = FileReadMode::LINES;
        c.line_start = line;
        return c;
    }
    
    static FileReadCursor at_byte(size_t offset) {
        FileReadCursor c;
        c.mode = FileReadMode::BYTES;
        c.byte_offset = offset;
        return c;
    }
};

struct DirectoryCursor {
    size_t page;             // Pages already delivered
    std::string last_item;   // Name of the last delivered entry
    
    DirectoryCursor() : page(0) {}
};

struct SearchCursor {
    std::string last_file;   // File of the last delivered match
    size_t last_position;    // Line of the last delivered match
    size_t file_index;       // Index of the next match to deliver
    
    SearchCursor() : last_position(0), file_index(0) {}
};

typedef std::variant<FileReadCursor, DirectoryCursor, SearchCursor> TokenCursor;

// True when the cursor alternative is the one the kind expects
bool cursor_matches_kind(TokenKind kind, const TokenCursor& cursor);

struct ContinuationToken {
    std::string id;
    TokenKind kind;
    std::string target_path;
    TokenCursor cursor;
    Json params;             // Original request parameters, replayed on resume
    int64_t created_at;      // Unix ms
    size_t chunk_index;      // Chunks already delivered in this session
    
    ContinuationToken()
        : kind(TokenKind::FILE_READ)
        , params(Json::object())
        , created_at(0)
        , chunk_index(0) {}
};

// {"kind", "target_path", "id", "created_at", "chunk_index", "params",
//  ...cursor fields of the kind}
Json token_to_json(const ContinuationToken& token);

// Returns false on a missing/ill-typed field or unknown kind; out is
// left untouched in that case.
bool token_from_json(const Json& j, ContinuationToken& out);

} // namespace chunkguard

#endif // chunkguard_CHUNKING_CONTINUATION_TOKEN_HPP
