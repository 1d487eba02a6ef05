#include <chunkguard/chunking/continuation_token.hpp>
#include <chunkguard/core/logger.hpp>

namespace chunkguard {

const char* kind_to_string(TokenKind kind) {
    switch (kind) {
        case TokenKind::FILE_READ: return "read_file";
        case TokenKind::DIRECTORY_LIST: return "list_directory";
        case TokenKind::CONTENT_SEARCH: return "search_code";
        case TokenKind::FILENAME_SEARCH: return "search_files";
    }
    return "unknown";
}

bool kind_from_string(const std::string& name, TokenKind& out) {
    if (name == "read_file") {
        out = TokenKind::FILE_READ;
    } else if (name == "list_directory") {
        out = TokenKind::DIRECTORY_LIST;
    } else if (name == "search_code") {
        out = TokenKind::CONTENT_SEARCH;
    } else if (name == "search_files") {
        out = TokenKind::FILENAME_SEARCH;
    } else {
        return false;
    }
    return true;
}

bool cursor_matches_kind(TokenKind kind, const TokenCursor& cursor) {
    switch (kind) {
        case TokenKind::FILE_READ:
            return std::holds_alternative<FileReadCursor>(cursor);
        case TokenKind::DIRECTORY_LIST:
            return std::holds_alternative<DirectoryCursor>(cursor);
        case TokenKind::CONTENT_SEARCH:
        case TokenKind::FILENAME_SEARCH:
            return std::holds_alternative<SearchCursor>(cursor);
    }
    return false;
}

namespace {

// Non-negative integer, however it was stored
bool read_size(const Json& j, const char* key, size_t& out) {
    Json::const_iterator it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) return false;
    if (!it->is_number_unsigned() && it->get<int64_t>() < 0) return false;
    out = it->is_number_unsigned() ? it->get<size_t>() : static_cast<size_t>(it->get<int64_t>());
    return true;
}

bool read_string(const Json& j, const char* key, std::string& out) {
    Json::const_iterator it = j.find(key);
    if (it == j.end() || !it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

} // anonymous namespace

Json token_to_json(const ContinuationToken& token) {
    Json j;
    j["kind"] = kind_to_string(token.kind);
    j["target_path"] = token.target_path;
    j["id"] = token.id;
    j["created_at"] = token.created_at;
    j["chunk_index"] = token.chunk_index;
    j["params"] = token.params;

    if (const FileReadCursor* c = std::get_if<FileReadCursor>(&token.cursor)) {
        if (c->mode == FileReadMode::LINES) {
            j["line_start"] = c->line_start;
        } else {
            j["byte_offset"] = c->byte_offset;
        }
    } else if (const DirectoryCursor* c = std::get_if<DirectoryCursor>(&token.cursor)) {
        j["page"] = c->page;
        j["last_item"] = c->last_item;
    } else if (const SearchCursor* c = std::get_if<SearchCursor>(&token.cursor)) {
        j["last_file"] = c->last_file;
        j["last_position"] = c->last_position;
        j["file_index"] = c->file_index;
    }
    return j;
}

bool token_from_json(const Json& j, ContinuationToken& out) {
    if (!j.is_object()) return false;

    ContinuationToken token;
    std::string kind;
    if (!read_string(j, "kind", kind) || !kind_from_string(kind, token.kind)) {
        LOG_DEBUG("Rejecting token: unknown kind '%s'", kind.c_str());
        return false;
    }
    if (!read_string(j, "target_path", token.target_path) || !read_string(j, "id", token.id)) {
        return false;
    }

    Json::const_iterator created = j.find("created_at");
    if (created == j.end() || !created->is_number_integer()) return false;
    token.created_at = created->get<int64_t>();

    if (j.contains("chunk_index") && !read_size(j, "chunk_index", token.chunk_index)) {
        return false;
    }

    Json::const_iterator params = j.find("params");
    if (params != j.end()) {
        if (!params->is_object()) return false;
        token.params = *params;
    }

    switch (token.kind) {
        case TokenKind::FILE_READ: {
            FileReadCursor c;
            if (j.contains("line_start")) {
                c.mode = FileReadMode::LINES;
                if (!read_size(j, "line_start", c.line_start)) return false;
            } else if (j.contains("byte_offset")) {
                c.mode = FileReadMode::BYTES;
                if (!read_size(j, "byte_offset", c.byte_offset)) return false;
            } else {
                return false;
            }
            token.cursor = c;
            break;
        }
        case TokenKind::DIRECTORY_LIST: {
            DirectoryCursor c;
            if (!read_size(j, "page", c.page) || !read_string(j, "last_item", c.last_item)) {
                return false;
            }
            token.cursor = c;
            break;
        }
        case TokenKind::CONTENT_SEARCH:
        case TokenKind::FILENAME_SEARCH: {
            SearchCursor c;
            if (!read_string(j, "last_file", c.last_file) ||
                !read_size(j, "last_position", c.last_position) ||
                !read_size(j, "file_index", c.file_index)) {
                return false;
            }
            token.cursor = c;
            break;
        }
    }

    out = token;
    return true;
}

} // namespace chunkguard
