/*
 * chunkguard C++17 - Chunked Tools Implementation
 */
#include <chunkguard/chunking/chunked_tools.hpp>
#include <chunkguard/core/logger.hpp>

namespace chunkguard {

namespace {

ChunkedResult bad_argument(const std::string& message) {
    return ChunkedResult::fail("invalid_request", message);
}

// Reads an optional string argument; false when present with another type
bool optional_string(const Json& params, const char* key, std::string& out) {
    if (!params.contains(key)) return true;
    if (!params[key].is_string()) return false;
    out = params[key].get<std::string>();
    return true;
}

// Accepts any non-negative integer, signed or not
bool optional_size(const Json& params, const char* key, size_t& out) {
    if (!params.contains(key)) return true;
    const Json& value = params[key];
    if (value.is_number_unsigned()) {
        out = value.get<size_t>();
        return true;
    }
    if (!value.is_number_integer() || value.get<int64_t>() < 0) return false;
    out = static_cast<size_t>(value.get<int64_t>());
    return true;
}

bool optional_bool(const Json& params, const char* key, bool& out) {
    if (!params.contains(key)) return true;
    if (!params[key].is_boolean()) return false;
    out = params[key].get<bool>();
    return true;
}

// Arguments to replay on resume: everything but the token itself
Json replay_params(const Json& params) {
    Json replay = params;
    replay.erase("continuation_token");
    return replay;
}

} // anonymous namespace

ChunkedTools::ChunkedTools(ChunkedSession& session, TokenStore& store)
    : session_(session)
    , store_(store) {}

std::vector<std::string> ChunkedTools::actions() const {
    std::vector<std::string> acts;
    acts.push_back("read_file");
    acts.push_back("list_directory");
    acts.push_back("search_code");
    acts.push_back("search_files");
    return acts;
}

ChunkedResult ChunkedTools::execute(const std::string& action, const Json& params) {
    if (!params.is_object()) {
        return bad_argument("Arguments must be a JSON object");
    }
    
    ChunkedResult result;
    if (action == "read_file") {
        result = do_read_file(params);
    } else if (action == "list_directory") {
        result = do_list_directory(params);
    } else if (action == "search_code") {
        result = do_search(TokenKind::CONTENT_SEARCH, params);
    } else if (action == "search_files") {
        result = do_search(TokenKind::FILENAME_SEARCH, params);
    } else {
        return bad_argument("Unknown action: " + action);
    }
    
    if (!result.success) {
        LOG_DEBUG("[ChunkedTools] %s failed (%s): %s",
                  action.c_str(), result.error_code.c_str(), result.error.c_str());
    }
    return result;
}

ChunkedResult ChunkedTools::do_read_file(const Json& params) {
    FileReadRequest request;
    std::string mode = "lines";
    std::string encoding = "utf-8";
    
    if (!params.contains("path") || !params["path"].is_string()) {
        return bad_argument("read_file requires a string 'path'");
    }
    request.path = params["path"].get<std::string>();
    
    if (!optional_string(params, "mode", mode) ||
        !optional_string(params, "encoding", encoding) ||
        !optional_string(params, "continuation_token", request.continuation_token)) {
        return bad_argument("read_file: 'mode', 'encoding' and 'continuation_token' must be strings");
    }
    if (!optional_size(params, "line_start", request.line_start) ||
        !optional_size(params, "start_offset", request.byte_offset) ||
        !optional_size(params, "line_count", request.line_count) ||
        !optional_size(params, "max_size", request.max_size)) {
        return bad_argument("read_file: 'line_start', 'start_offset', 'line_count' and 'max_size' "
                            "must be non-negative integers");
    }
    if (!parse_encoding(encoding, request.encoding)) {
        return bad_argument("read_file: unsupported encoding '" + encoding + "'");
    }
    
    bool by_bytes = (mode == "bytes");
    if (!by_bytes && mode != "lines") {
        return bad_argument("read_file: mode must be 'lines' or 'bytes'");
    }
    
    if (!request.continuation_token.empty()) {
        // Resume in whatever mode the session started with
        ContinuationToken token;
        if (store_.get(request.continuation_token, token) && token.kind == TokenKind::FILE_READ) {
            by_bytes = std::get<FileReadCursor>(token.cursor).mode == FileReadMode::BYTES;
        }
    }
    
    request.params = replay_params(params);
    return by_bytes ? session_.read_file_bytes(request) : session_.read_file_lines(request);
}

ChunkedResult ChunkedTools::do_list_directory(const Json& params) {
    DirectoryRequest request;
    if (!params.contains("path") || !params["path"].is_string()) {
        return bad_argument("list_directory requires a string 'path'");
    }
    request.path = params["path"].get<std::string>();
    std::string sort_by = "name";
    if (!optional_string(params, "continuation_token", request.continuation_token) ||
        !optional_string(params, "pattern", request.pattern) ||
        !optional_string(params, "sort_by", sort_by)) {
        return bad_argument("list_directory: 'pattern', 'sort_by' and 'continuation_token' must be strings");
    }
    if (!optional_size(params, "page_size", request.page_size)) {
        return bad_argument("list_directory: 'page_size' must be a non-negative integer");
    }
    if (!optional_bool(params, "show_hidden", request.show_hidden) ||
        !optional_bool(params, "reverse", request.reverse)) {
        return bad_argument("list_directory: 'show_hidden' and 'reverse' must be booleans");
    }
    if (!parse_directory_sort(sort_by, request.sort_by)) {
        return bad_argument("list_directory: sort_by must be 'name' or 'type'");
    }
    request.params = replay_params(params);
    return session_.list_directory(request);
}

ChunkedResult ChunkedTools::do_search(TokenKind kind, const Json& params) {
    SearchRequest request;
    request.kind = kind;
    if (!params.contains("path") || !params["path"].is_string()) {
        return bad_argument(std::string(kind_to_string(kind)) + " requires a string 'path'");
    }
    request.path = params["path"].get<std::string>();
    if (!optional_string(params, "query", request.query) ||
        !optional_string(params, "continuation_token", request.continuation_token)) {
        return bad_argument(std::string(kind_to_string(kind)) +
                            ": 'query' and 'continuation_token' must be strings");
    }
    request.params = replay_params(params);
    return session_.search(request);
}

} // namespace chunkguard
