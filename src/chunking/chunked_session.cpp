/*
 * chunkguard C++17 - Chunked Session Implementation
 */
#include <chunkguard/chunking/chunked_session.hpp>
#include <chunkguard/chunking/response_assembler.hpp>
#include <chunkguard/chunking/size_monitor.hpp>
#include <chunkguard/core/logger.hpp>
#include <chunkguard/core/utils.hpp>

#include <algorithm>
#include <stdexcept>

namespace chunkguard {

bool parse_directory_sort(const std::string& name, DirectorySort& out) {
    std::string n = to_lower(trim(name));
    if (n == "name") {
        out = DirectorySort::NAME;
    } else if (n == "type") {
        out = DirectorySort::TYPE;
    } else {
        return false;
    }
    return true;
}

const char* directory_sort_name(DirectorySort sort) {
    switch (sort) {
        case DirectorySort::NAME: return "name";
        case DirectorySort::TYPE: return "type";
    }
    return "name";
}

namespace {

const ChunkingConfig& validated(const ChunkingConfig& config) {
    std::string error;
    if (!config.validate(error)) {
        LOG_ERROR("[ChunkedSession] Invalid chunking config: %s", error.c_str());
        throw std::invalid_argument(error);
    }
    return config;
}

// Total chunk count extrapolated from this chunk's progress.
// remaining: units left when this chunk started; done: units delivered now.
size_t extrapolate_total(size_t chunk_index, bool has_more, size_t remaining, size_t done) {
    if (!has_more) return chunk_index;
    if (done == 0) return 0;
    return chunk_index - 1 + (remaining + done - 1) / done;
}

// 0 means "use the default"; anything else is clamped to the maximum
size_t effective_cap(size_t requested, size_t fallback, size_t maximum) {
    if (requested == 0) return fallback;
    return std::min(requested, maximum);
}

// Unsigned entry of replayed params, or fallback when absent or mistyped
size_t replayed_size(const Json& params, const char* key, size_t fallback) {
    Json::const_iterator it = params.find(key);
    if (it == params.end() || !it->is_number_unsigned()) return fallback;
    return it->get<size_t>();
}

bool replayed_bool(const Json& params, const char* key, bool fallback) {
    Json::const_iterator it = params.find(key);
    if (it == params.end() || !it->is_boolean()) return fallback;
    return it->get<bool>();
}

std::string replayed_string(const Json& params, const char* key, const std::string& fallback) {
    Json::const_iterator it = params.find(key);
    if (it == params.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

ChunkedResult non_progress(const std::string& what, const std::string& path) {
    LOG_WARN("[ChunkedSession] %s in '%s' exceeds the whole response budget", what.c_str(), path.c_str());
    return ChunkedResult::fail("unit_exceeds_budget",
                               what + " in '" + path + "' is larger than the response budget");
}

} // anonymous namespace

ChunkedSession::ChunkedSession(TokenStore& store, const ChunkingConfig& config)
    : store_(store)
    , config_(validated(config))
    , engine_(config.probe_step)
    , file_source_(nullptr)
    , directory_lister_(nullptr)
    , search_source_(nullptr)
{
    if (store_.ttl_ms() != config_.token_ttl_ms) {
        LOG_WARN("[ChunkedSession] Token store TTL %lld ms differs from configured %lld ms",
                 static_cast<long long>(store_.ttl_ms()),
                 static_cast<long long>(config_.token_ttl_ms));
    }
}

bool ChunkedSession::resolve_token(const std::string& id, TokenKind kind, const std::string& path,
                                   ContinuationToken& out, ChunkedResult& failure) {
    if (!store_.get(id, out)) {
        LOG_INFO("[ChunkedSession] Continuation token '%s' not found or expired", id.c_str());
        failure = ChunkedResult::fail("token_not_found",
                                      "Continuation token '" + id + "' is unknown or expired; restart the request");
        return false;
    }
    if (out.kind != kind || out.target_path != path) {
        LOG_WARN("[ChunkedSession] Token %s is for %s '%s', not %s '%s'",
                 id.c_str(), kind_to_string(out.kind), out.target_path.c_str(),
                 kind_to_string(kind), path.c_str());
        failure = ChunkedResult::fail("token_mismatch",
                                      "Continuation token '" + id + "' belongs to a different request");
        return false;
    }
    return true;
}

std::string ChunkedSession::advance(const ContinuationToken* consumed, bool has_more, TokenKind kind,
                                    const std::string& path, const TokenCursor& cursor,
                                    const Json& params, size_t chunk_index) {
    std::string next_id;
    if (has_more) {
        next_id = store_.issue(kind, path, cursor, params, chunk_index);
    }
    if (consumed) {
        store_.remove(consumed->id);
    }
    if (!has_more) {
        LOG_DEBUG("[ChunkedSession] Final chunk %zu delivered for %s '%s'",
                  chunk_index, kind_to_string(kind), path.c_str());
    }
    return next_id;
}

// ============================================================================
// File contents by line
// ============================================================================

ChunkedResult ChunkedSession::read_file_lines(const FileReadRequest& request) {
    if (!file_source_) {
        return ChunkedResult::fail("source_unavailable", "No file source configured");
    }

    ContinuationToken token;
    const ContinuationToken* consumed = nullptr;
    size_t start_line = request.line_start;
    size_t chunk_index = 1;
    size_t line_count = effective_cap(request.line_count, MAX_LINES_PER_CHUNK, MAX_LINES_PER_CHUNK);
    Json params = request.params.is_object() ? request.params : Json::object();

    if (!request.continuation_token.empty()) {
        ChunkedResult failure;
        if (!resolve_token(request.continuation_token, TokenKind::FILE_READ, request.path, token, failure)) {
            return failure;
        }
        const FileReadCursor& cursor = std::get<FileReadCursor>(token.cursor);
        if (cursor.mode != FileReadMode::LINES) {
            return ChunkedResult::fail("token_mismatch", "Continuation token is for a byte-mode read");
        }
        start_line = cursor.line_start;
        chunk_index = token.chunk_index + 1;
        params = token.params;
        consumed = &token;
        line_count = effective_cap(replayed_size(params, "line_count", line_count),
                                   MAX_LINES_PER_CHUNK, MAX_LINES_PER_CHUNK);
    }
    params["line_count"] = line_count;

    std::string content;
    std::string error;
    if (!file_source_->read_all(request.path, content, error)) {
        LOG_ERROR("[ChunkedSession] Reading '%s' failed: %s", request.path.c_str(), error.c_str());
        return ChunkedResult::fail("source_error", error);
    }

    SizeMonitor monitor(config_);
    LineChunk chunk = engine_.chunk_lines(content, monitor, start_line, line_count);

    if (chunk.has_more && chunk.next_line == chunk.start_line) {
        return non_progress("Line " + std::to_string(chunk.start_line + 1), request.path);
    }

    std::string next_id = advance(consumed, chunk.has_more, TokenKind::FILE_READ, request.path,
                                  FileReadCursor::at_line(chunk.next_line), params, chunk_index);

    Json payload;
    payload["content"] = chunk.text;
    payload["mode"] = "lines";
    payload["start_line"] = chunk.start_line;
    payload["lines_read"] = chunk.lines_read();
    payload["total_lines"] = chunk.total_lines;
    payload["path"] = request.path;

    size_t total = extrapolate_total(chunk_index, chunk.has_more,
                                     chunk.total_lines - chunk.start_line, chunk.lines_read());
    return ChunkedResult::ok(
        ResponseAssembler::assemble(payload, chunk.has_more, monitor, next_id, chunk_index, total),
        next_id);
}

// ============================================================================
// File contents by byte range
// ============================================================================

ChunkedResult ChunkedSession::read_file_bytes(const FileReadRequest& request) {
    if (!file_source_) {
        return ChunkedResult::fail("source_unavailable", "No file source configured");
    }

    ContinuationToken token;
    const ContinuationToken* consumed = nullptr;
    size_t start_offset = request.byte_offset;
    size_t chunk_index = 1;
    TextEncoding encoding = request.encoding;
    size_t max_size = effective_cap(request.max_size, MAX_BYTES_PER_CHUNK, MAX_BYTES_PER_CHUNK);
    Json params = request.params.is_object() ? request.params : Json::object();

    if (!request.continuation_token.empty()) {
        ChunkedResult failure;
        if (!resolve_token(request.continuation_token, TokenKind::FILE_READ, request.path, token, failure)) {
            return failure;
        }
        const FileReadCursor& cursor = std::get<FileReadCursor>(token.cursor);
        if (cursor.mode != FileReadMode::BYTES) {
            return ChunkedResult::fail("token_mismatch", "Continuation token is for a line-mode read");
        }
        start_offset = cursor.byte_offset;
        chunk_index = token.chunk_index + 1;
        params = token.params;
        consumed = &token;

        // Replay the encoding the session started with
        if (params.contains("encoding") && params["encoding"].is_string() &&
            !parse_encoding(params["encoding"].get<std::string>(), encoding)) {
            return ChunkedResult::fail("token_mismatch", "Continuation token carries an unknown encoding");
        }
        max_size = effective_cap(replayed_size(params, "max_size", max_size),
                                 MAX_BYTES_PER_CHUNK, MAX_BYTES_PER_CHUNK);
    }
    params["encoding"] = encoding_name(encoding);
    params["max_size"] = max_size;

    std::string content;
    std::string error;
    if (!file_source_->read_all(request.path, content, error)) {
        LOG_ERROR("[ChunkedSession] Reading '%s' failed: %s", request.path.c_str(), error.c_str());
        return ChunkedResult::fail("source_error", error);
    }
    if (start_offset > content.size()) {
        if (consumed) {
            return ChunkedResult::fail("cursor_stale", "File '" + request.path + "' is shorter than the resume offset");
        }
        return ChunkedResult::fail("invalid_request", "byte_offset is past the end of '" + request.path + "'");
    }

    SizeMonitor monitor(config_);
    ByteChunk chunk = engine_.chunk_bytes(content, monitor, start_offset, encoding, max_size);

    if (chunk.has_more && chunk.bytes_consumed == 0) {
        if (chunk.decode_stopped) {
            LOG_WARN("[ChunkedSession] '%s' does not decode as %s at byte %zu",
                     request.path.c_str(), encoding_name(encoding), chunk.start_offset);
            return ChunkedResult::fail("decode_error",
                                       "Bytes at offset " + std::to_string(chunk.start_offset) + " in '" +
                                       request.path + "' are not valid " + encoding_name(encoding));
        }
        return non_progress("Data at byte " + std::to_string(chunk.start_offset), request.path);
    }

    std::string next_id = advance(consumed, chunk.has_more, TokenKind::FILE_READ, request.path,
                                  FileReadCursor::at_byte(chunk.next_offset), params, chunk_index);

    Json payload;
    payload["content"] = chunk.text;
    payload["mode"] = "bytes";
    payload["start_offset"] = chunk.start_offset;
    payload["bytes_read"] = chunk.bytes_consumed;
    payload["file_size"] = content.size();
    payload["file_size_readable"] = format_size(content.size());
    payload["encoding"] = encoding_name(encoding);
    payload["path"] = request.path;

    size_t total = extrapolate_total(chunk_index, chunk.has_more,
                                     content.size() - chunk.start_offset, chunk.bytes_consumed);
    return ChunkedResult::ok(
        ResponseAssembler::assemble(payload, chunk.has_more, monitor, next_id, chunk_index, total),
        next_id);
}

// ============================================================================
// Directory listings
// ============================================================================

ChunkedResult ChunkedSession::list_directory(const DirectoryRequest& request) {
    if (!directory_lister_) {
        return ChunkedResult::fail("source_unavailable", "No directory lister configured");
    }

    ContinuationToken token;
    const ContinuationToken* consumed = nullptr;
    size_t chunk_index = 1;
    size_t page_size = effective_cap(request.page_size, DEFAULT_PAGE_SIZE, MAX_PAGE_SIZE);
    std::string pattern = request.pattern;
    bool show_hidden = request.show_hidden;
    DirectorySort sort_by = request.sort_by;
    bool reverse = request.reverse;
    Json params = request.params.is_object() ? request.params : Json::object();

    if (!request.continuation_token.empty()) {
        ChunkedResult failure;
        if (!resolve_token(request.continuation_token, TokenKind::DIRECTORY_LIST, request.path, token, failure)) {
            return failure;
        }
        chunk_index = token.chunk_index + 1;
        params = token.params;
        consumed = &token;

        page_size = effective_cap(replayed_size(params, "page_size", page_size), DEFAULT_PAGE_SIZE, MAX_PAGE_SIZE);
        pattern = replayed_string(params, "pattern", pattern);
        show_hidden = replayed_bool(params, "show_hidden", show_hidden);
        reverse = replayed_bool(params, "reverse", reverse);
        if (!parse_directory_sort(replayed_string(params, "sort_by", directory_sort_name(sort_by)), sort_by)) {
            return ChunkedResult::fail("token_mismatch", "Continuation token carries an unknown sort order");
        }
    }
    params["page_size"] = page_size;
    params["pattern"] = pattern;
    params["show_hidden"] = show_hidden;
    params["sort_by"] = directory_sort_name(sort_by);
    params["reverse"] = reverse;

    std::vector<DirEntry> entries;
    std::string error;
    if (!directory_lister_->list(request.path, entries, error)) {
        LOG_ERROR("[ChunkedSession] Listing '%s' failed: %s", request.path.c_str(), error.c_str());
        return ChunkedResult::fail("source_error", error);
    }

    std::vector<DirEntry> visible;
    const std::string needle = to_lower(pattern);
    for (size_t i = 0; i < entries.size(); ++i) {
        const DirEntry& entry = entries[i];
        if (!show_hidden && starts_with(entry.name, ".")) continue;
        if (!needle.empty() && to_lower(entry.name).find(needle) == std::string::npos) continue;
        visible.push_back(entry);
    }

    std::stable_sort(visible.begin(), visible.end(), [sort_by, reverse](const DirEntry& a, const DirEntry& b) {
        int cmp = sort_by == DirectorySort::TYPE ? a.type.compare(b.type) : a.name.compare(b.name);
        return reverse ? cmp > 0 : cmp < 0;
    });

    size_t start = 0;
    if (consumed) {
        const DirectoryCursor& cursor = std::get<DirectoryCursor>(token.cursor);
        bool found = false;
        for (size_t i = 0; i < visible.size(); ++i) {
            if (visible[i].name == cursor.last_item) {
                start = i + 1;
                found = true;
                break;
            }
        }
        if (!found) {
            LOG_WARN("[ChunkedSession] '%s' vanished from '%s' between pages",
                     cursor.last_item.c_str(), request.path.c_str());
            return ChunkedResult::fail("cursor_stale",
                                       "Directory '" + request.path + "' changed since the last page");
        }
    }

    // At most one page is offered to the budget
    size_t window_end = std::min(visible.size(), start + page_size);
    std::vector<DirEntry> pending(visible.begin() + static_cast<std::ptrdiff_t>(start),
                                  visible.begin() + static_cast<std::ptrdiff_t>(window_end));

    SizeMonitor monitor(config_);
    SequenceChunk<DirEntry> chunk = engine_.chunk_sequence(pending, monitor, dir_entry_to_json);
    bool has_more = start + chunk.items.size() < visible.size();

    if (has_more && chunk.items.empty()) {
        return non_progress("Entry '" + pending[0].name + "'", request.path);
    }

    DirectoryCursor next;
    next.page = chunk_index;
    if (!chunk.items.empty()) {
        next.last_item = chunk.items.back().name;
    }
    std::string next_id = advance(consumed, has_more, TokenKind::DIRECTORY_LIST, request.path,
                                  next, params, chunk_index);

    Json listed = Json::array();
    for (size_t i = 0; i < chunk.items.size(); ++i) {
        listed.push_back(dir_entry_to_json(chunk.items[i]));
    }

    Json payload;
    payload["entries"] = listed;
    payload["path"] = request.path;
    payload["total_entries"] = visible.size();
    payload["page_size"] = page_size;
    payload["total_pages"] = (visible.size() + page_size - 1) / page_size;
    payload["sort_by"] = directory_sort_name(sort_by);
    payload["reverse"] = reverse;
    payload["timestamp"] = format_timestamp_ms(current_timestamp_ms());

    size_t total = extrapolate_total(chunk_index, has_more, visible.size() - start, chunk.items.size());
    return ChunkedResult::ok(
        ResponseAssembler::assemble(payload, has_more, monitor, next_id, chunk_index, total),
        next_id);
}

// ============================================================================
// Search results
// ============================================================================

ChunkedResult ChunkedSession::search(const SearchRequest& request) {
    if (request.kind != TokenKind::CONTENT_SEARCH && request.kind != TokenKind::FILENAME_SEARCH) {
        return ChunkedResult::fail("invalid_request", "Search kind must be search_code or search_files");
    }
    if (!search_source_) {
        return ChunkedResult::fail("source_unavailable", "No search source configured");
    }

    ContinuationToken token;
    const ContinuationToken* consumed = nullptr;
    size_t chunk_index = 1;
    std::string query = request.query;
    Json params = request.params.is_object() ? request.params : Json::object();

    if (!request.continuation_token.empty()) {
        ChunkedResult failure;
        if (!resolve_token(request.continuation_token, request.kind, request.path, token, failure)) {
            return failure;
        }
        std::string original_query = token.params.value("query", std::string());
        if (!query.empty() && query != original_query) {
            return ChunkedResult::fail("token_mismatch", "Continuation token was issued for another query");
        }
        query = original_query;
        chunk_index = token.chunk_index + 1;
        params = token.params;
        consumed = &token;
    }
    if (query.empty()) {
        return ChunkedResult::fail("invalid_request", "Search query is empty");
    }
    params["query"] = query;

    std::vector<SearchMatch> matches;
    std::string error;
    if (!search_source_->search(request.path, query, request.kind, matches, error)) {
        LOG_ERROR("[ChunkedSession] Search '%s' in '%s' failed: %s",
                  query.c_str(), request.path.c_str(), error.c_str());
        return ChunkedResult::fail("source_error", error);
    }

    size_t start = 0;
    if (consumed) {
        const SearchCursor& cursor = std::get<SearchCursor>(token.cursor);
        start = cursor.file_index;
        bool still_valid = start <= matches.size();
        if (still_valid && start > 0) {
            const SearchMatch& last = matches[start - 1];
            still_valid = last.file == cursor.last_file && last.line == cursor.last_position;
        }
        if (!still_valid) {
            LOG_WARN("[ChunkedSession] Search results for '%s' shifted since match %zu",
                     query.c_str(), start);
            return ChunkedResult::fail("cursor_stale", "Search results changed since the last chunk");
        }
    }

    std::vector<SearchMatch> pending(matches.begin() + static_cast<std::ptrdiff_t>(start), matches.end());

    SizeMonitor monitor(config_);
    SequenceChunk<SearchMatch> chunk = engine_.chunk_sequence(pending, monitor, search_match_to_json);

    if (chunk.has_more && chunk.items.empty()) {
        return non_progress("Match in '" + pending[0].file + "'", request.path);
    }

    SearchCursor next;
    next.file_index = start + chunk.items.size();
    if (!chunk.items.empty()) {
        next.last_file = chunk.items.back().file;
        next.last_position = chunk.items.back().line;
    }
    std::string next_id = advance(consumed, chunk.has_more, request.kind, request.path,
                                  next, params, chunk_index);

    Json found = Json::array();
    for (size_t i = 0; i < chunk.items.size(); ++i) {
        found.push_back(search_match_to_json(chunk.items[i]));
    }

    Json payload;
    payload["matches"] = found;
    payload["query"] = query;
    payload["path"] = request.path;
    payload["total_matches"] = matches.size();

    size_t total = extrapolate_total(chunk_index, chunk.has_more, pending.size(), chunk.items.size());
    return ChunkedResult::ok(
        ResponseAssembler::assemble(payload, chunk.has_more, monitor, next_id, chunk_index, total),
        next_id);
}

} // namespace chunkguard
