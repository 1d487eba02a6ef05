#include <chunkguard/chunking/sources.hpp>
#include <chunkguard/core/utils.hpp>

namespace chunkguard {

Json dir_entry_to_json(const DirEntry& entry) {
    Json j;
    j["name"] = entry.name;
    j["type"] = entry.type;
    j["size"] = entry.size;
    if (entry.type == "file") {
        j["size_readable"] = format_size(entry.size);
    }
    if (entry.modified_ms > 0) {
        j["modified"] = format_timestamp_ms(entry.modified_ms);
    }
    return j;
}

Json search_match_to_json(const SearchMatch& match) {
    Json j;
    j["file"] = match.file;
    j["line"] = match.line;
    j["text"] = match.text;
    return j;
}

} // namespace chunkguard
