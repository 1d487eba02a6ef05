/*
 * chunkguard C++17 - Data Sources
 * 
 * Interfaces for the collaborators that actually produce data. The
 * chunking layer never performs I/O itself; it asks one of these and
 * bounds what comes back.
 */
#ifndef chunkguard_CHUNKING_SOURCES_HPP
#define chunkguard_CHUNKING_SOURCES_HPP

#include <chunkguard/chunking/continuation_token.hpp>
#include <chunkguard/core/json.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace chunkguard {

// ============================================================================
// File contents
// ============================================================================

class FileSource {
public:
    virtual ~FileSource() {}
    
    // Whole file as raw bytes
    virtual bool read_all(const std::string& path, std::string& out, std::string& error) = 0;
};

// ============================================================================
// Directory listings
// ============================================================================

struct DirEntry {
    std::string name;
    std::string type;        // "file", "directory", "symlink", "other"
    uint64_t size;
    int64_t modified_ms;     // Unix ms, 0 when unknown
    
    DirEntry() : size(0), modified_ms(0) {}
    DirEntry(const std::string& n, const std::string& t, uint64_t s, int64_t modified = 0)
        : name(n), type(t), size(s), modified_ms(modified) {}
};

// Files also get "size_readable"; "modified" is ISO 8601 when known
Json dir_entry_to_json(const DirEntry& entry);

class DirectoryLister {
public:
    virtual ~DirectoryLister() {}
    
    // Must return entries in a stable order for resumption to work
    virtual bool list(const std::string& path, std::vector<DirEntry>& out, std::string& error) = 0;
};

// ============================================================================
// Search
// ============================================================================

struct SearchMatch {
    std::string file;
    size_t line;             // 1-based; 0 for filename matches
    std::string text;
    
    SearchMatch() : line(0) {}
    SearchMatch(const std::string& f, size_t l, const std::string& t)
        : file(f), line(l), text(t) {}
};

Json search_match_to_json(const SearchMatch& match);

class SearchSource {
public:
    virtual ~SearchSource() {}
    
    // kind is CONTENT_SEARCH or FILENAME_SEARCH. Matches must come back in
    // a stable order for resumption to work.
    virtual bool search(const std::string& path, const std::string& query, TokenKind kind,
                        std::vector<SearchMatch>& out, std::string& error) = 0;
};

} // namespace chunkguard

#endif // chunkguard_CHUNKING_SOURCES_HPP
