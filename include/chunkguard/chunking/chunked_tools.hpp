/*
 * chunkguard C++17 - Chunked Tools
 * 
 * JSON tool-call front end for ChunkedSession:
 *   read_file       {path, mode?, line_start?, line_count?, start_offset?, max_size?,
 *                    encoding?, continuation_token?}
 *   list_directory  {path, page_size?, pattern?, show_hidden?, sort_by?, reverse?,
 *                    continuation_token?}
 *   search_code     {path, query, continuation_token?}
 *   search_files    {path, query, continuation_token?}
 */
#ifndef chunkguard_CHUNKING_CHUNKED_TOOLS_HPP
#define chunkguard_CHUNKING_CHUNKED_TOOLS_HPP

#include <chunkguard/chunking/chunked_session.hpp>
#include <chunkguard/chunking/token_store.hpp>
#include <chunkguard/core/json.hpp>
#include <string>
#include <vector>

namespace chunkguard {

class ChunkedTools {
public:
    // Both must outlive the tools
    ChunkedTools(ChunkedSession& session, TokenStore& store);
    
    std::vector<std::string> actions() const;
    ChunkedResult execute(const std::string& action, const Json& params);

private:
    ChunkedResult do_read_file(const Json& params);
    ChunkedResult do_list_directory(const Json& params);
    ChunkedResult do_search(TokenKind kind, const Json& params);
    
    ChunkedSession& session_;
    TokenStore& store_;
};

} // namespace chunkguard

#endif // chunkguard_CHUNKING_CHUNKED_TOOLS_HPP
