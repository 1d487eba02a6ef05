// =============================================================================
// Continuation Token Store Tests
// =============================================================================

#include <gtest/gtest.h>
#include <chunkguard/chunking/token_store.hpp>
#include <chunkguard/core/config.hpp>
#include <chunkguard/core/utils.hpp>

#include <memory>
#include <set>
#include <stdexcept>
#include <string>

using namespace chunkguard;

static const int64_t kMinute = 60 * 1000;

class TokenStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        now_ = 1700000000000LL;
        store_.reset(new TokenStore(TokenStore::DEFAULT_TTL_MS, [this]() { return now_; }));
    }

    std::string issue_file(size_t line) {
        Json params;
        params["path"] = "/tmp/a.txt";
        params["encoding"] = "utf-8";
        return store_->issue(TokenKind::FILE_READ, "/tmp/a.txt", FileReadCursor::at_line(line), params);
    }

    int64_t now_;
    std::unique_ptr<TokenStore> store_;
};

TEST_F(TokenStoreTest, IssueThenGetRoundTrips) {
    Json params;
    params["query"] = "needle";
    params["case_sensitive"] = false;
    SearchCursor cursor;
    cursor.last_file = "src/main.cpp";
    cursor.last_position = 42;
    cursor.file_index = 7;

    std::string id = store_->issue(TokenKind::CONTENT_SEARCH, "/src", cursor, params, 3);

    ContinuationToken token;
    ASSERT_TRUE(store_->get(id, token));
    EXPECT_EQ(token.id, id);
    EXPECT_EQ(token.kind, TokenKind::CONTENT_SEARCH);
    EXPECT_EQ(token.target_path, "/src");
    EXPECT_EQ(token.params, params);
    EXPECT_EQ(token.created_at, now_);
    EXPECT_EQ(token.chunk_index, 3u);

    const SearchCursor& stored = std::get<SearchCursor>(token.cursor);
    EXPECT_EQ(stored.last_file, "src/main.cpp");
    EXPECT_EQ(stored.last_position, 42u);
    EXPECT_EQ(stored.file_index, 7u);
}

TEST_F(TokenStoreTest, IdCarriesKindAndTime) {
    std::string id = issue_file(0);
    EXPECT_TRUE(starts_with(id, "read_file_1700000000000_")) << id;
}

TEST_F(TokenStoreTest, IdsAreUniqueWithinTheSameMillisecond) {
    std::set<std::string> ids;
    for (int i = 0; i < 200; ++i) {
        ids.insert(issue_file(static_cast<size_t>(i)));
    }
    EXPECT_EQ(ids.size(), 200u);
    EXPECT_EQ(store_->active_count(), 200u);
}

TEST_F(TokenStoreTest, ExpiresAfterTtl) {
    const int64_t start = now_;
    std::string old_id = issue_file(10);
    now_ = start + 20 * kMinute;
    std::string young_id = issue_file(20);

    ContinuationToken token;
    now_ = start + 29 * kMinute;
    EXPECT_TRUE(store_->get(old_id, token));
    EXPECT_EQ(store_->active_count(), 2u);

    now_ = start + 31 * kMinute;
    EXPECT_FALSE(store_->get(old_id, token));
    EXPECT_EQ(store_->active_count(), 1u);
    EXPECT_TRUE(store_->get(young_id, token));
}

TEST_F(TokenStoreTest, ExpiresExactlyAtTtl) {
    std::string id = issue_file(1);
    now_ += TokenStore::DEFAULT_TTL_MS;
    ContinuationToken token;
    EXPECT_FALSE(store_->get(id, token));
}

TEST_F(TokenStoreTest, IssueSweepsExpiredTokens) {
    const int64_t start = now_;
    std::string stale = issue_file(1);

    now_ = start + 31 * kMinute;
    issue_file(2);

    // Back inside the old token's lifetime: it must already be gone
    now_ = start;
    ContinuationToken token;
    EXPECT_FALSE(store_->get(stale, token));
    EXPECT_EQ(store_->active_count(), 1u);
}

TEST_F(TokenStoreTest, UpdateMergesOnlySuppliedFields) {
    DirectoryCursor cursor;
    cursor.page = 1;
    cursor.last_item = "alpha";
    Json params;
    params["a"] = 1;
    params["b"] = 2;
    std::string id = store_->issue(TokenKind::DIRECTORY_LIST, "/d", cursor, params);

    TokenUpdate changes;
    changes.page = 2;
    changes.params["b"] = 3;
    changes.params["c"] = 4;
    ASSERT_TRUE(store_->update(id, changes));

    ContinuationToken token;
    ASSERT_TRUE(store_->get(id, token));
    const DirectoryCursor& stored = std::get<DirectoryCursor>(token.cursor);
    EXPECT_EQ(stored.page, 2u);
    EXPECT_EQ(stored.last_item, "alpha");
    EXPECT_EQ(token.target_path, "/d");
    EXPECT_EQ(token.params["a"], 1);
    EXPECT_EQ(token.params["b"], 3);
    EXPECT_EQ(token.params["c"], 4);
    EXPECT_EQ(token.created_at, now_);
}

TEST_F(TokenStoreTest, UpdateSwitchesFileReadMode) {
    std::string id = issue_file(5);

    TokenUpdate changes;
    changes.byte_offset = 4096;
    ASSERT_TRUE(store_->update(id, changes));

    ContinuationToken token;
    ASSERT_TRUE(store_->get(id, token));
    const FileReadCursor& cursor = std::get<FileReadCursor>(token.cursor);
    EXPECT_EQ(cursor.mode, FileReadMode::BYTES);
    EXPECT_EQ(cursor.byte_offset, 4096u);
}

TEST_F(TokenStoreTest, UpdateIgnoresFieldsOfOtherKinds) {
    std::string id = issue_file(5);

    TokenUpdate changes;
    changes.page = 9;
    changes.last_file = "x";
    changes.chunk_index = 4;
    ASSERT_TRUE(store_->update(id, changes));

    ContinuationToken token;
    ASSERT_TRUE(store_->get(id, token));
    const FileReadCursor& cursor = std::get<FileReadCursor>(token.cursor);
    EXPECT_EQ(cursor.mode, FileReadMode::LINES);
    EXPECT_EQ(cursor.line_start, 5u);
    EXPECT_EQ(token.chunk_index, 4u);
}

TEST_F(TokenStoreTest, UpdateUnknownOrExpired) {
    TokenUpdate changes;
    changes.line_start = 1;
    EXPECT_FALSE(store_->update("read_file_0_missing", changes));

    std::string id = issue_file(1);
    now_ += 31 * kMinute;
    EXPECT_FALSE(store_->update(id, changes));

    now_ -= 31 * kMinute;
    ContinuationToken token;
    EXPECT_FALSE(store_->get(id, token));
}

TEST_F(TokenStoreTest, RemoveInvalidates) {
    std::string id = issue_file(1);
    EXPECT_TRUE(store_->remove(id));
    EXPECT_FALSE(store_->remove(id));

    ContinuationToken token;
    EXPECT_FALSE(store_->get(id, token));
    EXPECT_EQ(store_->active_count(), 0u);
}

TEST_F(TokenStoreTest, Clear) {
    issue_file(1);
    issue_file(2);
    store_->clear();
    EXPECT_EQ(store_->active_count(), 0u);
}

TEST_F(TokenStoreTest, RejectsCursorOfAnotherKind) {
    EXPECT_THROW(store_->issue(TokenKind::DIRECTORY_LIST, "/d", FileReadCursor(), Json::object()),
                 std::invalid_argument);
    EXPECT_EQ(store_->active_count(), 0u);
}

TEST(TokenStoreConfigTest, RejectsNonPositiveTtl) {
    EXPECT_THROW(TokenStore(0), std::invalid_argument);
    EXPECT_THROW(TokenStore(-5), std::invalid_argument);
}

TEST(TokenStoreConfigTest, TtlComesFromChunkingConfig) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"tokens": {"ttl_minutes": 1}})"));
    ChunkingConfig config = ChunkingConfig::from_config(cfg);

    int64_t now = 1700000000000LL;
    TokenStore store(config, [&now]() { return now; });
    EXPECT_EQ(store.ttl_ms(), kMinute);

    std::string id = store.issue(TokenKind::FILE_READ, "f", FileReadCursor::at_line(0), Json::object());
    ContinuationToken token;
    now += kMinute - 1000;
    EXPECT_TRUE(store.get(id, token));

    now += 1000;
    EXPECT_FALSE(store.get(id, token));
}

TEST(TokenStoreConfigTest, RejectsConfigWithoutTtl) {
    ChunkingConfig config;
    config.token_ttl_ms = 0;
    EXPECT_THROW(TokenStore store(config), std::invalid_argument);
}

TEST(TokenStoreConfigTest, WallClockByDefault) {
    TokenStore store;
    int64_t before = current_timestamp_ms();
    std::string id = store.issue(TokenKind::FILE_READ, "f", FileReadCursor::at_byte(0), Json::object());

    ContinuationToken token;
    ASSERT_TRUE(store.get(id, token));
    EXPECT_GE(token.created_at, before);
    EXPECT_LE(token.created_at, current_timestamp_ms());
}

// =============================================================================
// Serialized form
// =============================================================================

TEST(ContinuationTokenJsonTest, SearchTokenFields) {
    ContinuationToken token;
    token.id = "search_code_1_abc";
    token.kind = TokenKind::CONTENT_SEARCH;
    token.target_path = "/src";
    token.created_at = 1234;
    token.chunk_index = 2;
    token.params["query"] = "TODO";
    SearchCursor cursor;
    cursor.last_file = "a.cpp";
    cursor.last_position = 10;
    cursor.file_index = 3;
    token.cursor = cursor;

    Json j = token_to_json(token);
    EXPECT_EQ(j["kind"], "search_code");
    EXPECT_EQ(j["target_path"], "/src");
    EXPECT_EQ(j["id"], "search_code_1_abc");
    EXPECT_FALSE(j.contains("type"));
    EXPECT_EQ(j["created_at"], 1234);
    EXPECT_EQ(j["last_file"], "a.cpp");
    EXPECT_EQ(j["file_index"], 3);
    EXPECT_FALSE(j.contains("line_start"));

    ContinuationToken parsed;
    ASSERT_TRUE(token_from_json(Json::parse(j.dump()), parsed));
    EXPECT_EQ(parsed.kind, TokenKind::CONTENT_SEARCH);
    EXPECT_EQ(parsed.params, token.params);
    EXPECT_EQ(std::get<SearchCursor>(parsed.cursor).last_position, 10u);
}

TEST(ContinuationTokenJsonTest, FileReadWritesOnlyItsMode) {
    ContinuationToken token;
    token.id = "read_file_1_x";
    token.cursor = FileReadCursor::at_byte(512);
    Json j = token_to_json(token);
    EXPECT_EQ(j["byte_offset"], 512);
    EXPECT_FALSE(j.contains("line_start"));
}

TEST(ContinuationTokenJsonTest, RejectsMalformed) {
    ContinuationToken out;
    out.id = "untouched";

    Json unknown_kind = {{"kind", "teleport"}, {"target_path", "/"}, {"id", "x"}, {"created_at", 1}};
    EXPECT_FALSE(token_from_json(unknown_kind, out));

    Json missing_cursor = {{"kind", "list_directory"}, {"target_path", "/"}, {"id", "x"}, {"created_at", 1}};
    EXPECT_FALSE(token_from_json(missing_cursor, out));

    Json negative = {{"kind", "read_file"}, {"target_path", "/"}, {"id", "x"}, {"created_at", 1},
                     {"line_start", -4}};
    EXPECT_FALSE(token_from_json(negative, out));

    EXPECT_FALSE(token_from_json(Json::array(), out));
    EXPECT_EQ(out.id, "untouched");
}

TEST(ContinuationTokenJsonTest, ParsesHandWrittenDirectoryToken) {
    Json j = {{"kind", "list_directory"}, {"target_path", "/var/log"}, {"id", "list_directory_5_q"},
              {"created_at", 5}, {"page", 2}, {"last_item", "syslog"}};

    ContinuationToken token;
    ASSERT_TRUE(token_from_json(j, token));
    EXPECT_EQ(token.kind, TokenKind::DIRECTORY_LIST);
    EXPECT_EQ(token.target_path, "/var/log");
    EXPECT_EQ(token.id, "list_directory_5_q");
    EXPECT_EQ(token.chunk_index, 0u);
    EXPECT_TRUE(token.params.empty());
    EXPECT_EQ(std::get<DirectoryCursor>(token.cursor).last_item, "syslog");

    // Other key names are rejected
    Json legacy = {{"type", "list_directory"}, {"path", "/var/log"}, {"chunk_id", "x"},
                   {"created_at", 5}, {"page", 2}, {"last_item", "syslog"}};
    EXPECT_FALSE(token_from_json(legacy, token));
}

TEST(ContinuationTokenJsonTest, KindNames) {
    TokenKind kind = TokenKind::FILE_READ;
    EXPECT_TRUE(kind_from_string("search_files", kind));
    EXPECT_EQ(kind, TokenKind::FILENAME_SEARCH);
    EXPECT_STREQ(kind_to_string(TokenKind::DIRECTORY_LIST), "list_directory");
    EXPECT_FALSE(kind_from_string("read", kind));
}
