#include "als/parser/timestamp.hpp"
#include "als/store/sqlite_session_store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>

namespace fs = std::filesystem;
using als::ErrorCode;
using als::store::SqliteSessionStore;
using namespace als::parser;

namespace {

fs::path create_temp_dir(const std::string& prefix) {
    static std::atomic<uint64_t> counter{0};
    auto dir = fs::temp_directory_path() / fs::path(prefix + std::to_string(counter.fetch_add(1)));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

ParsedSession make_session(const std::string& id) {
    ParsedSession s;
    s.id = id;
    s.project = "my_app";
    s.machine = "laptop";
    s.agent = AgentType::Codex;
    s.first_message = "hello";
    s.started_at = parse_timestamp("2024-01-15T10:00:00Z");
    s.ended_at = parse_timestamp("2024-01-15T10:05:00.25Z");
    s.message_count = 2;
    s.user_message_count = 1;
    s.parent_session_id = "parent";
    s.token_usage = TokenUsage{100, 50, 10, 200};
    s.mcp_servers = {"github", "slack"};
    s.file_path = "/logs/a.jsonl";
    s.file_size = 1234;
    s.file_mtime = 1705312800000000000;
    s.file_hash = "deadbeef";
    return s;
}

std::vector<ParsedMessage> make_messages() {
    ParsedMessage user;
    user.ordinal = 0;
    user.role = Role::User;
    user.content = "hello";
    user.content_length = 5;
    user.timestamp = parse_timestamp("2024-01-15T10:00:00Z");

    ParsedMessage assistant;
    assistant.ordinal = 1;
    assistant.role = Role::Assistant;
    assistant.content = "[Read: /a]";
    assistant.content_length = 10;
    assistant.has_tool_use = true;
    assistant.has_thinking = true;
    ParsedToolCall call;
    call.tool_use_id = "toolu_1";
    call.tool_name = "Read";
    call.category = "Read";
    call.input_json = R"({"file_path":"/a"})";
    call.result_content = "contents";
    call.result_content_length = 8;
    assistant.tool_calls.push_back(call);

    return {user, assistant};
}

} // namespace

class SqliteSessionStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = create_temp_dir("als_sqlite_test");
        auto opened = SqliteSessionStore::open(dir_ / "nested" / "sessions.db");
        ASSERT_TRUE(opened.is_ok()) << opened.error().message;
        store_ = std::move(opened.value());
    }

    void TearDown() override {
        store_.reset();
        fs::remove_all(dir_);
    }

    fs::path dir_;
    std::unique_ptr<SqliteSessionStore> store_;
};

TEST_F(SqliteSessionStoreTest, CreatesParentDirectories) {
    EXPECT_TRUE(fs::exists(dir_ / "nested" / "sessions.db"));
}

TEST_F(SqliteSessionStoreTest, SessionRoundTripsAllFields) {
    ASSERT_TRUE(store_->write_session(make_session("s1"), make_messages()).is_ok());

    auto full = store_->get_session_full("s1");
    ASSERT_TRUE(full.is_ok()) << full.error().message;
    ASSERT_TRUE(full.value().has_value());
    const auto& s = *full.value();
    EXPECT_EQ(s.project, "my_app");
    EXPECT_EQ(s.machine, "laptop");
    EXPECT_EQ(s.agent, AgentType::Codex);
    EXPECT_EQ(s.first_message, "hello");
    EXPECT_EQ(s.started_at, parse_timestamp("2024-01-15T10:00:00Z"));
    EXPECT_EQ(s.ended_at, parse_timestamp("2024-01-15T10:05:00.25Z"));
    EXPECT_EQ(s.message_count, 2);
    EXPECT_EQ(s.user_message_count, 1);
    EXPECT_EQ(s.parent_session_id, "parent");
    EXPECT_EQ(s.token_usage, (TokenUsage{100, 50, 10, 200}));
    EXPECT_EQ(s.mcp_servers, (std::vector<std::string>{"github", "slack"}));
    EXPECT_EQ(s.file_path, "/logs/a.jsonl");
    EXPECT_EQ(s.file_size, 1234);
    EXPECT_EQ(s.file_mtime, 1705312800000000000);
    EXPECT_EQ(s.file_hash, "deadbeef");
}

TEST_F(SqliteSessionStoreTest, MessagesCarryToolCalls) {
    ASSERT_TRUE(store_->write_session(make_session("s1"), make_messages()).is_ok());

    auto msgs = store_->get_all_messages("s1");
    ASSERT_TRUE(msgs.is_ok()) << msgs.error().message;
    ASSERT_EQ(msgs.value().size(), 2u);

    const auto& assistant = msgs.value()[1];
    EXPECT_EQ(assistant.role, Role::Assistant);
    EXPECT_TRUE(assistant.has_tool_use);
    EXPECT_TRUE(assistant.has_thinking);
    EXPECT_TRUE(is_zero(assistant.timestamp));
    ASSERT_EQ(assistant.tool_calls.size(), 1u);
    EXPECT_EQ(assistant.tool_calls[0].tool_use_id, "toolu_1");
    EXPECT_EQ(assistant.tool_calls[0].result_content, "contents");
    EXPECT_EQ(assistant.tool_calls[0].result_content_length, 8u);
    EXPECT_TRUE(msgs.value()[0].tool_calls.empty());
}

TEST_F(SqliteSessionStoreTest, FileInfo) {
    auto none = store_->get_session_file_info("s1");
    ASSERT_TRUE(none.is_ok());
    EXPECT_FALSE(none.value().has_value());

    ASSERT_TRUE(store_->write_session(make_session("s1"), {}).is_ok());
    auto info = store_->get_session_file_info("s1");
    ASSERT_TRUE(info.is_ok() && info.value().has_value());
    EXPECT_EQ(info.value()->size, 1234);
    EXPECT_EQ(info.value()->hash, "deadbeef");
}

TEST_F(SqliteSessionStoreTest, RewriteReplacesMessagesAndKeepsOneRow) {
    ASSERT_TRUE(store_->write_session(make_session("s1"), make_messages()).is_ok());

    auto shorter = make_messages();
    shorter.resize(1);
    auto session = make_session("s1");
    session.message_count = 1;
    ASSERT_TRUE(store_->write_session(session, shorter).is_ok());

    EXPECT_EQ(store_->session_count().value(), 1u);
    auto msgs = store_->get_all_messages("s1");
    ASSERT_TRUE(msgs.is_ok());
    EXPECT_EQ(msgs.value().size(), 1u);
}

TEST_F(SqliteSessionStoreTest, FailedWriteRollsBack) {
    ASSERT_TRUE(store_->write_session(make_session("s1"), make_messages()).is_ok());

    // duplicate ordinals violate the primary key
    auto bad = make_messages();
    bad[1].ordinal = 0;
    auto session = make_session("s1");
    session.file_hash = "changed";
    auto r = store_->write_session(session, bad);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code, ErrorCode::Persistence);

    EXPECT_EQ(store_->get_session_file_info("s1").value()->hash, "deadbeef");
    EXPECT_EQ(store_->get_all_messages("s1").value().size(), 2u);
}

TEST_F(SqliteSessionStoreTest, EmptyValuesStoredAsNull) {
    auto session = make_session("s1");
    session.first_message.clear();
    session.started_at = Timestamp{};
    session.mcp_servers.clear();
    ASSERT_TRUE(store_->write_session(session, {}).is_ok());

    auto full = store_->get_session_full("s1");
    ASSERT_TRUE(full.is_ok() && full.value().has_value());
    EXPECT_EQ(full.value()->first_message, "");
    EXPECT_TRUE(is_zero(full.value()->started_at));
    EXPECT_TRUE(full.value()->mcp_servers.empty());
}

TEST_F(SqliteSessionStoreTest, DeleteSession) {
    ASSERT_TRUE(store_->write_session(make_session("s1"), make_messages()).is_ok());

    ASSERT_TRUE(store_->delete_session("s1").is_ok());
    EXPECT_EQ(store_->session_count().value(), 0u);
    EXPECT_TRUE(store_->get_all_messages("s1").value().empty());

    auto again = store_->delete_session("s1");
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().code, ErrorCode::NotFound);
}

TEST_F(SqliteSessionStoreTest, ReopenSeesData) {
    ASSERT_TRUE(store_->write_session(make_session("s1"), make_messages()).is_ok());
    store_.reset();

    auto reopened = SqliteSessionStore::open(dir_ / "nested" / "sessions.db");
    ASSERT_TRUE(reopened.is_ok());
    EXPECT_EQ(reopened.value()->session_count().value(), 1u);
}

TEST(SqliteSessionStoreOpenTest, UnwritableLocationFails) {
    auto opened = SqliteSessionStore::open("/proc/als-cannot-create/sessions.db");
    ASSERT_TRUE(opened.is_error());
    EXPECT_EQ(opened.error().code, ErrorCode::Persistence);
}
