#include "als/hash/hash_store.hpp"

#include <gtest/gtest.h>

#include <sys/stat.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using als::ErrorCode;

namespace {

fs::path create_temp_dir(const std::string& prefix) {
    static std::atomic<uint64_t> counter{0};
    auto dir = fs::temp_directory_path() / fs::path(prefix + std::to_string(counter.fetch_add(1)));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

} // namespace

class HashStoreTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = create_temp_dir("als_hash_test"); }
    void TearDown() override { fs::remove_all(dir_); }

    fs::path dir_;
};

TEST_F(HashStoreTest, KnownDigest) {
    const auto path = dir_ / "hello.txt";
    write_file(path, "hello world");

    auto r = als::hash::digest_file(path);
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(r.value(), "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST_F(HashStoreTest, EmptyFile) {
    const auto path = dir_ / "empty.txt";
    write_file(path, "");

    auto r = als::hash::digest_file(path);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(HashStoreTest, SpansMultipleChunks) {
    const std::string big(200 * 1024, 'x');
    write_file(dir_ / "a.bin", big);
    write_file(dir_ / "b.bin", big);
    write_file(dir_ / "c.bin", big + "y");

    auto a = als::hash::digest_file(dir_ / "a.bin");
    auto b = als::hash::digest_file(dir_ / "b.bin");
    auto c = als::hash::digest_file(dir_ / "c.bin");
    ASSERT_TRUE(a.is_ok() && b.is_ok() && c.is_ok());
    EXPECT_EQ(a.value(), b.value());
    EXPECT_NE(a.value(), c.value());
    EXPECT_EQ(a.value().size(), 64u);
}

TEST_F(HashStoreTest, StreamMatchesFile) {
    write_file(dir_ / "s.txt", "hello world");
    std::istringstream in("hello world");

    auto from_stream = als::hash::digest(in);
    auto from_file = als::hash::digest_file(dir_ / "s.txt");
    ASSERT_TRUE(from_stream.is_ok() && from_file.is_ok());
    EXPECT_EQ(from_stream.value(), from_file.value());
}

TEST_F(HashStoreTest, MissingFileIsNotFound) {
    auto r = als::hash::digest_file(dir_ / "nope.jsonl");
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
    EXPECT_NE(r.error().message.find("opening"), std::string::npos);
}

TEST_F(HashStoreTest, DirectoryIsRejected) {
    auto r = als::hash::digest_file(dir_);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code, ErrorCode::IsADirectory);
    EXPECT_NE(r.error().message.find("hashing"), std::string::npos);
}

TEST_F(HashStoreTest, MissingParentComponentIsNotFound) {
    write_file(dir_ / "plain", "x");

    auto r = als::hash::digest_file(dir_ / "plain" / "child.jsonl");
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
}

TEST_F(HashStoreTest, SymlinkLoopIsIOError) {
    fs::create_symlink(dir_ / "b.jsonl", dir_ / "a.jsonl");
    fs::create_symlink(dir_ / "a.jsonl", dir_ / "b.jsonl");

    auto r = als::hash::digest_file(dir_ / "a.jsonl");
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code, ErrorCode::IOError);
    EXPECT_NE(r.error().message.find("opening"), std::string::npos);
}

TEST_F(HashStoreTest, FifoIsRejectedWithoutBlocking) {
    const auto path = dir_ / "pipe.jsonl";
    ASSERT_EQ(::mkfifo(path.c_str(), 0644), 0);

    auto r = als::hash::digest_file(path);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code, ErrorCode::IOError);
    EXPECT_NE(r.error().message.find("not a regular file"), std::string::npos);
}
