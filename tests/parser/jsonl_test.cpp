#include "als/parser/jsonl.hpp"

#include <gtest/gtest.h>

#include <sys/stat.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;
using als::ErrorCode;
using als::parser::get_int;
using nlohmann::json;

TEST(JsonLineTest, SkipsMalformedAndBlankLines) {
    std::istringstream in("{\"a\":1}\n\nnot json\n[1,2]\n{\"a\":2}");
    std::vector<std::int64_t> seen;

    const auto skipped = als::parser::for_each_json_line(
        in, [&seen](const json& record) { seen.push_back(get_int(record, "a")); });

    EXPECT_EQ(skipped, 2u);
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[1], 2);
}

TEST(JsonFieldTest, IntegerKinds) {
    const auto j = json::parse(R"({"i": -42, "f": 12.9, "s": "7", "b": true})");
    EXPECT_EQ(get_int(j, "i"), -42);
    EXPECT_EQ(get_int(j, "f"), 12);
    EXPECT_EQ(get_int(j, "s"), 0);
    EXPECT_EQ(get_int(j, "b"), 0);
    EXPECT_EQ(get_int(j, "missing"), 0);
    EXPECT_EQ(get_int(json::array(), "i"), 0);
}

TEST(JsonFieldTest, OutOfRangeNumbersSaturate) {
    const auto j = json::parse(R"({"huge": 1e30, "tiny": -1e30, "big": 18446744073709551615})");
    EXPECT_EQ(get_int(j, "huge"), std::numeric_limits<std::int64_t>::max());
    EXPECT_EQ(get_int(j, "tiny"), std::numeric_limits<std::int64_t>::min());
    EXPECT_EQ(get_int(j, "big"), std::numeric_limits<std::int64_t>::max());

    json nan_value = {{"n", std::numeric_limits<double>::quiet_NaN()}};
    EXPECT_EQ(get_int(nan_value, "n"), 0);
}

TEST(OpenLogFileTest, RejectsFifo) {
    static std::atomic<uint64_t> counter{0};
    const auto dir = fs::temp_directory_path() / ("als_jsonl_test" + std::to_string(counter.fetch_add(1)));
    fs::remove_all(dir);
    fs::create_directories(dir);
    const auto path = dir / "pipe.jsonl";
    ASSERT_EQ(::mkfifo(path.c_str(), 0644), 0);

    auto opened = als::parser::open_log_file(path);
    ASSERT_TRUE(opened.is_error());
    EXPECT_EQ(opened.error().code, ErrorCode::IOError);

    auto missing = als::parser::open_log_file(dir / "nope.jsonl");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

    fs::remove_all(dir);
}
