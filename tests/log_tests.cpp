#include <gtest/gtest.h>

#include <string>

#include "tests/harness/temp_tree.hpp"
#include "util/log.hpp"

namespace {

TEST(LogTest, LevelFromString) {
    util::LogLevel lvl = util::LogLevel::Info;
    EXPECT_TRUE(util::level_from_string("debug", lvl));
    EXPECT_EQ(lvl, util::LogLevel::Debug);
    EXPECT_TRUE(util::level_from_string("error", lvl));
    EXPECT_EQ(lvl, util::LogLevel::Error);
    EXPECT_FALSE(util::level_from_string("DEBUG", lvl));
    EXPECT_FALSE(util::level_from_string("", lvl));
    EXPECT_EQ(lvl, util::LogLevel::Error);
}

// Records below the minimum level are dropped from the mirror too
TEST(LogTest, MirrorFileHonoursMinLevel) {
    test::TempTree tree("log_mirror");
    const auto path = tree.root() / "cycle.log";
    const auto saved = util::min_level();

    ASSERT_TRUE(util::set_mirror_file(path.string()));
    util::set_min_level(util::LogLevel::Warn);
    util::log(util::LogLevel::Info, "dropped %d", 1);
    util::log(util::LogLevel::Warn, "kept %s", "warning");
    util::log(util::LogLevel::Error, "kept error %d", 42);
    ASSERT_TRUE(util::set_mirror_file(""));
    util::set_min_level(saved);

    const auto text = test::read_file(path);
    EXPECT_EQ(text.find("dropped"), std::string::npos);
    EXPECT_NE(text.find("WARN: kept warning"), std::string::npos);
    EXPECT_NE(text.find("ERROR: kept error 42"), std::string::npos);
}

TEST(LogTest, MirrorOpenFailure) {
    EXPECT_FALSE(util::set_mirror_file("/nonexistent-dir/hydrocast/cycle.log"));
    EXPECT_TRUE(util::set_mirror_file(""));
}

} // namespace
