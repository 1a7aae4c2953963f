#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "common/log.hpp"

using namespace nonorec;

// ─── Logging ───────────────────────────────────────────────────

TEST(CommonTest, ParseLevelIsCaseInsensitive) {
    EXPECT_EQ(log::parseLevel("DEBUG"), log::Level::Debug);
    EXPECT_EQ(log::parseLevel("Warn"), log::Level::Warning);
    EXPECT_EQ(log::parseLevel("warning"), log::Level::Warning);
    EXPECT_EQ(log::parseLevel("error"), log::Level::Error);
    EXPECT_EQ(log::parseLevel("verbose"), log::Level::Info);
    EXPECT_EQ(log::parseLevel(nullptr), log::Level::Info);
}

TEST(CommonTest, MinLevelSuppressesLowerLevels) {
    log::Level saved = log::minLevel();
    log::setMinLevel(log::Level::Error);
    EXPECT_EQ(log::minLevel(), log::Level::Error);

    testing::internal::CaptureStderr();
    NONOREC_LOG_INFO("hidden %d", 1);
    NONOREC_LOG_ERROR("shown %d", 2);
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(err.find("hidden"), std::string::npos);
    EXPECT_NE(err.find("ERROR: shown 2"), std::string::npos);
    log::setMinLevel(saved);
}

TEST(CommonTest, LevelNames) {
    EXPECT_STREQ(log::toString(log::Level::Warning), "WARN");
    EXPECT_STREQ(log::toString(log::Level::Debug), "DEBUG");
}

// ─── Errors ────────────────────────────────────────────────────

TEST(CommonTest, ErrorsAreRuntimeErrors) {
    try {
        throw ConfigError("missing required column 'Size'");
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "missing required column 'Size'");
    }
    EXPECT_THROW(throw IoError("cannot open"), std::runtime_error);
}
