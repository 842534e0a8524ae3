/*
Bilocator: Logging Configuration Tests
Role: Verify YAML-driven logger setup and its error reporting
Testing Strategy: Write small config files to the gtest temp dir and apply them
Coverage: Missing file, unknown sink, valid config, no-op before init
*/
#include <gtest/gtest.h>

#include <fstream>
#include <string>

#include "logging.hpp"

namespace {

std::string writeConfig(const std::string& name, const std::string& body)
{
    const std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << body;
    return path;
}

} // namespace

class LoggingTest : public ::testing::Test {
protected:
    void TearDown() override { (void)logging::Logger::instance().shutdown(); }
};

// =============================================================================
// Configuration
// =============================================================================

TEST_F(LoggingTest, LoggingBeforeInitIsNoOp) {
    EXPECT_FALSE(logging::Logger::instance().initialized());
    LOG_INFO("Test", "dropped {}", 1);
}

TEST_F(LoggingTest, MissingConfigFileIsInvalidArgument) {
    auto result = logging::init(logging::Type::SpdLog, ::testing::TempDir() + "does_not_exist.yaml");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.code(), ResultCode::InvalidArgument);
}

TEST_F(LoggingTest, UnknownSinkTypeIsInvalidArgument) {
    auto path = writeConfig("bilocator_bad_sink.yaml",
        "log:\n"
        "  \"*\":\n"
        "    level: info\n"
        "    sinks:\n"
        "      - type: carrier_pigeon\n");

    auto result = logging::init(logging::Type::SpdLog, path);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.code(), ResultCode::InvalidArgument);
}

TEST_F(LoggingTest, ValidConfigApplies) {
    auto path = writeConfig("bilocator_logging.yaml",
        "log:\n"
        "  \"*\":\n"
        "    level: warn\n"
        "    sinks:\n"
        "      - type: console\n"
        "  Registry:\n"
        "    level: debug\n");

    auto result = logging::init(logging::Type::SpdLog, path);
    ASSERT_TRUE(result) << result.c_str();
    EXPECT_TRUE(logging::Logger::instance().initialized());
    EXPECT_TRUE(logging::Logger::instance().disableTag("Registry"));
    LOG_INFO("Registry", "suppressed");
}

TEST_F(LoggingTest, ConsoleBackendWithoutConfig) {
    ASSERT_TRUE(logging::Logger::instance().init(logging::Type::Console));
    EXPECT_TRUE(logging::Logger::instance().setLevel("Test", logging::Level::Debug));
    LOG_DEBUG("Test", "console {}", "ok");
}

TEST(LoggingLevel, ParsesLevelNames) {
    EXPECT_EQ(logging::Logger::toLevel("debug"), logging::Level::Debug);
    EXPECT_EQ(logging::Logger::toLevel("warn"), logging::Level::Warn);
    EXPECT_EQ(logging::Logger::toLevel("nonsense"), logging::Level::Off);
}
