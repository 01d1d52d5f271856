#include "core/logging.hpp"
#include "core/import_config.hpp"

#include <gtest/gtest.h>

#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/ostream_sink.h>

using namespace voxel_stack::logging;

TEST(LoggingTest, LevelToString) {
    EXPECT_EQ(toString(LogLevel::Trace), "trace");
    EXPECT_EQ(toString(LogLevel::Debug), "debug");
    EXPECT_EQ(toString(LogLevel::Info), "info");
    EXPECT_EQ(toString(LogLevel::Warning), "warning");
    EXPECT_EQ(toString(LogLevel::Error), "error");
    EXPECT_EQ(toString(LogLevel::Critical), "critical");
    EXPECT_EQ(toString(LogLevel::Off), "off");
}

TEST(LoggingTest, LevelFromString) {
    EXPECT_EQ(logLevelFromString("trace"), LogLevel::Trace);
    EXPECT_EQ(logLevelFromString("warning"), LogLevel::Warning);
    EXPECT_EQ(logLevelFromString("off"), LogLevel::Off);
    EXPECT_EQ(logLevelFromString("unknown"), LogLevel::Info);
}

TEST(LoggingTest, LevelRoundTrip) {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warning,
                       LogLevel::Error, LogLevel::Critical, LogLevel::Off}) {
        EXPECT_EQ(logLevelFromString(toString(level)), level);
    }
}

TEST(LoggingTest, ConfigValidation) {
    LogConfig config;
    EXPECT_TRUE(config.isValid());

    config.enableFileLogging = true;
    EXPECT_FALSE(config.isValid());
    EXPECT_FALSE(LoggerFactory::configure(config));

    config.logDirectory = "/tmp";
    config.maxFiles = 0;
    EXPECT_FALSE(config.isValid());
}

TEST(LoggingTest, CreateReturnsSameNamedLogger) {
    auto first = LoggerFactory::create("LoggingTest");
    auto second = LoggerFactory::create("LoggingTest");

    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first->name(), "LoggingTest");
}

TEST(LoggingTest, ConfigureAppliesToExistingLoggers) {
    auto logger = LoggerFactory::create("LoggingConfigureTest");
    const auto previous = LoggerFactory::getGlobalLevel();

    auto json = nlohmann::json::parse(R"({"log": {"level": "error"}})");
    auto config = voxel_stack::core::importConfigFromJson(json);
    ASSERT_TRUE(config.has_value());

    ASSERT_TRUE(LoggerFactory::configure(config->log));
    EXPECT_TRUE(LoggerFactory::isConfigured());
    EXPECT_EQ(LoggerFactory::getGlobalLevel(), LogLevel::Error);
    EXPECT_EQ(logger->level(), spdlog::level::err);

    LoggerFactory::setGlobalLevel(previous);
    EXPECT_EQ(logger->level(), static_cast<spdlog::level::level_enum>(previous));
}

TEST(LoggingTest, AddedSinkCapturesOutput) {
    auto logger = LoggerFactory::create("LoggingSinkTest");

    std::ostringstream output;
    auto capture = std::make_shared<spdlog::sinks::ostream_sink_mt>(output);
    LoggerFactory::addSink(capture);
    capture->set_pattern("%n: %v");

    logger->warn("captured message");
    LoggerFactory::create("LoggingLaterSinkTest")->warn("later logger");
    LoggerFactory::removeSink(capture);
    logger->warn("not captured");

    const auto text = output.str();
    EXPECT_NE(text.find("LoggingSinkTest: captured message"), std::string::npos);
    EXPECT_NE(text.find("LoggingLaterSinkTest: later logger"), std::string::npos);
    EXPECT_EQ(text.find("not captured"), std::string::npos);
}
