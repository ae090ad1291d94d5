#include <gtest/gtest.h>

#include <fstream>
#include <memory>
#include <sstream>
#include <string>

#include "logging.hpp"
#include "logger_console.hpp"

namespace {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override { (void)logging::shutdown(); }
    void TearDown() override { (void)logging::shutdown(); }
};

} // namespace

TEST_F(LoggerTest, CallsBeforeInitAreNoOps) {
    LOG_INFO("Test", "dropped {}", 1);
    auto r = logging::Logger::instance().setLevel("Test", logging::Level::Debug);
    EXPECT_EQ(r.code(), ResultCode::InvalidState);
    EXPECT_EQ(logging::apply().code(), ResultCode::InvalidState);
}

TEST_F(LoggerTest, ConsoleBackend) {
    ASSERT_TRUE(logging::init(logging::Type::Console));
    auto& logger = logging::Logger::instance();
    EXPECT_TRUE(logger.setLevel("Test", logging::Level::Debug));
    EXPECT_TRUE(logger.disableTag("Test"));
    EXPECT_TRUE(logger.enableTag("Test"));
    LOG_DEBUG("Test", "value {} and {}", 42, "text");
}

TEST_F(LoggerTest, ToLevel) {
    EXPECT_EQ(logging::Logger::toLevel("trace"), logging::Level::Trace);
    EXPECT_EQ(logging::Logger::toLevel("warn"), logging::Level::Warn);
    EXPECT_EQ(logging::Logger::toLevel("fatal"), logging::Level::Fatal);
    EXPECT_EQ(logging::Logger::toLevel("verbose"), logging::Level::Off);
}

TEST_F(LoggerTest, MissingConfigFile) {
    auto r = logging::init(logging::Type::Console, "/nonexistent/logging.yaml");
    EXPECT_EQ(r.code(), ResultCode::InvalidArgument);
}

TEST_F(LoggerTest, AppliesYamlConfiguration) {
    const std::string path = ::testing::TempDir() + "chatcmd_logger_test.yaml";
    {
        std::ofstream out(path);
        out << "log:\n"
               "  \"*\":\n"
               "    level: warn\n"
               "    sinks:\n"
               "      - type: console\n"
               "  CommandDispatcher:\n"
               "    level: debug\n"
               "  Noisy:\n"
               "    enabled: false\n";
    }
    EXPECT_TRUE(logging::init(logging::Type::Console, path));
    LOG_WARN("CommandDispatcher", "configured from {}", path);
}

TEST_F(LoggerTest, UnsupportedSinkIsReported) {
    const std::string path = ::testing::TempDir() + "chatcmd_logger_file_sink.yaml";
    {
        std::ofstream out(path);
        out << "log:\n"
               "  Tag:\n"
               "    sinks:\n"
               "      - type: file\n"
               "        filename: never_written.log\n";
    }
    // the console backend has no file sink
    EXPECT_EQ(logging::init(logging::Type::Console, path).code(), ResultCode::NotSupported);
}

TEST_F(LoggerTest, ConsoleBackendFiltersByTagLevel) {
    std::ostringstream out;
    auto& logger = logging::Logger::instance();
    ASSERT_TRUE(logger.init(std::make_shared<logging::ConsoleBackend>(out)));

    LOG_DEBUG("Registry", "hidden at the default level");
    LOG_INFO("Registry", "registered {}", "help");
    EXPECT_TRUE(logger.setLevel("Dispatcher", logging::Level::Debug));
    LOG_DEBUG("Dispatcher", "state {}", "Parsed");
    EXPECT_TRUE(logger.setLevel(std::string(logging::GLOBAL_TAG), logging::Level::Error));
    LOG_WARN("Registry", "below the global level");

    EXPECT_EQ(out.str(), "[Registry] INFO: registered help\n"
                         "[Dispatcher] DEBUG: state Parsed\n");
    // detach before out goes away
    EXPECT_TRUE(logging::shutdown());
}

TEST_F(LoggerTest, DisabledTagIsMuted) {
    std::ostringstream out;
    auto& logger = logging::Logger::instance();
    ASSERT_TRUE(logger.init(std::make_shared<logging::ConsoleBackend>(out)));

    EXPECT_TRUE(logger.disableTag("Noisy"));
    LOG_ERROR("Noisy", "muted");
    EXPECT_TRUE(out.str().empty());

    EXPECT_TRUE(logger.enableTag("Noisy"));
    LOG_ERROR("Noisy", "back");
    EXPECT_EQ(out.str(), "[Noisy] ERROR: back\n");
    EXPECT_TRUE(logging::shutdown());
}

TEST_F(LoggerTest, NullBackendIsRejected) {
    EXPECT_EQ(logging::Logger::instance().init(std::shared_ptr<logging::LoggerBackend>()).code(),
              ResultCode::InvalidArgument);
}
