#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>
#include <sstream>
#include "logger.h"

#include <boost/log/core.hpp>
#include <iostream>

namespace fs = std::filesystem;
using namespace md_writer;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_file_path = fs::temp_directory_path() / "md_writer_logger_test.log";
        // Clean up any pre-existing log file
        std::error_code ec;
        fs::remove(log_file_path, ec);
    }

    void TearDown() override {
        // Release the file sink before removing the file
        Logger::init_logger();
        std::error_code ec;
        fs::remove(log_file_path, ec);
    }

    void InitWithFile(boost::log::trivial::severity_level level) {
        Logger::LoggerOptions options;
        options.level = level;
        options.file = log_file_path.string();
        Logger::init_logger(options);
    }

    std::string read_log_file() {
        std::ifstream file(log_file_path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    fs::path log_file_path;
};

// Test that log file is created and contains log entries
TEST_F(LoggerTest, WritesToLogFile) {
    InitWithFile(boost::log::trivial::info);
    Logger::log_info("Test log entry");
    ASSERT_TRUE(fs::exists(log_file_path));
    std::string contents = read_log_file();
    EXPECT_NE(contents.find("Test log entry"), std::string::npos);
    EXPECT_NE(contents.find("[info]"), std::string::npos);
}

// Records below the configured severity are dropped
TEST_F(LoggerTest, FiltersBelowLevel) {
    InitWithFile(boost::log::trivial::warning);
    Logger::log_debug("quiet debug entry");
    Logger::log_info("quiet info entry");
    Logger::log_error("loud error entry");
    std::string contents = read_log_file();
    EXPECT_EQ(contents.find("quiet debug entry"), std::string::npos);
    EXPECT_EQ(contents.find("quiet info entry"), std::string::npos);
    EXPECT_NE(contents.find("loud error entry"), std::string::npos);
}

TEST_F(LoggerTest, TraceAndWarningHelpersWrite) {
    InitWithFile(boost::log::trivial::trace);
    Logger::log_trace("trace entry");
    Logger::log_warning("warning entry");
    std::string contents = read_log_file();
    EXPECT_NE(contents.find("[trace] trace entry"), std::string::npos);
    EXPECT_NE(contents.find("[warning] warning entry"), std::string::npos);
}

// With no sink configured nothing may fall through to the default stdout sink
TEST_F(LoggerTest, NoSinksDisablesLogging) {
    Logger::LoggerOptions options;
    options.console = false;
    Logger::init_logger(options);
    EXPECT_FALSE(boost::log::core::get()->get_logging_enabled());

    Logger::init_logger();
    EXPECT_TRUE(boost::log::core::get()->get_logging_enabled());
}

// Console output can be turned off while the file keeps receiving records
TEST_F(LoggerTest, FileOnlyWithoutConsole) {
    std::ostringstream captured;
    std::streambuf* previous = std::clog.rdbuf(captured.rdbuf());

    Logger::LoggerOptions options;
    options.level = boost::log::trivial::info;
    options.console = false;
    options.file = log_file_path.string();
    Logger::init_logger(options);
    Logger::log_error("file only entry");

    std::clog.rdbuf(previous);
    EXPECT_TRUE(captured.str().empty());
    EXPECT_NE(read_log_file().find("file only entry"), std::string::npos);
}

// Fragment metrics line is machine-parsable
TEST_F(LoggerTest, LogsFragmentMetrics) {
    InitWithFile(boost::log::trivial::info);
    Logger::log_fragment("h1", 6, 13);
    std::string contents = read_log_file();
    EXPECT_NE(contents.find("[FragmentMetrics] kind:h1 input_bytes:6 output_bytes:13"),
              std::string::npos);
}

TEST_F(LoggerTest, LogsConfigFailureAsError) {
    InitWithFile(boost::log::trivial::info);
    Logger::log_config_parsing("md_writer.json", false);
    std::string contents = read_log_file();
    EXPECT_NE(contents.find("[error] Config file parsed: md_writer.json (failure)"),
              std::string::npos);
}
