#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"

using namespace sevault::logging;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_path_ = std::filesystem::temp_directory_path() / "sevault_logger_test.log";
        std::filesystem::remove(log_path_);
    }

    void TearDown() override {
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
        std::filesystem::remove(log_path_);
    }

    std::string log_contents() {
        boost::log::core::get()->flush();
        std::ifstream file(log_path_, std::ios::in | std::ios::binary);
        std::stringstream contents;
        contents << file.rdbuf();
        return contents.str();
    }

    std::filesystem::path log_path_;
};

TEST_F(LoggerTest, WritesToFile) {
    init_logging(log_path_.string(), boost::log::trivial::trace);

    BOOST_LOG_TRIVIAL(info) << "Test info message";
    BOOST_LOG_TRIVIAL(error) << "Test error message";

    std::string contents = log_contents();
    EXPECT_NE(contents.find("Test info message"), std::string::npos);
    EXPECT_NE(contents.find("[error] Test error message"), std::string::npos);
}

TEST_F(LoggerTest, FiltersBelowLevel) {
    init_logging(log_path_.string(), boost::log::trivial::warning);

    BOOST_LOG_TRIVIAL(debug) << "Filtered debug message";
    BOOST_LOG_TRIVIAL(warning) << "Kept warning message";

    std::string contents = log_contents();
    EXPECT_EQ(contents.find("Filtered debug message"), std::string::npos);
    EXPECT_NE(contents.find("Kept warning message"), std::string::npos);

    set_log_level(boost::log::trivial::debug);
    BOOST_LOG_TRIVIAL(debug) << "Now visible debug message";
    EXPECT_NE(log_contents().find("Now visible debug message"), std::string::npos);
}

TEST_F(LoggerTest, AppendsAcrossInitializations) {
    init_logging(log_path_.string());
    BOOST_LOG_TRIVIAL(info) << "First run";

    init_logging(log_path_.string());
    BOOST_LOG_TRIVIAL(info) << "Second run";

    std::string contents = log_contents();
    EXPECT_NE(contents.find("First run"), std::string::npos);
    EXPECT_NE(contents.find("Second run"), std::string::npos);
}

TEST_F(LoggerTest, ParseSeverity) {
    EXPECT_EQ(parse_severity("trace"), boost::log::trivial::trace);
    EXPECT_EQ(parse_severity("info"), boost::log::trivial::info);
    EXPECT_EQ(parse_severity("fatal"), boost::log::trivial::fatal);
    EXPECT_THROW(parse_severity("verbose"), std::invalid_argument);
    EXPECT_THROW(parse_severity(""), std::invalid_argument);
}
