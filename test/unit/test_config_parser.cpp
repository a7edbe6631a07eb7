// key=value configuration loading.

#include <gtest/gtest.h>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include "config/redactor_config.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

using phiscrub::config::RedactorConfig;
using phiscrub::util::ConfigParser;

namespace {

TEST(ConfigParserTest, Defaults) {
    RedactorConfig cfg;
    EXPECT_EQ(cfg.logLevel, "INFO");
    EXPECT_TRUE(cfg.logFile.empty());
    EXPECT_FALSE(cfg.extendedRules);
    EXPECT_EQ(cfg.cacheSize, 2000u);
    EXPECT_EQ(cfg.batchThreads, 0u);
    EXPECT_EQ(cfg.streamChunkSize, 500u);
    EXPECT_TRUE(cfg.auditDatabase.empty());
}

TEST(ConfigParserTest, LoadsAllKeys) {
    RedactorConfig cfg;
    ConfigParser parser(cfg);
    std::istringstream in(
        "# phiscrub settings\n"
        "\n"
        "logLevel = debug\n"
        "logFile=/tmp/phiscrub.log\n"
        "extendedRules = yes\n"
        "cacheSize=64\n"
        "batchThreads=3\n"
        "streamChunkSize = 128\n"
        "auditDatabase=audit.db\n");
    parser.loadFromStream(in);

    EXPECT_EQ(cfg.logLevel, "debug");
    EXPECT_EQ(cfg.logFile, "/tmp/phiscrub.log");
    EXPECT_TRUE(cfg.extendedRules);
    EXPECT_EQ(cfg.cacheSize, 64u);
    EXPECT_EQ(cfg.batchThreads, 3u);
    EXPECT_EQ(cfg.streamChunkSize, 128u);
    EXPECT_EQ(cfg.auditDatabase, "audit.db");
}

TEST(ConfigParserTest, UnknownKeyIsIgnored) {
    RedactorConfig cfg;
    ConfigParser parser(cfg);
    std::istringstream in("colour=blue\ncacheSize=0\n");
    EXPECT_NO_THROW(parser.loadFromStream(in));
    EXPECT_EQ(cfg.cacheSize, 0u);
}

TEST(ConfigParserTest, InvalidValuesThrow) {
    const char* bad[] = {
        "just a line\n",
        "extendedRules=maybe\n",
        "logLevel=LOUD\n",
        "streamChunkSize=0\n",
        "cacheSize=-1\n",
        "cacheSize=12abc\n",
        "batchThreads=\n",
    };
    for (const char* text : bad) {
        RedactorConfig cfg;
        ConfigParser parser(cfg);
        std::istringstream in(text);
        EXPECT_THROW(parser.loadFromStream(in), std::runtime_error) << text;
    }
}

TEST(ConfigParserTest, MissingFileKeepsDefaults) {
    RedactorConfig cfg;
    ConfigParser parser(cfg);
    EXPECT_FALSE(parser.loadFromFile("/nonexistent/phiscrub.conf"));
    EXPECT_EQ(cfg.cacheSize, 2000u);
}

TEST(LoggerTest, ParseLogLevel) {
    using namespace phiscrub::util::logger;
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("Info"), LogLevel::INFO);
    EXPECT_EQ(parseLogLevel("WARNING"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("ERROR"), LogLevel::ERROR);
    EXPECT_EQ(parseLogLevel("critical"), LogLevel::CRITICAL);
    EXPECT_THROW(parseLogLevel("verbose"), std::runtime_error);
}

TEST(LoggerTest, LevelThresholdFiltersLines) {
    using namespace phiscrub::util::logger;
    std::ostringstream captured;
    setConsoleStream(captured);
    setLogLevel(LogLevel::WARN);

    info("hidden line");
    warn("visible line");

    setConsoleStream(std::cout);
    EXPECT_EQ(captured.str().find("hidden line"), std::string::npos);
    EXPECT_NE(captured.str().find("[WARN] visible line"), std::string::npos);
}

} // anonymous namespace
