#ifndef PHISCRUB_UTIL_CONFIG_PARSER_HPP
#define PHISCRUB_UTIL_CONFIG_PARSER_HPP

#include <string>
#include <fstream>
#include <istream>
#include <stdexcept>
#include <cstdint>
#include <algorithm>
#include <cctype>
#include "config/redactor_config.hpp"
#include "util/logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Minimal parser for PhiScrub's RedactorConfig.
 *
 * DESIGN GOALS:
 *   - Read a simple "key=value" configuration file, '#' starts a comment line.
 *   - Populate phiscrub::config::RedactorConfig fields.
 *   - A missing file is not an error (defaults stay), a malformed line is.
 *
 * USAGE:
 *   @code
 *   phiscrub::config::RedactorConfig cfg;
 *   phiscrub::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("phiscrub.conf");
 *   @endcode
 *
 * Recognized keys: logLevel, logFile, extendedRules, cacheSize, batchThreads,
 * streamChunkSize, auditDatabase.
 */

namespace phiscrub {
namespace util {

/**
 * @class ConfigParser
 * @brief Reads key=value text and applies recognized keys to a RedactorConfig.
 */
class ConfigParser
{
public:
    explicit ConfigParser(phiscrub::config::RedactorConfig &config)
        : config_(config)
    {
    }

    /**
     * @brief Read the given file and apply every recognized key.
     * @return false if the file does not exist (defaults are kept).
     * @throw std::runtime_error if a line is malformed or a value is invalid.
     */
    bool loadFromFile(const std::string &filepath)
    {
        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            logger::warn("ConfigParser: File not found: " + filepath + ", using defaults");
            return false;
        }

        logger::info("ConfigParser: Loading config from " + filepath);
        loadFromStream(inFile);
        logger::info("ConfigParser: Config loaded.");
        return true;
    }

    /**
     * @brief Parse key=value lines from any stream.
     * @throw std::runtime_error on a malformed line or invalid value.
     */
    void loadFromStream(std::istream &in)
    {
        std::string line;
        std::size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: invalid line " + std::to_string(lineNo) +
                                         " (no '='): " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);

            applyKeyValue(key, val);
        }
    }

private:
    phiscrub::config::RedactorConfig &config_;

    void applyKeyValue(const std::string &key, const std::string &val)
    {
        if (key == "logLevel") {
            // validate now so a typo fails at load time, not at startup
            logger::parseLogLevel(val);
            config_.logLevel = val;
        }
        else if (key == "logFile") {
            config_.logFile = val;
        }
        else if (key == "extendedRules") {
            config_.extendedRules = parseBool(key, val);
        }
        else if (key == "cacheSize") {
            config_.cacheSize = static_cast<std::size_t>(parseUInt(val));
        }
        else if (key == "batchThreads") {
            config_.batchThreads = static_cast<std::size_t>(parseUInt(val));
        }
        else if (key == "streamChunkSize") {
            std::uint64_t n = parseUInt(val);
            if (n == 0) {
                throw std::runtime_error("ConfigParser: streamChunkSize must be positive");
            }
            config_.streamChunkSize = static_cast<std::size_t>(n);
        }
        else if (key == "auditDatabase") {
            config_.auditDatabase = val;
        }
        else {
            logger::warn("ConfigParser: Unrecognized key '" + key + "'");
            return;
        }
        logger::debug("ConfigParser: " + key + " set to '" + val + "'");
    }

    static void trim(std::string &s)
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos == std::string::npos) {
            s.clear();
            return;
        }
        s.erase(0, pos);
        s.erase(s.find_last_not_of(whitespace) + 1);
    }

    static bool parseBool(const std::string &key, const std::string &val)
    {
        std::string lower(val);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
            return true;
        }
        if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
            return false;
        }
        throw std::runtime_error("ConfigParser: '" + key + "' expects a boolean, got '" + val + "'");
    }

    static std::uint64_t parseUInt(const std::string &val)
    {
        if (val.empty() || val[0] == '-' || val[0] == '+') {
            throw std::runtime_error("ConfigParser: parseUInt failed on '" + val + "'");
        }
        try {
            std::size_t idx = 0;
            std::uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
            return n;
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: parseUInt failed on '" + val + "': " + ex.what());
        }
    }
};

} // namespace util
} // namespace phiscrub

#endif // PHISCRUB_UTIL_CONFIG_PARSER_HPP
