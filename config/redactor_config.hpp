#ifndef PHISCRUB_CONFIG_REDACTOR_CONFIG_HPP
#define PHISCRUB_CONFIG_REDACTOR_CONFIG_HPP

#include <string>
#include <cstddef>

/**
 * @file redactor_config.hpp
 * @brief Runtime settings for a PhiScrub process (CLI or embedding host).
 *
 * USAGE:
 *   - Populate manually or through util/config_parser.hpp.
 *   - The rule table itself is not configurable beyond the extendedRules switch.
 */

namespace phiscrub {
namespace config {

/**
 * @struct RedactorConfig
 * @brief Holds process-level settings:
 *   - logLevel / logFile: logger threshold and optional log file.
 *   - extendedRules: add the Chinese-name and insurance-number rules.
 *   - cacheSize: LRU result cache capacity (0 disables caching).
 *   - batchThreads: worker count for parallel batches (0 = hardware concurrency).
 *   - streamChunkSize: chunk size in bytes for streaming redaction.
 *   - auditDatabase: SQLite file for the audit trail (empty disables auditing).
 */
struct RedactorConfig
{
    RedactorConfig()
        : logLevel("INFO"),
          logFile(""),
          extendedRules(false),
          cacheSize(2000),
          batchThreads(0),
          streamChunkSize(500),
          auditDatabase("")
    {
    }

    std::string logLevel;
    std::string logFile;
    bool extendedRules;
    std::size_t cacheSize;
    std::size_t batchThreads;
    std::size_t streamChunkSize;
    std::string auditDatabase;
};

} // namespace config
} // namespace phiscrub

#endif // PHISCRUB_CONFIG_REDACTOR_CONFIG_HPP
