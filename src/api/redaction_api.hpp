#ifndef PHISCRUB_API_REDACTION_API_HPP
#define PHISCRUB_API_REDACTION_API_HPP

#include <memory>
#include <string>
#include "redaction/redaction_observer.hpp"
#include "redaction/redactor.hpp"

/**
 * @file redaction_api.hpp
 * @brief Free-function entry points for hosts that embed the engine.
 *
 * Long-lived callers should create one Redactor and reuse it; the rule table is
 * compiled once per Redactor. redactText() is for one-shot callers that accept
 * paying compilation on every call.
 *
 * USAGE:
 *   @code
 *   auto redactor = phiscrub::api::createRedactor();
 *   std::string safe = redactor.redact(userInput);
 *   @endcode
 */

namespace phiscrub {
namespace api {

/// Built-in rule table, diagnostics to the process logger.
inline redaction::Redactor createRedactor()
{
    return redaction::Redactor(std::make_shared<redaction::LoggingObserver>());
}

/// Construct, redact once, discard.
inline std::string redactText(const std::string &text)
{
    redaction::Redactor redactor(std::make_shared<redaction::LoggingObserver>());
    return redactor.redact(text);
}

} // namespace api
} // namespace phiscrub

#endif // PHISCRUB_API_REDACTION_API_HPP
