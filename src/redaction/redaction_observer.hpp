#ifndef PHISCRUB_REDACTION_REDACTION_OBSERVER_HPP
#define PHISCRUB_REDACTION_REDACTION_OBSERVER_HPP

#include <string>
#include <memory>
#include <utility>
#include <vector>
#include <sstream>
#include <iomanip>
#include <cstddef>
#include "redaction/pattern_rule.hpp"
#include "util/logger.hpp"

/**
 * @file redaction_observer.hpp
 * @brief Diagnostics hooks for a Redactor.
 *
 * A Redactor never prints on its own. Construction outcome and per-call timings
 * are pushed to an observer the host chooses. Observers are shared between
 * threads and must tolerate concurrent calls.
 *
 * USAGE:
 *   @code
 *   auto observer = std::make_shared<phiscrub::redaction::LoggingObserver>();
 *   phiscrub::redaction::Redactor redactor(observer);
 *   @endcode
 */

namespace phiscrub {
namespace redaction {

class RedactionObserver
{
public:
    virtual ~RedactionObserver() = default;

    /// Rule table compiled, `ruleCount` rules active.
    virtual void onConstructed(std::size_t ruleCount) { (void)ruleCount; }

    /// A pattern failed to compile. The Redactor is now a pass-through.
    virtual void onCompileFailure(const std::string &ruleName, const std::string &error)
    {
        (void)ruleName;
        (void)error;
    }

    /// A full matching pass finished. Not called for short-circuited inputs.
    virtual void onRedaction(const RedactionResult &result) { (void)result; }

    virtual void onBatch(std::size_t itemCount, double elapsedMs)
    {
        (void)itemCount;
        (void)elapsedMs;
    }
};

/**
 * @class LoggingObserver
 * @brief Forwards observer events to the process logger.
 */
class LoggingObserver : public RedactionObserver
{
public:
    void onConstructed(std::size_t ruleCount) override
    {
        util::logger::info("Redactor: initialized with " + std::to_string(ruleCount) + " rules");
    }

    void onCompileFailure(const std::string &ruleName, const std::string &error) override
    {
        util::logger::critical("Redactor: rule '" + ruleName + "' failed to compile (" + error +
                               "); PHI redaction disabled, input will pass through unchanged");
    }

    void onRedaction(const RedactionResult &result) override
    {
        util::logger::debug("Redactor: completed in " + formatMs(result.processingTimeMs) +
                            "ms, patterns applied: " + std::to_string(result.patternsApplied));
    }

    void onBatch(std::size_t itemCount, double elapsedMs) override
    {
        util::logger::info("Redactor: batch of " + std::to_string(itemCount) +
                           " items completed in " + formatMs(elapsedMs) + "ms");
    }

private:
    static std::string formatMs(double ms)
    {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << ms;
        return oss.str();
    }
};

/**
 * @class CompositeObserver
 * @brief Fans every event out to several observers, e.g. logging plus audit.
 */
class CompositeObserver : public RedactionObserver
{
public:
    void add(std::shared_ptr<RedactionObserver> observer)
    {
        if (observer) {
            observers_.push_back(std::move(observer));
        }
    }

    bool empty() const { return observers_.empty(); }

    void onConstructed(std::size_t ruleCount) override
    {
        for (auto &o : observers_) o->onConstructed(ruleCount);
    }

    void onCompileFailure(const std::string &ruleName, const std::string &error) override
    {
        for (auto &o : observers_) o->onCompileFailure(ruleName, error);
    }

    void onRedaction(const RedactionResult &result) override
    {
        for (auto &o : observers_) o->onRedaction(result);
    }

    void onBatch(std::size_t itemCount, double elapsedMs) override
    {
        for (auto &o : observers_) o->onBatch(itemCount, elapsedMs);
    }

private:
    // populated before the observer is handed to a Redactor, read-only afterwards
    std::vector<std::shared_ptr<RedactionObserver>> observers_;
};

} // namespace redaction
} // namespace phiscrub

#endif // PHISCRUB_REDACTION_REDACTION_OBSERVER_HPP
