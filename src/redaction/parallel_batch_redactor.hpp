#ifndef PHISCRUB_REDACTION_PARALLEL_BATCH_REDACTOR_HPP
#define PHISCRUB_REDACTION_PARALLEL_BATCH_REDACTOR_HPP

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <vector>
#include <cstddef>
#include "redaction/redactor.hpp"
#include "util/thread_pool.hpp"
#include "util/logger.hpp"

namespace phiscrub {
namespace redaction {

/*
  ParallelBatchRedactor
  --------------------------------
  Runs a batch across a ThreadPool. Items share nothing, so each one is an
  independent task; results are collected in input order and match
  Redactor::batchRedact exactly.

  Small batches (below minParallelItems) run inline; queueing them costs more
  than the matching itself.

  The Redactor must outlive this object.
*/
class ParallelBatchRedactor
{
public:
    static constexpr std::size_t kDefaultMinParallelItems = 8;

    ParallelBatchRedactor(const Redactor &redactor,
                          std::size_t threadCount = 0,
                          std::size_t minParallelItems = kDefaultMinParallelItems)
        : redactor_(redactor),
          pool_(threadCount),
          minParallelItems_(minParallelItems)
    {
    }

    std::vector<std::string> batchRedact(const std::vector<std::string> &texts)
    {
        if (texts.size() < minParallelItems_) {
            return redactor_.batchRedact(texts);
        }

        auto start = std::chrono::steady_clock::now();

        std::vector<std::future<std::string>> pending;
        pending.reserve(texts.size());
        for (const auto &text : texts) {
            const std::string *item = &text;
            pending.push_back(pool_.enqueue([this, item] { return redactor_.redact(*item); }));
        }

        std::vector<std::string> results;
        results.reserve(texts.size());
        for (auto &f : pending) {
            results.push_back(f.get());
        }

        double ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
        util::logger::debug("ParallelBatchRedactor: " + std::to_string(texts.size()) +
                            " items on " + std::to_string(pool_.size()) + " threads in " +
                            std::to_string(ms) + "ms");
        return results;
    }

    std::size_t threadCount() const { return pool_.size(); }

private:
    const Redactor &redactor_;
    util::ThreadPool pool_;
    std::size_t minParallelItems_;
};

} // namespace redaction
} // namespace phiscrub

#endif // PHISCRUB_REDACTION_PARALLEL_BATCH_REDACTOR_HPP
