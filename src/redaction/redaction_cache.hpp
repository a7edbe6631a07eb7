#ifndef PHISCRUB_REDACTION_REDACTION_CACHE_HPP
#define PHISCRUB_REDACTION_REDACTION_CACHE_HPP

#include <list>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <cstddef>
#include <cstdint>
#include "redaction/redactor.hpp"

/**
 * @file redaction_cache.hpp
 * @brief LRU cache of redacted outputs keyed by the input text.
 *
 * Repeated inputs (form labels, canned phrases, retried messages) are common in
 * a chat pipeline. CachingRedactor answers them without another matching pass.
 *
 * USAGE EXAMPLE:
 *   @code
 *   phiscrub::redaction::Redactor redactor;
 *   phiscrub::redaction::CachingRedactor cached(redactor, 2000);
 *   std::string out = cached.redact("Patient DOB 01/02/1990");
 *   @endcode
 */

namespace phiscrub {
namespace redaction {

/**
 * @class RedactionCache
 * @brief Thread-safe least-recently-used map from input text to redacted text.
 */
class RedactionCache
{
public:
    explicit RedactionCache(std::size_t capacity)
        : capacity_(capacity), hits_(0), misses_(0)
    {
    }

    /**
     * @brief Look up `key`, refreshing its recency on a hit.
     * @return true and fills `value` on a hit.
     */
    bool get(const std::string &key, std::string &value)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            ++misses_;
            return false;
        }
        entries_.splice(entries_.begin(), entries_, it->second);
        value = it->second->second;
        ++hits_;
        return true;
    }

    /**
     * @brief Insert or refresh an entry, evicting the least recently used one when full.
     */
    void put(const std::string &key, const std::string &value)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (capacity_ == 0) {
            return;
        }

        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = value;
            entries_.splice(entries_.begin(), entries_, it->second);
            return;
        }

        if (entries_.size() >= capacity_) {
            index_.erase(entries_.back().first);
            entries_.pop_back();
        }
        entries_.emplace_front(key, value);
        index_[key] = entries_.begin();
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        index_.clear();
        hits_ = 0;
        misses_ = 0;
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    std::size_t capacity() const { return capacity_; }

    std::uint64_t hits() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return hits_;
    }

    std::uint64_t misses() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return misses_;
    }

private:
    using Entry = std::pair<std::string, std::string>;

    const std::size_t capacity_;
    std::list<Entry> entries_;  ///< front = most recently used
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
    std::uint64_t hits_;
    std::uint64_t misses_;
    mutable std::mutex mutex_;
};

/**
 * @class CachingRedactor
 * @brief Redactor front end that consults a RedactionCache first.
 *
 * The wrapped Redactor must outlive this object. Outputs are identical to
 * Redactor::redact; pass-through results are cached too.
 */
class CachingRedactor
{
public:
    CachingRedactor(const Redactor &redactor, std::size_t capacity)
        : redactor_(redactor), cache_(capacity)
    {
    }

    std::string redact(const std::string &text)
    {
        if (text.empty() || cache_.capacity() == 0) {
            return redactor_.redact(text);
        }

        std::string cached;
        if (cache_.get(text, cached)) {
            return cached;
        }

        std::string redacted = redactor_.redact(text);
        cache_.put(text, redacted);
        return redacted;
    }

    RedactionCache &cache() { return cache_; }
    const Redactor &redactor() const { return redactor_; }

private:
    const Redactor &redactor_;
    RedactionCache cache_;
};

} // namespace redaction
} // namespace phiscrub

#endif // PHISCRUB_REDACTION_REDACTION_CACHE_HPP
