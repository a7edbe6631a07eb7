#ifndef PHISCRUB_REDACTION_REDACTOR_HPP
#define PHISCRUB_REDACTION_REDACTOR_HPP

#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include "redaction/pattern_rule.hpp"
#include "redaction/redaction_observer.hpp"

namespace re2 {
class RE2;
}

namespace phiscrub {
namespace redaction {

/*
  Redactor
  --------------------------------------------------------
  Masks PHI in free text with a priority-ordered rule table.

  - The table is sorted (stable, priority descending) and compiled once in the
    constructor, then never changes. Each rule is kept together with its
    compiled RE2 matcher in one record.
  - redact() runs the fast pre-filter, then every rule in order, feeding the
    output of one rule into the next. Each rule replaces all non-overlapping
    matches (or their `phi` group, see PatternRule) with its literal
    replacement.
  - If any pattern fails to compile the Redactor drops the whole table and
    becomes a pass-through. The constructor does not throw; the failure goes
    to the observer and isDegraded() reports it.

  THREAD-SAFETY:
   - All public methods are const. RE2 objects are safe for concurrent use, so
     one Redactor can serve any number of threads without locking.
   - The observer is called from whichever thread runs the redaction.
*/
class Redactor
{
public:
    /// Built-in six-rule table.
    explicit Redactor(std::shared_ptr<RedactionObserver> observer = nullptr);

    /// Caller-supplied table, static for the Redactor's lifetime.
    explicit Redactor(std::vector<PatternRule> rules,
                      std::shared_ptr<RedactionObserver> observer = nullptr);

    ~Redactor();

    Redactor(Redactor &&other) noexcept;
    Redactor &operator=(Redactor &&other) noexcept;
    Redactor(const Redactor &) = delete;
    Redactor &operator=(const Redactor &) = delete;

    std::string redact(const std::string &text) const;

    /// Same transformation as redact(), plus elapsed time and applied-rule count.
    RedactionResult redactWithStats(const std::string &text) const;

    /// redact() per item, order preserved.
    std::vector<std::string> batchRedact(const std::vector<std::string> &texts) const;

    std::size_t getPatternCount() const;

    /// Rule names in application (priority) order.
    std::vector<std::string> getPatternNames() const;

    /// True when construction fell back to an empty table.
    bool isDegraded() const { return degraded_; }

private:
    struct CompiledRule
    {
        PatternRule rule;
        std::unique_ptr<re2::RE2> matcher;
        int replaceGroup;  ///< index of the `phi` group, 0 for the whole match
    };

    void compile(std::vector<PatternRule> rules);
    std::string applyRules(const std::string &text, std::uint32_t &applied) const;

    std::vector<CompiledRule> rules_;
    std::shared_ptr<RedactionObserver> observer_;
    bool degraded_;
};

} // namespace redaction
} // namespace phiscrub

#endif // PHISCRUB_REDACTION_REDACTOR_HPP
