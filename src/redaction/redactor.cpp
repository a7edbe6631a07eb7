#include "redaction/redactor.hpp"
#include "redaction/prefilter.hpp"
#include <algorithm>
#include <chrono>
#include <map>
#include <unordered_set>
#include <utility>
#include <vector>
#include <re2/re2.h>

namespace phiscrub {
namespace redaction {

namespace {

double elapsedMs(std::chrono::steady_clock::time_point start)
{
    auto delta = std::chrono::steady_clock::now() - start;
    return std::chrono::duration<double, std::milli>(delta).count();
}

std::size_t nextCodePoint(const std::string &text, std::size_t pos)
{
    ++pos;
    while (pos < text.size() && (static_cast<unsigned char>(text[pos]) & 0xC0) == 0x80) {
        ++pos;
    }
    return pos;
}

// Replace every match of `matcher` (or of its group `group`) with the literal
// `replacement`. Matching sees the whole text, so ^, $ and context characters
// before the search position still count. An empty match directly after the
// previous replacement is skipped.
std::string replaceAll(const std::string &text, const re2::RE2 &matcher, int group,
                       const std::string &replacement)
{
    re2::StringPiece input(text);
    std::vector<re2::StringPiece> groups(static_cast<std::size_t>(group) + 1);

    std::string out;
    std::size_t copied = 0;
    std::size_t pos = 0;
    std::size_t lastEnd = std::string::npos;

    while (pos <= text.size() &&
           matcher.Match(input, pos, text.size(), re2::RE2::UNANCHORED,
                         groups.data(), group + 1)) {
        const re2::StringPiece &hit = groups[group];
        if (hit.data() == nullptr) {
            // the group did not take part; move past the whole match
            std::size_t wholeEnd = static_cast<std::size_t>(groups[0].data() - text.data()) +
                                   groups[0].size();
            pos = wholeEnd > pos ? wholeEnd : nextCodePoint(text, pos);
            continue;
        }

        std::size_t start = static_cast<std::size_t>(hit.data() - text.data());
        std::size_t end = start + hit.size();
        if (start == end && start == lastEnd) {
            pos = nextCodePoint(text, start);
            continue;
        }

        out.append(text, copied, start - copied);
        out += replacement;
        copied = end;
        lastEnd = end;
        pos = start == end ? nextCodePoint(text, end) : end;
    }

    out.append(text, copied, std::string::npos);
    return out;
}

} // namespace

Redactor::Redactor(std::shared_ptr<RedactionObserver> observer)
    : Redactor(builtinRules(), std::move(observer))
{
}

Redactor::Redactor(std::vector<PatternRule> rules, std::shared_ptr<RedactionObserver> observer)
    : observer_(std::move(observer)), degraded_(false)
{
    compile(std::move(rules));
}

Redactor::~Redactor() = default;
Redactor::Redactor(Redactor &&other) noexcept = default;
Redactor &Redactor::operator=(Redactor &&other) noexcept = default;

void Redactor::compile(std::vector<PatternRule> rules)
{
    std::stable_sort(rules.begin(), rules.end(),
                     [](const PatternRule &a, const PatternRule &b) {
                         return a.priority > b.priority;
                     });

    re2::RE2::Options options;
    options.set_log_errors(false);

    std::unordered_set<std::string> seenNames;
    std::vector<CompiledRule> compiled;
    compiled.reserve(rules.size());

    for (auto &rule : rules) {
        if (!seenNames.insert(rule.name).second) {
            degraded_ = true;
            if (observer_) {
                observer_->onCompileFailure(rule.name, "duplicate rule name");
            }
            return;
        }

        auto matcher = std::make_unique<re2::RE2>(rule.pattern, options);
        if (!matcher->ok()) {
            degraded_ = true;
            if (observer_) {
                observer_->onCompileFailure(rule.name, matcher->error());
            }
            return;
        }

        CompiledRule entry;
        const auto &named = matcher->NamedCapturingGroups();
        auto phi = named.find("phi");
        entry.replaceGroup = phi != named.end() ? phi->second : 0;
        entry.rule = std::move(rule);
        entry.matcher = std::move(matcher);
        compiled.push_back(std::move(entry));
    }

    rules_ = std::move(compiled);
    if (observer_) {
        observer_->onConstructed(rules_.size());
    }
}

std::string Redactor::applyRules(const std::string &text, std::uint32_t &applied) const
{
    std::string redacted = text;
    applied = 0;

    for (const auto &entry : rules_) {
        std::string after = replaceAll(redacted, *entry.matcher, entry.replaceGroup,
                                       entry.rule.replacement);
        if (after != redacted) {
            redacted = std::move(after);
            ++applied;
        }
    }
    return redacted;
}

std::string Redactor::redact(const std::string &text) const
{
    return redactWithStats(text).redactedText;
}

RedactionResult Redactor::redactWithStats(const std::string &text) const
{
    RedactionResult result;
    if (text.empty() || !likelyContainsPhi(text)) {
        result.redactedText = text;
        return result;
    }

    auto start = std::chrono::steady_clock::now();
    result.redactedText = applyRules(text, result.patternsApplied);
    result.processingTimeMs = elapsedMs(start);

    if (observer_) {
        observer_->onRedaction(result);
    }
    return result;
}

std::vector<std::string> Redactor::batchRedact(const std::vector<std::string> &texts) const
{
    auto start = std::chrono::steady_clock::now();

    std::vector<std::string> results;
    results.reserve(texts.size());
    for (const auto &text : texts) {
        results.push_back(redact(text));
    }

    if (observer_) {
        observer_->onBatch(texts.size(), elapsedMs(start));
    }
    return results;
}

std::size_t Redactor::getPatternCount() const
{
    return rules_.size();
}

std::vector<std::string> Redactor::getPatternNames() const
{
    std::vector<std::string> names;
    names.reserve(rules_.size());
    for (const auto &entry : rules_) {
        names.push_back(entry.rule.name);
    }
    return names;
}

} // namespace redaction
} // namespace phiscrub
