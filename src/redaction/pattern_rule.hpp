#ifndef PHISCRUB_REDACTION_PATTERN_RULE_HPP
#define PHISCRUB_REDACTION_PATTERN_RULE_HPP

#include <string>
#include <vector>
#include <cstdint>

/**
 * @file pattern_rule.hpp
 * @brief Rule definitions and the result envelope shared by every redaction entry point.
 */

namespace phiscrub {
namespace redaction {

/**
 * @struct PatternRule
 * @brief One redaction rule: every match of `pattern` is replaced by `replacement`.
 *
 * Rules with a higher priority run first. Equal priorities keep definition order.
 * `name` is for reporting only and plays no part in matching.
 *
 * If the pattern has a capture group named `phi`, only that group's span is
 * replaced and the text around it is match context. The search resumes at the
 * end of the group, so context consumed after one match can lead the next.
 */
struct PatternRule
{
    std::string name;
    std::string pattern;      ///< RE2 syntax
    std::string replacement;  ///< literal text, no group references
    std::uint8_t priority;
};

/**
 * @struct RedactionResult
 * @brief Output of Redactor::redactWithStats.
 */
struct RedactionResult
{
    std::string redactedText;
    double processingTimeMs = 0.0;
    std::uint32_t patternsApplied = 0;  ///< rules whose pass changed the text
};

/*
  Unicode building blocks for the rule table. RE2's \d, \s and \b are ASCII-only,
  so the rules spell out the Unicode classes:
    digit   \p{Nd}, any decimal digit (fullwidth, Arabic-Indic, ...)
    space   Unicode White_Space
    word    letters, marks, decimal digits, letter numbers, connector
            punctuation and the two joiners
  A word boundary next to a word character is written as a non-word neighbour
  (or the text edge) on each side of a `phi` group.
*/
namespace unicode {

constexpr const char *kDigit = R"(\p{Nd})";
constexpr const char *kSpaceChars = R"(\t\n\v\f\r\x{85}\p{Z})";
constexpr const char *kWordChars = R"(\p{L}\p{M}\p{Nd}\p{Nl}\p{Pc}\x{200C}\x{200D})";

inline std::string space()
{
    return std::string("[") + kSpaceChars + "]";
}

/// `body` delimited by word boundaries; `body` must begin and end on word characters.
inline std::string bounded(const std::string &body)
{
    std::string nonWord = std::string("[^") + kWordChars + "]";
    return "(?:^|" + nonWord + ")(?P<phi>" + body + ")(?:$|" + nonWord + ")";
}

} // namespace unicode

/**
 * @brief The six-rule default table, in definition order (not yet sorted).
 */
inline std::vector<PatternRule> builtinRules()
{
    using namespace unicode;
    const std::string d = kDigit;
    const std::string sp = space();
    const std::string sep = std::string("[-.") + kSpaceChars + "]";

    return {
        {"SSN",
         bounded(d + "{3}-?" + d + "{2}-?" + d + "{4}"),
         "[REDACTED_SSN]", 10},
        {"Phone Numbers",
         R"((?:\+?1)" + sep + R"(?)?\(?([0-9]{3})\)?)" + sep + "?([0-9]{3})" + sep + "?([0-9]{4})",
         "[REDACTED_PHONE]", 9},
        {"Email Addresses",
         bounded(R"([A-Za-z0-9][A-Za-z0-9._%+-]*@[A-Za-z0-9.-]+\.[A-Z|a-z]+[A-Za-z])"),
         "[REDACTED_EMAIL]", 8},
        {"Full Name",
         bounded("[A-Z][a-z]+ [A-Z][a-z]+(?:" + sp + "+[A-Z][a-z]+)*"),
         "[REDACTED_NAME]", 7},
        {"Date Patterns",
         bounded(d + "{1,2}[/-]" + d + "{1,2}[/-]" + d + "{2,4}"),
         "[REDACTED_DATE]", 6},
        {"Medical Record Numbers",
         bounded("(?:MRN|Medical Record|Record #?)" + sp + "*:?" + sp + "*[A-Z0-9-]{5,}[A-Z0-9]"),
         "[REDACTED_MRN]", 5},
    };
}

/**
 * @brief Built-in table plus the CJK-name and insurance-number rules.
 */
inline std::vector<PatternRule> extendedRules()
{
    using namespace unicode;
    const std::string sp = space();

    std::vector<PatternRule> rules = builtinRules();
    rules.push_back({"Chinese Names",
                     R"([\x{4e00}-\x{9fff}]{2,4})",
                     "[REDACTED_NAME]", 4});
    rules.push_back({"Insurance Numbers",
                     bounded("(?i:(?:Insurance|Policy|Member)" + sp + "*#?" + sp + "*:?" + sp +
                             "*[A-Z0-9-]{7,}[A-Z0-9])"),
                     "[REDACTED_INSURANCE]", 3});
    return rules;
}

} // namespace redaction
} // namespace phiscrub

#endif // PHISCRUB_REDACTION_PATTERN_RULE_HPP
