#ifndef PHISCRUB_REDACTION_PREFILTER_HPP
#define PHISCRUB_REDACTION_PREFILTER_HPP

#include <string>
#include <cstddef>

namespace phiscrub {
namespace redaction {

/// Inputs shorter than this (in bytes) never reach the matchers.
constexpr std::size_t kMinPhiLength = 10;

/// More numeric characters than this marks a text as a likely carrier of numeric PHI.
constexpr std::size_t kDigitThreshold = 5;

/**
 * @brief Cheap over-approximation of "the rule table could match here".
 *
 * False positives only cost a full matching pass. The keyword and numeric checks
 * cover what the numeric, email and MRN rules need to fire. Numeric characters
 * are counted over the whole Unicode range (fullwidth and Arabic-Indic digits,
 * roman numerals, vulgar fractions), matching the Unicode digit classes the
 * rules use.
 */
bool likelyContainsPhi(const std::string &text);

/// Number of Unicode numeric code points in `text`, counting stops past `limit`.
std::size_t countNumericChars(const std::string &text, std::size_t limit);

} // namespace redaction
} // namespace phiscrub

#endif // PHISCRUB_REDACTION_PREFILTER_HPP
