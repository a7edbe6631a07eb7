#include "redaction/prefilter.hpp"
#include <re2/re2.h>

namespace phiscrub {
namespace redaction {

namespace {

const re2::RE2 &numericMatcher()
{
    static const re2::RE2 matcher(R"(\pN)");
    return matcher;
}

} // namespace

std::size_t countNumericChars(const std::string &text, std::size_t limit)
{
    re2::StringPiece input(text);
    std::size_t count = 0;
    while (count <= limit && re2::RE2::FindAndConsume(&input, numericMatcher())) {
        ++count;
    }
    return count;
}

bool likelyContainsPhi(const std::string &text)
{
    if (text.size() < kMinPhiLength) {
        return false;
    }

    if (text.find('@') != std::string::npos ||
        text.find("SSN") != std::string::npos ||
        text.find("DOB") != std::string::npos ||
        text.find("MRN") != std::string::npos ||
        text.find("(555)") != std::string::npos) {
        return true;
    }

    return countNumericChars(text, kDigitThreshold) > kDigitThreshold;
}

} // namespace redaction
} // namespace phiscrub
