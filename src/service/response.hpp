#ifndef PHISCRUB_SERVICE_RESPONSE_HPP
#define PHISCRUB_SERVICE_RESPONSE_HPP

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include "redaction/pattern_rule.hpp"

/**
 * @file response.hpp
 * @brief JSON rendering for service responses and redaction results.
 *
 * DESIGN GOALS:
 *   - A Response carries a status code, a short message and a payload that is
 *     already JSON (a string literal, an array, an object or a number).
 *   - toJson() produces {"status":200,"message":"OK","data":<payload>}.
 *   - Helpers render the shapes the redaction API returns.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace phiscrub::service;
 *   Response resp(200, "OK", jsonString("[REDACTED_EMAIL]"));
 *   std::string out = resp.toJson();
 *   // => {"status":200,"message":"OK","data":"[REDACTED_EMAIL]"}
 *   @endcode
 */

namespace phiscrub {
namespace service {

/**
 * @brief Escape a string for embedding in JSON (without surrounding quotes).
 */
inline std::string escapeString(const std::string &in)
{
    std::ostringstream oss;
    for (char c : in) {
        switch (c) {
        case '"':  oss << "\\\""; break;
        case '\\': oss << "\\\\"; break;
        case '\b': oss << "\\b";  break;
        case '\f': oss << "\\f";  break;
        case '\n': oss << "\\n";  break;
        case '\r': oss << "\\r";  break;
        case '\t': oss << "\\t";  break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
            } else {
                oss << c;
            }
            break;
        }
    }
    return oss.str();
}

inline std::string jsonString(const std::string &value)
{
    return "\"" + escapeString(value) + "\"";
}

inline std::string jsonStringArray(const std::vector<std::string> &values)
{
    std::string out = "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out += ",";
        }
        out += jsonString(values[i]);
    }
    out += "]";
    return out;
}

/**
 * @brief {"redacted_text":"...","processing_time_ms":0.123,"patterns_applied":2}
 */
inline std::string resultToJson(const redaction::RedactionResult &result)
{
    std::ostringstream oss;
    oss << "{\"redacted_text\":" << jsonString(result.redactedText)
        << ",\"processing_time_ms\":" << std::fixed << std::setprecision(3)
        << result.processingTimeMs
        << ",\"patterns_applied\":" << result.patternsApplied << "}";
    return oss.str();
}

/**
 * @struct Response
 * @brief A service-layer response, serialized back to the caller.
 */
struct Response
{
    int statusCode;
    std::string message;
    std::string data;  ///< pre-rendered JSON value, "null" when empty

    Response(int code = 200, const std::string &msg = "OK", const std::string &dat = "")
        : statusCode(code), message(msg), data(dat)
    {
    }

    bool ok() const { return statusCode >= 200 && statusCode < 300; }

    std::string toJson() const
    {
        std::ostringstream oss;
        oss << R"({"status":)" << statusCode
            << R"(,"message":)" << jsonString(message)
            << R"(,"data":)" << (data.empty() ? "null" : data) << "}";
        return oss.str();
    }
};

} // namespace service
} // namespace phiscrub

#endif // PHISCRUB_SERVICE_RESPONSE_HPP
