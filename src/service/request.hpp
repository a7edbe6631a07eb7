#ifndef PHISCRUB_SERVICE_REQUEST_HPP
#define PHISCRUB_SERVICE_REQUEST_HPP

#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include "util/logger.hpp"

/**
 * @file request.hpp
 * @brief Parses one-line JSON requests for the redaction service.
 *
 * DESIGN GOALS:
 *   - A Request carries a method name and either a string or an array of strings:
 *       {"method":"redact","data":"Call me at 555-123-4567"}
 *       {"method":"batchRedact","data":["a","b"]}
 *       {"method":"getPatternNames"}
 *   - Header-only, no external JSON library. The scanner handles exactly the
 *     subset above: objects of string / string-array / bare-word values, with the
 *     standard string escapes (including \uXXXX and surrogate pairs).
 *   - parseRequest throws std::runtime_error on malformed input.
 *   - parseBatchEnvelope never throws: a malformed batch decodes as empty.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace phiscrub::service;
 *   Request req = parseRequest(R"({"method":"redact","data":"SSN: 123-45-6789"})");
 *   // req.method == "redact", req.data == "SSN: 123-45-6789"
 *   @endcode
 */

namespace phiscrub {
namespace service {

/**
 * @struct Request
 * @brief A decoded service call.
 */
struct Request
{
    std::string method;
    std::string data;                    ///< set when "data" is a string
    std::vector<std::string> items;      ///< set when "data" is an array
    bool hasItems = false;
};

namespace detail {

/**
 * @brief Cursor over a JSON text. Every read method throws std::runtime_error
 *        with the failing offset.
 */
class JsonScanner
{
public:
    explicit JsonScanner(const std::string &text) : text_(text), pos_(0) {}

    void skipWhitespace()
    {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool atEnd()
    {
        skipWhitespace();
        return pos_ >= text_.size();
    }

    char peek()
    {
        skipWhitespace();
        if (pos_ >= text_.size()) {
            fail("unexpected end of input");
        }
        return text_[pos_];
    }

    void expect(char c)
    {
        if (peek() != c) {
            fail(std::string("expected '") + c + "'");
        }
        ++pos_;
    }

    bool consumeIf(char c)
    {
        if (!atEnd() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    std::string readString()
    {
        expect('"');
        std::string out;
        while (true) {
            if (pos_ >= text_.size()) {
                fail("unterminated string");
            }
            char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= text_.size()) {
                fail("dangling escape");
            }
            char e = text_[pos_++];
            switch (e) {
            case '"':  out.push_back('"');  break;
            case '\\': out.push_back('\\'); break;
            case '/':  out.push_back('/');  break;
            case 'b':  out.push_back('\b'); break;
            case 'f':  out.push_back('\f'); break;
            case 'n':  out.push_back('\n'); break;
            case 'r':  out.push_back('\r'); break;
            case 't':  out.push_back('\t'); break;
            case 'u':  appendUtf8(out, readCodePoint()); break;
            default:
                fail(std::string("invalid escape '\\") + e + "'");
            }
        }
    }

    std::vector<std::string> readStringArray()
    {
        std::vector<std::string> out;
        expect('[');
        if (consumeIf(']')) {
            return out;
        }
        while (true) {
            out.push_back(readString());
            if (consumeIf(']')) {
                return out;
            }
            expect(',');
        }
    }

    /// true, false, null or a number, returned verbatim.
    std::string readBareWord()
    {
        skipWhitespace();
        std::size_t start = pos_;
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (c == ',' || c == '}' || c == ']' || std::isspace(static_cast<unsigned char>(c))) {
                break;
            }
            ++pos_;
        }
        if (pos_ == start) {
            fail("expected a value");
        }
        return text_.substr(start, pos_ - start);
    }

    [[noreturn]] void fail(const std::string &what) const
    {
        throw std::runtime_error("json: " + what + " at offset " + std::to_string(pos_));
    }

private:
    std::uint32_t readHex4()
    {
        if (pos_ + 4 > text_.size()) {
            fail("truncated \\u escape");
        }
        std::uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            char h = text_[pos_++];
            value <<= 4;
            if (h >= '0' && h <= '9')      value |= static_cast<std::uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') value |= static_cast<std::uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') value |= static_cast<std::uint32_t>(h - 'A' + 10);
            else fail("bad hex digit in \\u escape");
        }
        return value;
    }

    std::uint32_t readCodePoint()
    {
        std::uint32_t cp = readHex4();
        if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (pos_ + 2 > text_.size() || text_[pos_] != '\\' || text_[pos_ + 1] != 'u') {
                fail("unpaired high surrogate");
            }
            pos_ += 2;
            std::uint32_t low = readHex4();
            if (low < 0xDC00 || low > 0xDFFF) {
                fail("invalid low surrogate");
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        }
        else if (cp >= 0xDC00 && cp <= 0xDFFF) {
            fail("unpaired low surrogate");
        }
        return cp;
    }

    static void appendUtf8(std::string &out, std::uint32_t cp)
    {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    const std::string &text_;
    std::size_t pos_;
};

} // namespace detail

/**
 * @brief Parse a request object. Unknown keys are ignored.
 * @throw std::runtime_error if the text is not an object or "method" is missing.
 */
inline Request parseRequest(const std::string &json)
{
    detail::JsonScanner scanner(json);
    Request req;

    scanner.expect('{');
    if (!scanner.consumeIf('}')) {
        while (true) {
            std::string key = scanner.readString();
            scanner.expect(':');

            char next = scanner.peek();
            if (key == "method") {
                req.method = scanner.readString();
            }
            else if (key == "data" && next == '[') {
                req.items = scanner.readStringArray();
                req.hasItems = true;
            }
            else if (key == "data" && next == '"') {
                req.data = scanner.readString();
            }
            else if (next == '"') {
                scanner.readString();
                phiscrub::util::logger::debug("parseRequest: ignoring key '" + key + "'");
            }
            else if (next == '[') {
                scanner.readStringArray();
                phiscrub::util::logger::debug("parseRequest: ignoring key '" + key + "'");
            }
            else {
                std::string word = scanner.readBareWord();
                if (key == "data" && word != "null") {
                    scanner.fail("'data' must be a string or an array of strings");
                }
            }

            if (scanner.consumeIf('}')) {
                break;
            }
            scanner.expect(',');
        }
    }
    if (!scanner.atEnd()) {
        scanner.fail("trailing characters after request object");
    }
    if (req.method.empty()) {
        throw std::runtime_error("parseRequest: request missing 'method'.");
    }
    return req;
}

/**
 * @brief Decode a JSON array of strings. Malformed input yields an empty batch.
 */
inline std::vector<std::string> parseBatchEnvelope(const std::string &json)
{
    try {
        detail::JsonScanner scanner(json);
        std::vector<std::string> items = scanner.readStringArray();
        if (!scanner.atEnd()) {
            scanner.fail("trailing characters after batch array");
        }
        return items;
    }
    catch (const std::runtime_error &ex) {
        phiscrub::util::logger::warn(std::string("parseBatchEnvelope: malformed batch, treating as empty (") +
                                     ex.what() + ")");
        return {};
    }
}

} // namespace service
} // namespace phiscrub

#endif // PHISCRUB_SERVICE_REQUEST_HPP
