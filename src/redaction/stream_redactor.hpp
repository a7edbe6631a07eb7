#ifndef PHISCRUB_REDACTION_STREAM_REDACTOR_HPP
#define PHISCRUB_REDACTION_STREAM_REDACTOR_HPP

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>
#include <cstddef>
#include "redaction/redactor.hpp"

/**
 * @file stream_redactor.hpp
 * @brief Chunked redaction that hands back partial results as they are produced.
 *
 * Each chunk is redacted on its own. A PHI fragment straddling a chunk
 * boundary may escape redaction, so pick a chunk size well above the longest
 * expected fragment (the default is 500 bytes).
 *
 * USAGE EXAMPLE:
 *   @code
 *   phiscrub::redaction::StreamRedactor stream(redactor, 500);
 *   stream.redactStreaming(longText, [](const StreamChunk &c) {
 *       sendToClient(c.chunk);
 *       updateProgressBar(c.progress);
 *   });
 *   @endcode
 */

namespace phiscrub {
namespace redaction {

struct StreamChunk
{
    std::string chunk;  ///< redacted chunk text
    double progress;    ///< input bytes consumed so far / total, in (0, 1]
};

class StreamRedactor
{
public:
    static constexpr std::size_t kDefaultChunkSize = 500;

    using ChunkCallback = std::function<void(const StreamChunk &)>;

    /**
     * @throw std::invalid_argument if chunkSize is zero.
     */
    StreamRedactor(const Redactor &redactor, std::size_t chunkSize = kDefaultChunkSize)
        : redactor_(redactor), chunkSize_(chunkSize)
    {
        if (chunkSize_ == 0) {
            throw std::invalid_argument("StreamRedactor: chunk size must be positive");
        }
    }

    /**
     * @brief Redact `text` chunk by chunk, invoking `callback` after each one.
     * @return Number of chunks emitted (0 for empty input).
     */
    std::size_t redactStreaming(const std::string &text, const ChunkCallback &callback) const
    {
        std::size_t emitted = 0;
        std::size_t offset = 0;
        while (offset < text.size()) {
            std::size_t end = chunkEnd(text, offset);
            StreamChunk piece;
            piece.chunk = redactor_.redact(text.substr(offset, end - offset));
            piece.progress = static_cast<double>(end) / static_cast<double>(text.size());
            offset = end;
            ++emitted;
            callback(piece);
        }
        return emitted;
    }

    std::vector<StreamChunk> redactStreaming(const std::string &text) const
    {
        std::vector<StreamChunk> chunks;
        redactStreaming(text, [&chunks](const StreamChunk &c) { chunks.push_back(c); });
        return chunks;
    }

    std::size_t chunkSize() const { return chunkSize_; }

private:
    /**
     * @brief End offset of the chunk starting at `offset`, pulled back so a
     *        UTF-8 multi-byte sequence is never split.
     */
    std::size_t chunkEnd(const std::string &text, std::size_t offset) const
    {
        std::size_t end = offset + chunkSize_;
        if (end >= text.size()) {
            return text.size();
        }
        std::size_t adjusted = end;
        while (adjusted > offset && isContinuationByte(text[adjusted])) {
            --adjusted;
        }
        // a single code point wider than the chunk: take it whole
        if (adjusted == offset) {
            adjusted = end;
            while (adjusted < text.size() && isContinuationByte(text[adjusted])) {
                ++adjusted;
            }
        }
        return adjusted;
    }

    static bool isContinuationByte(char c)
    {
        return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
    }

    const Redactor &redactor_;
    std::size_t chunkSize_;
};

} // namespace redaction
} // namespace phiscrub

#endif // PHISCRUB_REDACTION_STREAM_REDACTOR_HPP
