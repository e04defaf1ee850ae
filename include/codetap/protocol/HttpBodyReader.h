#pragma once

#include <cstddef>
#include <string>

namespace codetap {
namespace protocol {

// Incremental HTTP/1.1 message body decoder shared by the request and
// response parsers. Bytes are fed in arbitrary slices; Consume reports how
// many of them belong to the current body so the caller can retrieve exactly
// that much from its buffer.
class HttpBodyReader {
public:
    enum Mode {
        kNone,        // no body
        kLength,      // Content-Length framing
        kChunked,     // Transfer-Encoding: chunked
        kUntilClose,  // read until the peer closes
    };

    enum Result {
        kNeedMore,
        kDone,
        kError,
        kTooLarge,
    };

    // 0 means unlimited.
    explicit HttpBodyReader(size_t maxBytes = 0) : maxBytes_(maxBytes) { reset(); }

    void setMaxBytes(size_t n) { maxBytes_ = n; }
    size_t maxBytes() const { return maxBytes_; }

    void reset();

    // Returns kTooLarge immediately when the declared length exceeds the limit.
    Result startLength(size_t contentLength);
    void startChunked();
    void startUntilClose();

    Mode mode() const { return mode_; }
    bool done() const { return done_; }

    // Appends decoded payload bytes to *body and sets *consumed to the number
    // of input bytes used. Bytes after the end of the body are left unconsumed.
    Result Consume(const char* data, size_t len, size_t* consumed, std::string* body);

    // The peer closed; a read-until-close body is complete, anything else is
    // truncated.
    Result FinishOnClose();

private:
    enum ChunkState {
        kChunkSize,
        kChunkData,
        kChunkDataEnd,
        kChunkTrailer,
    };

    Result ConsumeChunked(const char* data, size_t len, size_t* consumed, std::string* body);
    bool ParseChunkSize();
    bool OverLimit(size_t current, size_t extra) const {
        return maxBytes_ != 0 && (extra > maxBytes_ || current > maxBytes_ - extra);
    }

    static const size_t kMaxLineBytes = 8 * 1024;

    size_t maxBytes_;
    Mode mode_;
    bool done_;
    size_t remaining_;
    ChunkState chunkState_;
    std::string lineBuf_;
};

} // namespace protocol
} // namespace codetap
