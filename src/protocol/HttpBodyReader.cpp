#include "codetap/protocol/HttpBodyReader.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace codetap {
namespace protocol {

void HttpBodyReader::reset() {
    mode_ = kNone;
    done_ = true;
    remaining_ = 0;
    chunkState_ = kChunkSize;
    lineBuf_.clear();
}

HttpBodyReader::Result HttpBodyReader::startLength(size_t contentLength) {
    reset();
    if (OverLimit(0, contentLength)) {
        return kTooLarge;
    }
    mode_ = kLength;
    remaining_ = contentLength;
    done_ = (contentLength == 0);
    return done_ ? kDone : kNeedMore;
}

void HttpBodyReader::startChunked() {
    reset();
    mode_ = kChunked;
    done_ = false;
}

void HttpBodyReader::startUntilClose() {
    reset();
    mode_ = kUntilClose;
    done_ = false;
}

HttpBodyReader::Result HttpBodyReader::Consume(const char* data, size_t len,
                                               size_t* consumed, std::string* body) {
    *consumed = 0;
    if (done_) return kDone;

    switch (mode_) {
        case kLength: {
            const size_t take = std::min(remaining_, len);
            body->append(data, take);
            remaining_ -= take;
            *consumed = take;
            if (remaining_ == 0) {
                done_ = true;
                return kDone;
            }
            return kNeedMore;
        }
        case kChunked:
            return ConsumeChunked(data, len, consumed, body);
        case kUntilClose:
            if (OverLimit(body->size(), len)) return kTooLarge;
            body->append(data, len);
            *consumed = len;
            return kNeedMore;
        case kNone:
        default:
            done_ = true;
            return kDone;
    }
}

HttpBodyReader::Result HttpBodyReader::FinishOnClose() {
    if (done_) return kDone;
    if (mode_ == kUntilClose) {
        done_ = true;
        return kDone;
    }
    return kError;
}

bool HttpBodyReader::ParseChunkSize() {
    std::string line = lineBuf_;
    lineBuf_.clear();
    if (!line.empty() && line.back() == '\r') line.pop_back();
    const size_t semi = line.find(';');
    if (semi != std::string::npos) line.resize(semi);
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) line.pop_back();
    size_t i = 0;
    while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
    line.erase(0, i);
    if (line.empty() || !std::isxdigit(static_cast<unsigned char>(line[0]))) {
        return false;
    }
    errno = 0;
    char* endp = nullptr;
    const unsigned long long n = std::strtoull(line.c_str(), &endp, 16);
    if (errno == ERANGE || endp != line.c_str() + line.size()) {
        return false;
    }
    remaining_ = static_cast<size_t>(n);
    return true;
}

HttpBodyReader::Result HttpBodyReader::ConsumeChunked(const char* data, size_t len,
                                                      size_t* consumed, std::string* body) {
    size_t pos = 0;
    while (pos < len) {
        switch (chunkState_) {
            case kChunkSize:
            case kChunkTrailer: {
                const char* start = data + pos;
                const char* nl = static_cast<const char*>(std::memchr(start, '\n', len - pos));
                if (nl == nullptr) {
                    lineBuf_.append(start, len - pos);
                    pos = len;
                    if (lineBuf_.size() > kMaxLineBytes) {
                        *consumed = pos;
                        return kError;
                    }
                    break;
                }
                lineBuf_.append(start, static_cast<size_t>(nl - start));
                pos = static_cast<size_t>(nl - data) + 1;

                if (chunkState_ == kChunkTrailer) {
                    const bool blank = lineBuf_.empty() || lineBuf_ == "\r";
                    lineBuf_.clear();
                    if (blank) {
                        done_ = true;
                        *consumed = pos;
                        return kDone;
                    }
                    break;
                }

                if (!ParseChunkSize()) {
                    *consumed = pos;
                    return kError;
                }
                if (remaining_ == 0) {
                    chunkState_ = kChunkTrailer;
                } else if (OverLimit(body->size(), remaining_)) {
                    *consumed = pos;
                    return kTooLarge;
                } else {
                    chunkState_ = kChunkData;
                }
                break;
            }
            case kChunkData: {
                const size_t take = std::min(remaining_, len - pos);
                body->append(data + pos, take);
                pos += take;
                remaining_ -= take;
                if (remaining_ == 0) chunkState_ = kChunkDataEnd;
                break;
            }
            case kChunkDataEnd: {
                const char c = data[pos++];
                if (c == '\n') {
                    chunkState_ = kChunkSize;
                } else if (c != '\r') {
                    *consumed = pos;
                    return kError;
                }
                break;
            }
        }
    }
    *consumed = pos;
    return kNeedMore;
}

} // namespace protocol
} // namespace codetap
