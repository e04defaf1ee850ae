#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace codetap {
namespace protocol {

// zlib-backed decoder for the gzip and deflate content-codings.
class Compression {
public:
    enum class Encoding {
        kIdentity,
        kGzip,
        kDeflate,
        kUnknown,
    };

    // Decoded output larger than this is treated as a failure.
    static const size_t kMaxDecodedBytes = 64 * 1024 * 1024;

    static Encoding ParseContentEncoding(const std::string& v);

    // Decompress whole buffer. "deflate" accepts both the zlib-wrapped and the
    // raw form some servers send.
    static bool Decompress(Encoding enc, const uint8_t* data, size_t len, std::string* out);
    static bool Decompress(Encoding enc, const std::string& in, std::string* out);
};

} // namespace protocol
} // namespace codetap
