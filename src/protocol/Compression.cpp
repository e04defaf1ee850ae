#include "codetap/protocol/Compression.h"

#include <algorithm>
#include <cctype>
#include <cstring>

#include <zlib.h>

namespace codetap {
namespace protocol {

static std::string ToLowerCopy(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

Compression::Encoding Compression::ParseContentEncoding(const std::string& v) {
    const std::string lv = ToLowerCopy(v);
    if (lv.find("gzip") != std::string::npos) return Encoding::kGzip;
    if (lv.find("deflate") != std::string::npos) return Encoding::kDeflate;
    if (lv.empty() || lv.find("identity") != std::string::npos) return Encoding::kIdentity;
    return Encoding::kUnknown;
}

static bool InflateAll(const uint8_t* data, size_t len, int windowBits, std::string* out) {
    out->clear();
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
    zs.avail_in = static_cast<uInt>(len);
    if (inflateInit2(&zs, windowBits) != Z_OK) return false;

    char buf[16384];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        zs.next_out = reinterpret_cast<Bytef*>(buf);
        zs.avail_out = sizeof(buf);
        ret = inflate(&zs, Z_NO_FLUSH);
        // Z_BUF_ERROR here means the input ended before the stream did
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&zs);
            return false;
        }
        const size_t produced = sizeof(buf) - zs.avail_out;
        if (produced) out->append(buf, buf + produced);
        if (out->size() > Compression::kMaxDecodedBytes) {
            inflateEnd(&zs);
            return false;
        }
    }
    inflateEnd(&zs);
    return true;
}

bool Compression::Decompress(Encoding enc, const uint8_t* data, size_t len, std::string* out) {
    if (!out) return false;
    if (enc == Encoding::kIdentity) {
        out->assign(reinterpret_cast<const char*>(data), reinterpret_cast<const char*>(data + len));
        return true;
    }
    if (enc == Encoding::kGzip) {
        return InflateAll(data, len, 16 + MAX_WBITS, out);
    }
    if (enc == Encoding::kDeflate) {
        return InflateAll(data, len, MAX_WBITS, out) || InflateAll(data, len, -MAX_WBITS, out);
    }
    return false;
}

bool Compression::Decompress(Encoding enc, const std::string& in, std::string* out) {
    return Decompress(enc, reinterpret_cast<const uint8_t*>(in.data()), in.size(), out);
}

} // namespace protocol
} // namespace codetap
