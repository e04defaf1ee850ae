#include "codetap/protocol/UpstreamUrl.h"
#include "codetap/protocol/HttpRequest.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace codetap {
namespace protocol {

std::string UpstreamUrl::authority() const {
    if (port == 0 || port == defaultPort()) return host;
    return host + ":" + std::to_string(port);
}

std::string UpstreamUrl::ToString() const {
    return scheme + "://" + authority() + basePath;
}

std::string UpstreamUrl::TargetPath(const std::string& inboundPath) const {
    std::string rest = inboundPath;
    if (!rest.empty() && rest[0] == '/') rest.erase(0, 1);
    return basePath + "/" + rest;
}

std::string UpstreamUrl::TargetUrl(const std::string& inboundPath, const std::string& rawQuery) const {
    std::string url = scheme + "://" + authority() + TargetPath(inboundPath);
    if (!rawQuery.empty()) {
        url.append("?").append(rawQuery);
    }
    return url;
}

std::optional<UpstreamUrl> UpstreamUrl::Parse(const std::string& url) {
    const size_t sep = url.find("://");
    if (sep == std::string::npos) return std::nullopt;

    UpstreamUrl out;
    out.scheme = HttpRequest::ToLower(url.substr(0, sep));
    if (out.scheme != "http" && out.scheme != "https") return std::nullopt;

    const size_t authStart = sep + 3;
    const size_t pathStart = url.find('/', authStart);
    const std::string auth = url.substr(authStart, pathStart == std::string::npos
                                                       ? std::string::npos
                                                       : pathStart - authStart);
    if (auth.empty() || auth.find('@') != std::string::npos || auth[0] == '[') {
        return std::nullopt;
    }

    const size_t colon = auth.rfind(':');
    if (colon != std::string::npos) {
        const std::string portStr = auth.substr(colon + 1);
        if (portStr.empty() || portStr.size() > 5 ||
            !std::all_of(portStr.begin(), portStr.end(), [](char c) { return c >= '0' && c <= '9'; })) {
            return std::nullopt;
        }
        const long p = std::strtol(portStr.c_str(), nullptr, 10);
        if (p <= 0 || p > 65535) return std::nullopt;
        out.port = static_cast<uint16_t>(p);
        out.host = auth.substr(0, colon);
    } else {
        out.port = out.defaultPort();
        out.host = auth;
    }
    if (out.host.empty()) return std::nullopt;
    for (char c : out.host) {
        const unsigned char u = static_cast<unsigned char>(c);
        if (!(std::isalnum(u) || c == '.' || c == '-' || c == '_')) return std::nullopt;
    }

    if (pathStart != std::string::npos) {
        std::string path = url.substr(pathStart);
        if (path.find_first_of("?# ") != std::string::npos) return std::nullopt;
        while (!path.empty() && path.back() == '/') path.pop_back();
        out.basePath = path;
    }
    return out;
}

} // namespace protocol
} // namespace codetap
