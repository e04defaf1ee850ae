#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace codetap {
namespace protocol {

// Parsed upstream base URL: http or https, a host, an optional port and an
// optional base path. The trailing slash of the base path is dropped.
struct UpstreamUrl {
    std::string scheme;    // "http" or "https"
    std::string host;
    uint16_t port{0};
    std::string basePath;  // "" or "/prefix", never ending in '/'

    bool tls() const { return scheme == "https"; }
    uint16_t defaultPort() const { return tls() ? 443 : 80; }

    // host, plus ":port" only when the port is not the scheme default.
    std::string authority() const;

    // scheme://authority/basePath without trailing slash.
    std::string ToString() const;

    // Joins the base path with an inbound path: exactly one leading slash of
    // the inbound path is dropped, and "" or "/" map to the upstream root.
    std::string TargetPath(const std::string& inboundPath) const;

    // Absolute URL for an inbound path and raw query (no '?').
    std::string TargetUrl(const std::string& inboundPath, const std::string& rawQuery = "") const;

    // Returns nullopt for anything that is not http(s)://authority[/path].
    static std::optional<UpstreamUrl> Parse(const std::string& url);
};

} // namespace protocol
} // namespace codetap
