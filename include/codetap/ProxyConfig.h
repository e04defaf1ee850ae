#pragma once

#include "codetap/common/Config.h"
#include "codetap/common/Logger.h"
#include "codetap/protocol/UpstreamUrl.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace codetap {

// Validated, immutable settings for one proxy process. Built once from the
// INI store with environment variables layered on top.
struct ProxyConfig {
    enum ColorMode { kColorAuto, kColorOn, kColorOff };

    static const char kDefaultUpstream[];
    static const char kDefaultLogDir[];
    static const uint16_t kDefaultPort = 9492;

    // Returns the variable's value, or nullopt when it is unset.
    using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

    protocol::UpstreamUrl upstream;
    std::string logDir{kDefaultLogDir};
    std::optional<std::string> databaseUrl;
    uint16_t port{kDefaultPort};
    int threads{0};
    common::LogLevel logLevel{common::LogLevel::INFO};
    ColorMode color{kColorAuto};
    bool consoleEnabled{true};
    int poolMin{1};
    int poolMax{4};
    bool createSchema{false};
    int upstreamTimeoutMs{30000};

    // nullopt (with *error set) for values that cannot be used. A malformed
    // upstream URL is not an error: it falls back to the default.
    static std::optional<ProxyConfig> Load(const common::Config& conf,
                                           const EnvLookup& env,
                                           std::string* error);

    // getenv-backed lookup.
    static EnvLookup ProcessEnv();

    // Resolves kColorAuto against whether stdout is a terminal.
    bool useColor() const;

    // One "key = value" line per setting. The database URL is masked.
    std::string Describe() const;

    static const char* ColorModeName(ColorMode mode);
};

} // namespace codetap
