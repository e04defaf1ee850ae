#pragma once

#include "codetap/ProxyConfig.h"
#include "codetap/audit/ConsoleRenderer.h"
#include "codetap/audit/FileSink.h"
#include "codetap/audit/Forwarder.h"
#include "codetap/audit/PersistenceFanout.h"
#include "codetap/audit/PgSink.h"
#include "codetap/common/noncopyable.h"
#include "codetap/network/TlsContext.h"
#include "codetap/protocol/HttpClient.h"
#include "codetap/protocol/UpstreamConnectionPool.h"

#include <iosfwd>
#include <memory>

namespace codetap {

// Process-wide handles shared by every request: the upstream client with
// its connection pool, the sinks and the console. Built once at startup;
// members are torn down in reverse order, so the sinks drain before the
// upstream side goes away.
class AppContext : common::noncopyable {
public:
    AppContext(const ProxyConfig& config, std::ostream& console);
    ~AppContext();

    // false when the upstream TLS context could not be set up.
    bool ok() const { return ok_; }

    const ProxyConfig& config() const { return config_; }
    audit::Forwarder& forwarder() { return *forwarder_; }
    audit::PersistenceFanout& fanout() { return fanout_; }
    audit::FileSink& fileSink() { return *fileSink_; }
    // null when no database is configured
    audit::PgSink* pgSink() { return pgSink_.get(); }
    // null when the console is disabled
    audit::ConsoleRenderer* console() { return console_.get(); }

    // Closes idle upstream connections. Call while the IO loops still run.
    void ReleaseUpstream();

private:
    const ProxyConfig config_;
    network::TlsContext tls_;
    protocol::UpstreamConnectionPool upstreamPool_;
    std::unique_ptr<protocol::HttpClient> client_;
    std::unique_ptr<audit::Forwarder> forwarder_;
    std::unique_ptr<audit::FileSink> fileSink_;
    std::unique_ptr<audit::PgSink> pgSink_;
    audit::PersistenceFanout fanout_;
    std::unique_ptr<audit::ConsoleRenderer> console_;
    bool ok_{true};
};

} // namespace codetap
