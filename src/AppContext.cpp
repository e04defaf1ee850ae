#include "codetap/AppContext.h"
#include "codetap/common/Logger.h"

namespace codetap {

AppContext::AppContext(const ProxyConfig& config, std::ostream& console)
    : config_(config) {
    network::TlsContext* tls = nullptr;
    if (config_.upstream.tls()) {
        if (tls_.InitClient(true)) {
            tls = &tls_;
        } else {
            LOG_ERROR << "AppContext: TLS client context for " << config_.upstream.host << " failed";
            ok_ = false;
        }
    }
    client_.reset(new protocol::HttpClient(config_.upstream, tls, &upstreamPool_, config_.upstreamTimeoutMs));
    forwarder_.reset(new audit::Forwarder(client_.get()));

    fileSink_.reset(new audit::FileSink(config_.logDir));
    fanout_.AddSink(fileSink_.get());
    LOG_INFO << "AppContext: file sink at " << fileSink_->path();

    if (config_.databaseUrl) {
        audit::PgSink::Options opts;
        opts.url = *config_.databaseUrl;
        opts.poolMin = config_.poolMin;
        opts.poolMax = config_.poolMax;
        opts.createSchema = config_.createSchema;
        pgSink_.reset(new audit::PgSink(opts));
        fanout_.AddSink(pgSink_.get());
        LOG_INFO << "AppContext: postgres sink enabled, pool " << opts.poolMin << ".." << opts.poolMax;
    } else {
        LOG_INFO << "AppContext: no database configured, postgres sink disabled";
    }

    if (config_.consoleEnabled) {
        console_.reset(new audit::ConsoleRenderer(console, config_.useColor()));
    }
}

AppContext::~AppContext() {
    ReleaseUpstream();
}

void AppContext::ReleaseUpstream() {
    upstreamPool_.Clear();
}

} // namespace codetap
