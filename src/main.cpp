#include "codetap/AppContext.h"
#include "codetap/AuditProxy.h"
#include "codetap/ProxyConfig.h"
#include "codetap/common/Config.h"
#include "codetap/common/Logger.h"
#include "codetap/network/EventLoop.h"
#include "codetap/network/InetAddress.h"
#include "codetap/network/SignalWatcher.h"

#include <csignal>
#include <cstdio>
#include <iostream>
#include <string>

#include <getopt.h>
#include <unistd.h>

namespace {

void PrintUsage(const char* prog) {
    std::printf("Usage: %s [-c config_file] [-C] [-h]\n", prog);
    std::printf("  -c  INI file; environment variables override its values\n");
    std::printf("  -C  validate the configuration, print it and exit\n");
    std::printf("  -h  show this help\n");
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace codetap;

    std::string configFile;
    bool checkOnly = false;
    int ch;
    while ((ch = getopt(argc, argv, "c:hC")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'C':
                checkOnly = true;
                break;
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            default:
                PrintUsage(argv[0]);
                return 1;
        }
    }

    common::Config& conf = common::Config::Instance();
    if (!configFile.empty() && !conf.Load(configFile)) {
        if (checkOnly) return 1;
        LOG_WARN << "Continuing without " << configFile;
    }

    std::string error;
    std::optional<ProxyConfig> config = ProxyConfig::Load(conf, ProxyConfig::ProcessEnv(), &error);
    if (!config) {
        LOG_ERROR << "Invalid configuration: " << error;
        return 1;
    }
    if (checkOnly) {
        std::printf("%s", config->Describe().c_str());
        std::printf("OK\n");
        return 0;
    }

    common::Logger::Instance().SetLevel(config->logLevel);
    if (config->color == ProxyConfig::kColorOff) {
        common::Logger::Instance().SetColor(false);
    }

    ::signal(SIGPIPE, SIG_IGN);

    network::EventLoop loop;
    // before any thread starts, so every thread inherits the blocked mask
    network::SignalWatcher signals(&loop, {SIGINT, SIGTERM}, [&loop](int signo) {
        LOG_INFO << "Received signal " << signo << ", shutting down";
        loop.Quit();
    });
    if (!signals.ok()) {
        LOG_ERROR << "Cannot watch SIGINT/SIGTERM";
        return 1;
    }

    AppContext ctx(*config, std::cout);
    if (!ctx.ok()) {
        return 1;
    }

    AuditProxy proxy(&loop, network::InetAddress(config->port), ctx);
    proxy.setThreadNum(config->threads);
    LOG_INFO << "codetap forwarding to " << config->upstream.ToString();
    proxy.start();

    loop.Loop();

    ctx.ReleaseUpstream();
    LOG_INFO << "codetap stopped";
    return 0;
}
