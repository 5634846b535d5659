#include "linkgate/gateway/GatewayServer.h"
#include "linkgate/gateway/GatewayOptions.h"
#include "linkgate/gateway/PreviewRenderer.h"
#include "linkgate/balancer/SessionRegistry.h"
#include "linkgate/backend/LocalStoreClient.h"
#include "linkgate/network/Channel.h"
#include "linkgate/network/EventLoop.h"
#include "linkgate/network/InetAddress.h"
#include "linkgate/common/Config.h"
#include "linkgate/common/Logger.h"

#include <getopt.h>
#include <signal.h>
#include <sys/signalfd.h>
#include <unistd.h>

#include <cstdio>
#include <memory>

int main(int argc, char* argv[]) {
    using namespace linkgate;

    std::string configFile = "../config/linkgate.conf";
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
            default:
                printf("Usage: %s [-c config_file] [-C]\n", argv[0]);
                printf("  -C  check config and exit\n");
                return 0;
        }
    }

    auto& conf = common::Config::Instance();
    if (!conf.Load(configFile)) {
        if (checkOnly) {
            fprintf(stderr, "cannot load %s\n", configFile.c_str());
            return 1;
        }
        LOG_ERROR << "Failed to load config, using defaults.";
    }
    common::Logger::Instance().SetLevel(common::Logger::Instance().ParseLevel(conf.GetString("global", "log_level", "INFO")));

    const gateway::GatewayOptions options = gateway::GatewayOptions::FromConfig(conf);
    const auto sessions = conf.GetSessions();

    if (checkOnly) {
        // Exit code tells management scripts whether the gateway could serve.
        int bad = 0;
        for (const auto& s : sessions) {
            if (s.type != "local" || s.root.empty()) {
                fprintf(stderr, "session %d: unsupported type '%s' or empty root\n", s.id, s.type.c_str());
                ++bad;
            }
        }
        if (sessions.empty()) {
            fprintf(stderr, "no [session:<n>] sections\n");
            ++bad;
        }
        if (bad > 0) return 1;
        printf("OK\n");
        return 0;
    }

    uint16_t port = static_cast<uint16_t>(conf.GetInt("global", "listen_port", 8080));
    int tlsEnable = conf.GetInt("tls", "enable", 0);
    std::string tlsCertPath = conf.GetString("tls", "cert_path", "");
    std::string tlsKeyPath = conf.GetString("tls", "key_path", "");
    int maxConnections = conf.GetInt("connection_limit", "max_total", 0);
    double idleTimeoutSec = conf.GetDouble("connection_limit", "idle_timeout_sec", 0.0);
    double cleanupIntervalSec = conf.GetDouble("connection_limit", "cleanup_interval_sec", 1.0);

    ::signal(SIGPIPE, SIG_IGN);

    network::EventLoop loop;

    balancer::SessionRegistry registry(&loop, options.maxConcurrentPerSession, options.backendTimeoutSec);
    for (const auto& s : sessions) {
        if (s.type != "local") {
            LOG_ERROR << "Session " << s.id << ": unsupported type '" << s.type << "', skipped";
            continue;
        }
        if (!registry.AddSession(std::make_shared<backend::LocalStoreClient>(&loop, s.id, s.root))) {
            LOG_ERROR << "Session " << s.id << " is configured twice, skipped";
            continue;
        }
        LOG_INFO << "Session " << s.id << " -> " << s.root;
    }
    if (registry.SessionCount() == 0) {
        LOG_WARN << "No backend sessions configured; delivery requests will fail";
    }

    gateway::GatewayServer server(&loop, network::InetAddress(port), registry, options,
                                  gateway::PreviewRendererPtr(new gateway::TemplatePreviewRenderer(options.previewTemplatePath)));
    if (tlsEnable != 0) {
        if (!server.EnableTls(tlsCertPath, tlsKeyPath)) {
            LOG_ERROR << "TLS enable failed, cert_path=" << tlsCertPath << " key_path=" << tlsKeyPath;
            return 1;
        }
        LOG_INFO << "TLS enabled (sniffing HTTPS and HTTP on port " << port << ")";
    }
    if (maxConnections > 0) {
        server.SetMaxConnections(maxConnections);
        LOG_INFO << "Connection limit enabled: max_total=" << maxConnections;
    }
    if (idleTimeoutSec > 0.0) {
        server.SetIdleTimeout(idleTimeoutSec, cleanupIntervalSec);
        LOG_INFO << "Idle timeout enabled: idle_timeout_sec=" << idleTimeoutSec
                 << " cleanup_interval_sec=" << cleanupIntervalSec;
    }

    // SIGINT/SIGTERM end the loop through a signalfd watched like any other fd.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    if (::sigprocmask(SIG_BLOCK, &mask, nullptr) < 0) {
        LOG_ERROR << "sigprocmask failed";
        return 1;
    }
    int sigfd = ::signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (sigfd < 0) {
        LOG_ERROR << "signalfd failed";
        return 1;
    }
    network::Channel signalChannel(&loop, sigfd);
    signalChannel.SetReadCallback([&](std::chrono::system_clock::time_point) {
        signalfd_siginfo info;
        if (::read(sigfd, &info, sizeof(info)) == static_cast<ssize_t>(sizeof(info))) {
            LOG_INFO << "Signal " << info.ssi_signo << " received, shutting down";
        }
        loop.Quit();
    });
    signalChannel.EnableReading();

    server.Start();
    loop.Loop();

    signalChannel.DisableAll();
    signalChannel.Remove();
    ::close(sigfd);
    LOG_INFO << "Stopped; sessions acquired " << registry.TotalAcquired()
             << " released " << registry.TotalReleased();
    return 0;
}
