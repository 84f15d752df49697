#include "certificate.hpp"
#include "config.hpp"
#include "endpoint.hpp"
#include "errors.hpp"
#include "posix_process.hpp"
#include "proxy_client.hpp"
#include "session_registry.hpp"
#include "status.hpp"

#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <string>

using namespace kube_auth_proxy;

struct Options {
    std::string configPath;
    std::string clusterId;   // empty = first configured cluster
    bool        probe   = false;
    bool        verbose = false;
};

static void printUsage() {
    std::cout
        << "Usage: kube-auth-proxy-launcher --config FILE [options]\n\n"
        << "Options:\n"
        << "  --config FILE    Launcher configuration (JSON)\n"
        << "  --cluster ID     Cluster to connect       (default: first in config)\n"
        << "  --probe          GET /version through the proxy once it is ready\n"
        << "  --verbose        Enable verbose diagnostics\n"
        << "  --help, -h       Show this message\n";
}

static Options parseArgs(int argc, char* argv[]) {
    Options opt;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if ((arg == "--config") && i + 1 < argc) {
            opt.configPath = argv[++i];
        } else if ((arg == "--cluster") && i + 1 < argc) {
            opt.clusterId = argv[++i];
        } else if (arg == "--probe") {
            opt.probe = true;
        } else if (arg == "--verbose") {
            opt.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        }
    }

    if (opt.configPath.empty()) {
        std::cerr << "Missing --config\n\n";
        printUsage();
        std::exit(1);
    }
    return opt;
}

/// Collaborators of one cluster's session; kept alive alongside it.
struct ClusterServices {
    std::unique_ptr<StaticApiEndpointResolver> resolver;
    std::unique_ptr<StreamStatusBroadcaster>   broadcaster;
};

int main(int argc, char* argv[]) {
    try {
        const Options opt         = parseArgs(argc, argv);
        const LauncherConfig cfg  = loadLauncherConfig(opt.configPath);
        const ClusterConfig& target = cfg.findCluster(opt.clusterId);

        std::cerr
            << "=== kube-auth-proxy-launcher ===\n"
            << "Proxy:      " << cfg.proxyPath              << "\n"
            << "Cluster:    " << target.cluster.id          << "\n"
            << "Context:    " << target.cluster.contextName << "\n"
            << "API:        " << target.apiUrl              << "\n"
            << "Retries:    " << cfg.maxRetryAttempts       << "\n"
            << "================================\n";

        net::io_context ioc;

        PosixProcessSpawner spawner(ioc);
        spawner.setVerbose(opt.verbose);
        FileCertificateProvider certificates(cfg.certificateDir);
        const auto statusFormat = parseStatusFormat(cfg.statusFormat);

        Environment baseEnvironment;
        if (cfg.inheritEnvironment) {
            baseEnvironment = currentEnvironment();
        }
        for (const auto& kv : cfg.environment) {
            baseEnvironment[kv.first] = kv.second;
        }

        std::map<std::string, ClusterServices> services;
        std::map<std::string, std::string>     apiUrls;
        for (const auto& c : cfg.clusters) {
            apiUrls[c.cluster.id] = c.apiUrl;
        }

        ProxySessionRegistry registry([&](const Cluster& cluster) {
            auto& svc       = services[cluster.id];
            svc.resolver    = std::make_unique<StaticApiEndpointResolver>(apiUrls.at(cluster.id));
            svc.broadcaster = std::make_unique<StreamStatusBroadcaster>(
                std::cout, cluster.id, statusFormat);

            ProxySession::Options options;
            options.proxyPath           = cfg.proxyPath;
            options.proxyArgs           = cfg.proxyArgs;
            options.baseEnvironment     = baseEnvironment;
            options.retryPolicy         = RetryPolicy(cfg.maxRetryAttempts,
                                                      std::chrono::milliseconds(cfg.initialDelayMs),
                                                      std::chrono::milliseconds(cfg.maxDelayMs));
            options.pollInterval        = std::chrono::milliseconds(cfg.pollIntervalMs);
            options.reachabilityTimeout = std::chrono::milliseconds(cfg.reachabilityTimeoutMs);

            auto session = std::make_unique<ProxySession>(
                ioc, cluster, std::move(options), spawner, *svc.resolver,
                certificates, *svc.broadcaster);
            session->setVerbose(opt.verbose);
            return session;
        });

        ProxySession& session = registry.sessionFor(target.cluster);
        int  exitCode = 0;
        bool stopping = false;

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signo) {
            if (ec) return;
            std::cerr << "[Launcher] received signal " << signo << ", stopping\n";
            stopping = true;
            // Wakes the session coroutine; it finishes and stops the loop.
            registry.shutdownAll();
        });

        net::spawn(ioc, [&](net::yield_context yield) {
            try {
                session.run(yield);
            } catch (const RetryExhausted& e) {
                std::cerr << "[Launcher] " << e.what() << " ("
                          << toString(e.cause()) << ")\n";
                exitCode = 1;
            } catch (const std::exception& e) {
                if (!stopping) {
                    std::cerr << "[Launcher] Fatal error: " << e.what() << "\n";
                    exitCode = 1;
                }
            }

            if (session.isReady()) {
                std::cerr << "[Launcher] proxy ready on 127.0.0.1:" << session.port()
                          << " prefix " << session.apiPrefix() << "\n";
                std::cout << "PORT=" << session.port() << "\n"
                          << "API_PREFIX=" << session.apiPrefix() << "\n";
                std::cout.flush();

                if (opt.probe) {
                    try {
                        const auto apiHost = parseUrl(target.apiUrl).host;
                        ProxyClient client(session.port(), session.apiPrefix(),
                                           certificates.certificateFor(apiHost).cert);
                        client.setVerbose(opt.verbose);
                        const auto resp = client.get(ioc, "/version", yield);
                        std::cerr << "[Launcher] /version -> HTTP " << resp.httpStatus
                                  << " " << resp.body.dump() << "\n";
                    } catch (const std::exception& e) {
                        std::cerr << "[Launcher] probe failed: " << e.what() << "\n";
                    }
                }

                // Serve until a signal arrives or the proxy goes away.
                while (session.hasProcess() && !stopping) {
                    sleepFor(ioc, yield, std::chrono::milliseconds(250));
                }
                if (!stopping) {
                    std::cerr << "[Launcher] proxy is no longer running\n";
                    exitCode = 1;
                }
            }

            // No session coroutine is suspended any more, so stopping here
            // cannot strand one. Children got SIGTERM from shutdown().
            registry.shutdownAll();
            ioc.stop();
        });

        ioc.run();
        return exitCode;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
