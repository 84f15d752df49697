#pragma once

#include "cluster.hpp"
#include "process.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace kube_auth_proxy {

/// One entry of the "clusters" array.
struct ClusterConfig {
    Cluster     cluster;
    std::string apiUrl;   // e.g. "https://prod.example.com:6443"
};

/// Launcher settings loaded from the JSON config file.
struct LauncherConfig {
    std::string              proxyPath;
    std::vector<std::string> proxyArgs;
    std::string              certificateDir = ".";
    bool                     inheritEnvironment = true;
    Environment              environment;

    int maxRetryAttempts = 3;
    int initialDelayMs   = 1000;
    int maxDelayMs       = 30000;

    int pollIntervalMs        = 500;
    int reachabilityTimeoutMs = 10000;

    std::string statusFormat = "text";

    std::vector<ClusterConfig> clusters;

    /// Entry for @p clusterId, or the first one when @p clusterId is empty.
    /// Throws std::runtime_error if there is no such cluster.
    const ClusterConfig& findCluster(const std::string& clusterId) const;
};

/// Map a parsed config document onto LauncherConfig.
/// Throws std::runtime_error naming the first missing or invalid field.
LauncherConfig parseLauncherConfig(const nlohmann::json& document);

/// Read and parse @p path. Throws std::runtime_error on I/O or parse errors.
LauncherConfig loadLauncherConfig(const std::string& path);

} // namespace kube_auth_proxy
