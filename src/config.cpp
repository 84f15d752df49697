#include "config.hpp"
#include "status.hpp"
#include "util.hpp"

#include <fstream>
#include <stdexcept>

namespace kube_auth_proxy {

namespace {

std::string requireString(const nlohmann::json& node, const char* key,
                          const std::string& where) {
    if (!node.contains(key) || !node[key].is_string()) {
        throw std::runtime_error("Config missing string field '" + where + key + "'");
    }
    std::string value = node[key].get<std::string>();
    if (value.empty()) {
        throw std::runtime_error("Config field '" + where + key + "' is empty");
    }
    return value;
}

int nonNegativeInt(const nlohmann::json& node, const char* key, int fallback,
                   const std::string& where) {
    if (!node.contains(key)) return fallback;
    if (!node[key].is_number_integer()) {
        throw std::runtime_error("Config field '" + where + key + "' must be an integer");
    }
    const auto value = node[key].get<long long>();
    if (value < 0 || value > 86400000) {
        throw std::runtime_error("Config field '" + where + key + "' is out of range");
    }
    return static_cast<int>(value);
}

ClusterConfig parseClusterNode(const nlohmann::json& node, std::size_t index) {
    const std::string where = "clusters[" + std::to_string(index) + "].";
    if (!node.is_object()) {
        throw std::runtime_error("Config entry '" + where.substr(0, where.size() - 1) +
                                 "' must be an object");
    }

    ClusterConfig c;
    c.cluster.id             = requireString(node, "id", where);
    c.cluster.kubeConfigPath = requireString(node, "kubeConfigPath", where);
    c.cluster.contextName    = requireString(node, "contextName", where);
    c.apiUrl                 = requireString(node, "apiUrl", where);

    try {
        parseUrl(c.apiUrl);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Config field '" + where + "apiUrl': " + e.what());
    }
    return c;
}

} // namespace

const ClusterConfig& LauncherConfig::findCluster(const std::string& clusterId) const {
    if (clusters.empty()) {
        throw std::runtime_error("No clusters configured");
    }
    if (clusterId.empty()) {
        return clusters.front();
    }
    for (const auto& c : clusters) {
        if (c.cluster.id == clusterId) return c;
    }
    throw std::runtime_error("Unknown cluster: " + clusterId);
}

LauncherConfig parseLauncherConfig(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw std::runtime_error("Config root must be a JSON object");
    }

    LauncherConfig cfg;
    try {
        cfg.proxyPath = requireString(document, "proxyPath", "");

        if (document.contains("proxyArgs")) {
            cfg.proxyArgs = document["proxyArgs"].get<std::vector<std::string>>();
        }
        cfg.certificateDir     = document.value("certificateDir", cfg.certificateDir);
        cfg.inheritEnvironment = document.value("inheritEnvironment", cfg.inheritEnvironment);
        if (document.contains("environment")) {
            cfg.environment = document["environment"].get<Environment>();
        }

        // --- retry ---
        if (document.contains("retry")) {
            const auto& retry = document["retry"];
            cfg.maxRetryAttempts = nonNegativeInt(retry, "maxAttempts", cfg.maxRetryAttempts, "retry.");
            cfg.initialDelayMs   = nonNegativeInt(retry, "initialDelayMs", cfg.initialDelayMs, "retry.");
            cfg.maxDelayMs       = nonNegativeInt(retry, "maxDelayMs", cfg.maxDelayMs, "retry.");
        }

        // --- reachability ---
        if (document.contains("reachability")) {
            const auto& reach = document["reachability"];
            cfg.pollIntervalMs        = nonNegativeInt(reach, "pollIntervalMs", cfg.pollIntervalMs, "reachability.");
            cfg.reachabilityTimeoutMs = nonNegativeInt(reach, "timeoutMs", cfg.reachabilityTimeoutMs, "reachability.");
        }

        cfg.statusFormat = document.value("statusFormat", cfg.statusFormat);
        parseStatusFormat(cfg.statusFormat);

        // --- clusters ---
        if (!document.contains("clusters") || !document["clusters"].is_array()) {
            throw std::runtime_error("Config missing array field 'clusters'");
        }
        const auto& clusters = document["clusters"];
        for (std::size_t i = 0; i < clusters.size(); ++i) {
            cfg.clusters.push_back(parseClusterNode(clusters[i], i));
        }
        if (cfg.clusters.empty()) {
            throw std::runtime_error("Config field 'clusters' is empty");
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid config: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid config: ") + e.what());
    }

    return cfg;
}

LauncherConfig loadLauncherConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    nlohmann::json document;
    try {
        in >> document;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse config " + path + ": " + e.what());
    }
    return parseLauncherConfig(document);
}

} // namespace kube_auth_proxy
