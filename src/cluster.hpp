#pragma once

#include <string>

namespace kube_auth_proxy {

/// Identity and kube-config location of one cluster connection.
struct Cluster {
    std::string id;               // registry key, e.g. "prod-eu"
    std::string kubeConfigPath;   // absolute path of the kube-config file
    std::string contextName;      // context inside that file
};

} // namespace kube_auth_proxy
