#include "session_registry.hpp"

#include <stdexcept>

namespace kube_auth_proxy {

ProxySessionRegistry::ProxySessionRegistry(Factory factory)
    : mFactory(std::move(factory)) {
    if (!mFactory) {
        throw std::invalid_argument("ProxySessionRegistry needs a session factory");
    }
}

ProxySession& ProxySessionRegistry::sessionFor(const Cluster& cluster) {
    auto it = mSessions.find(cluster.id);
    if (it != mSessions.end()) {
        return *it->second;
    }

    auto session = mFactory(cluster);
    if (!session) {
        throw std::runtime_error("Session factory returned null for cluster " + cluster.id);
    }
    ProxySession& ref = *session;
    mSessions.emplace(cluster.id, std::move(session));
    return ref;
}

ProxySession* ProxySessionRegistry::find(const std::string& clusterId) const {
    auto it = mSessions.find(clusterId);
    return it == mSessions.end() ? nullptr : it->second.get();
}

void ProxySessionRegistry::exitAll() {
    for (auto& entry : mSessions) {
        entry.second->exit();
    }
}

void ProxySessionRegistry::shutdownAll() {
    for (auto& entry : mSessions) {
        entry.second->shutdown();
    }
}

} // namespace kube_auth_proxy
