#pragma once

#include "cluster.hpp"
#include "proxy_session.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>

namespace kube_auth_proxy {

/// One ProxySession per cluster id, created on first use and kept until the
/// registry itself goes away.
class ProxySessionRegistry {
public:
    using Factory = std::function<std::unique_ptr<ProxySession>(const Cluster&)>;

    explicit ProxySessionRegistry(Factory factory);

    /// Session for @p cluster.id. Later calls with the same id return the
    /// same session, whatever the other fields say.
    ProxySession& sessionFor(const Cluster& cluster);

    /// nullptr if no session was created for @p clusterId yet.
    ProxySession* find(const std::string& clusterId) const;

    std::size_t size() const { return mSessions.size(); }

    /// exit() on every session.
    void exitAll();

    /// shutdown() on every session; used when the host is going away.
    void shutdownAll();

private:
    Factory                                              mFactory;
    std::map<std::string, std::unique_ptr<ProxySession>> mSessions;
};

} // namespace kube_auth_proxy
