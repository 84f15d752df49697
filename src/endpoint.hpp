#pragma once

#include "util.hpp"

#include <boost/asio/spawn.hpp>

#include <string>

namespace kube_auth_proxy {

namespace net = boost::asio;

/// Supplies the upstream Kubernetes API endpoint of a cluster.
class ApiEndpointResolver {
public:
    virtual ~ApiEndpointResolver() = default;

    /// May suspend. Throws on lookup failure.
    virtual UrlParts resolve(net::yield_context yield) = 0;
};

/// Resolver for an API URL known up front (from the launcher config).
class StaticApiEndpointResolver : public ApiEndpointResolver {
public:
    /// @throws std::invalid_argument if @p apiUrl is malformed.
    explicit StaticApiEndpointResolver(const std::string& apiUrl)
        : mParts(parseUrl(apiUrl)) {}

    UrlParts resolve(net::yield_context) override { return mParts; }

private:
    UrlParts mParts;
};

} // namespace kube_auth_proxy
