#pragma once

#include <cstdint>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include <nlohmann/json.hpp>

namespace kube_auth_proxy {

/// Minimal HTTPS client for requests through a ready local proxy.
/// Built on Boost.Beast; trusts only the certificate the proxy serves.
class ProxyClient {
public:
    struct Response {
        unsigned int httpStatus = 0;
        nlohmann::json body;
    };

    /// @param port         Local proxy port (ProxySession::port()).
    /// @param apiPrefix    Session prefix, e.g. "/3f9c0d1e2a4b5c6d".
    /// @param certificate  PEM certificate the proxy was started with.
    /// @param timeoutMs    Per-operation timeout in milliseconds
    ProxyClient(uint16_t port,
                std::string apiPrefix,
                std::string certificate,
                int timeoutMs = 5000);

    /// GET @p path (e.g. "/version") below the API prefix.
    /// Suspends the calling coroutine; @p ioc keeps running other work.
    /// @throws std::runtime_error on network / timeout / parse errors.
    Response get(boost::asio::io_context& ioc,
                 const std::string& path,
                 boost::asio::yield_context yield);

    void setVerbose(bool v) { mVerbose = v; }

private:
    std::string mHost = "127.0.0.1";
    std::string mPort;
    std::string mApiPrefix;
    std::string mCertificate;
    int         mTimeoutMs;
    bool        mVerbose = false;
};

} // namespace kube_auth_proxy
