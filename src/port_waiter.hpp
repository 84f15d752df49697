#pragma once

#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>

#include <chrono>
#include <cstdint>
#include <memory>

namespace kube_auth_proxy {

namespace net = boost::asio;

/// Polls localhost until a TCP port accepts connections.
class PortReachabilityWaiter {
public:
    static constexpr std::chrono::milliseconds kDefaultPollInterval{500};
    static constexpr std::chrono::milliseconds kDefaultTimeout{10000};

    explicit PortReachabilityWaiter(net::io_context& ioc,
                                    std::chrono::milliseconds pollInterval = kDefaultPollInterval,
                                    std::chrono::milliseconds timeout      = kDefaultTimeout);

    /// Suspend until a connection to 127.0.0.1:@p port succeeds.
    /// The probe connection is closed right away.
    /// @throws PortUnreachable if the timeout elapses first or on cancel().
    void waitUntilUsed(uint16_t port, net::yield_context yield);

    /// Abort an in-progress waitUntilUsed().
    void cancel();

    void setVerbose(bool v) { mVerbose = v; }

private:
    /// One connect attempt, cut short at @p deadline.
    bool tryConnect(uint16_t port,
                    std::chrono::steady_clock::time_point deadline,
                    net::yield_context yield);

    net::io_context&                   mIoc;
    std::chrono::milliseconds          mPollInterval;
    std::chrono::milliseconds          mTimeout;
    net::steady_timer                  mPollTimer;
    std::shared_ptr<net::ip::tcp::socket> mSocket;
    bool                               mCancelled = false;
    bool                               mVerbose   = false;
};

} // namespace kube_auth_proxy
