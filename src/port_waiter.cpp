#include "port_waiter.hpp"
#include "errors.hpp"

#include <algorithm>
#include <iostream>
#include <string>

namespace kube_auth_proxy {

using tcp = net::ip::tcp;

PortReachabilityWaiter::PortReachabilityWaiter(net::io_context& ioc,
                                               std::chrono::milliseconds pollInterval,
                                               std::chrono::milliseconds timeout)
    : mIoc(ioc)
    , mPollInterval(pollInterval)
    , mTimeout(timeout)
    , mPollTimer(ioc) {}

void PortReachabilityWaiter::waitUntilUsed(uint16_t port, net::yield_context yield) {
    const auto deadline = std::chrono::steady_clock::now() + mTimeout;
    int attempts = 0;

    while (!mCancelled) {
        ++attempts;
        if (tryConnect(port, deadline, yield)) {
            if (mVerbose) {
                std::cerr << "[PortWaiter] port " << port << " accepted a connection after "
                          << attempts << " attempt(s)\n";
            }
            return;
        }

        const auto now = std::chrono::steady_clock::now();
        if (mCancelled || now >= deadline) break;

        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        boost::system::error_code ec;
        mPollTimer.expires_after(std::min(mPollInterval, remaining));
        mPollTimer.async_wait(yield[ec]);

        if (std::chrono::steady_clock::now() >= deadline) break;
    }

    if (mCancelled) {
        throw PortUnreachable("Wait for port " + std::to_string(port) + " was cancelled");
    }
    throw PortUnreachable("Port " + std::to_string(port) +
                          " was not in use after " + std::to_string(mTimeout.count()) +
                          "ms (" + std::to_string(attempts) + " attempts)");
}

void PortReachabilityWaiter::cancel() {
    mCancelled = true;
    mPollTimer.cancel();
    if (mSocket) {
        boost::system::error_code ignored;
        mSocket->close(ignored);
    }
}

bool PortReachabilityWaiter::tryConnect(uint16_t port,
                                        std::chrono::steady_clock::time_point deadline,
                                        net::yield_context yield) {
    // Shared with the guard handler, which may run after this returns.
    auto socket = std::make_shared<tcp::socket>(mIoc);
    mSocket = socket;

    net::steady_timer guard(mIoc);
    guard.expires_at(deadline);
    guard.async_wait([socket](const boost::system::error_code& ec) {
        if (!ec) {
            boost::system::error_code ignored;
            socket->close(ignored);
        }
    });

    boost::system::error_code ec;
    socket->async_connect(tcp::endpoint(net::ip::address_v4::loopback(), port), yield[ec]);
    guard.cancel();
    mSocket.reset();

    if (ec || mCancelled) {
        if (mVerbose) {
            std::cerr << "[PortWaiter] port " << port << " not ready: "
                      << (ec ? ec.message() : "cancelled") << "\n";
        }
        return false;
    }

    boost::system::error_code ignored;
    socket->shutdown(tcp::socket::shutdown_both, ignored);
    socket->close(ignored);
    return true;
}

} // namespace kube_auth_proxy
