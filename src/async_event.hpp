#pragma once

#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>

namespace kube_auth_proxy {

namespace net = boost::asio;

/// Wake-up point for coroutines running on one io_context.
/// wait() suspends the calling coroutine until notifyAll() is called.
/// Waiters must re-check their condition after waking.
class AsyncEvent {
public:
    explicit AsyncEvent(net::io_context& ioc) : mTimer(ioc) {
        mTimer.expires_at(net::steady_timer::time_point::max());
    }

    void wait(net::yield_context yield) {
        boost::system::error_code ec;
        mTimer.async_wait(yield[ec]);
    }

    void notifyAll() { mTimer.cancel(); }

private:
    net::steady_timer mTimer;
};

/// Suspend the calling coroutine for @p delay.
inline void sleepFor(net::io_context& ioc, net::yield_context yield,
                     net::steady_timer::duration delay) {
    boost::system::error_code ec;
    net::steady_timer timer(ioc);
    timer.expires_after(delay);
    timer.async_wait(yield[ec]);
}

} // namespace kube_auth_proxy
