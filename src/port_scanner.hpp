#pragma once

#include "async_event.hpp"
#include "process.hpp"

#include <boost/regex.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace kube_auth_proxy {

/// Pattern printed by the proxy once its listener is bound.
extern const char* const kStartingServePattern;

/// Finds the port a child process announces on one of its output streams.
///
/// A scanner serves a single attempt: create it, call scan() once, drop it.
class PortFromStreamScanner {
public:
    struct Options {
        /// Line pattern with a named group capturing "host:port".
        boost::regex lineRegex;
        std::string  captureGroup = "address";
        /// Called once, right before scan() returns the port.
        std::function<void()> onFind;
    };

    /// Options for the "starting to serve on <address>" announcement.
    static Options startingServeOptions(std::function<void()> onFind = nullptr);

    PortFromStreamScanner(net::io_context& ioc,
                          std::shared_ptr<OutputStream> stream,
                          Options options);
    ~PortFromStreamScanner();

    PortFromStreamScanner(const PortFromStreamScanner&)            = delete;
    PortFromStreamScanner& operator=(const PortFromStreamScanner&) = delete;

    /// Suspend until the first matching line.
    /// @throws PortDiscoveryFailed when the stream ends first or on cancel().
    uint16_t scan(net::yield_context yield);

    /// Abort an in-progress scan(); it fails with PortDiscoveryFailed.
    void cancel();

    void setVerbose(bool v) { mVerbose = v; }

private:
    void onChunk(const std::string& chunk);
    void onLine(const std::string& line);
    void finish();
    void detach();

    std::shared_ptr<OutputStream> mStream;
    Options                       mOptions;
    AsyncEvent                    mDone;
    std::string                   mPending;
    std::optional<uint16_t>       mPort;
    std::string                   mFailure;
    bool                          mFinished = false;
    bool                          mScanStarted = false;
    ListenerId                    mDataId   = 0;
    ListenerId                    mEndId    = 0;
    bool                          mVerbose  = false;
};

} // namespace kube_auth_proxy
