#pragma once

#include "async_event.hpp"
#include "certificate.hpp"
#include "cluster.hpp"
#include "endpoint.hpp"
#include "port_waiter.hpp"
#include "process.hpp"
#include "retry_policy.hpp"
#include "status.hpp"

#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kube_auth_proxy {

class PortFromStreamScanner;

/// Supervises the local authenticating proxy of one cluster.
///
/// run() spawns the proxy, finds the port it announces on stdout, waits until
/// that port accepts connections and marks the session ready. A failing stage
/// tears the process down and restarts the whole sequence with exponential
/// backoff until the RetryPolicy gives up.
///
/// Threading: every member must be called from the io_context's thread; run()
/// is a coroutine operation and suspends instead of blocking.
class ProxySession {
public:
    enum class State {
        Idle,
        Starting,
        AwaitingPort,
        AwaitingReachability,
        Ready,
        Failing,
        Fatal,
    };

    struct Options {
        std::string               proxyPath;
        std::vector<std::string>  proxyArgs;
        /// Environment the proxy variables are merged over.
        Environment               baseEnvironment;
        RetryPolicy               retryPolicy;
        std::chrono::milliseconds pollInterval        = PortReachabilityWaiter::kDefaultPollInterval;
        std::chrono::milliseconds reachabilityTimeout = PortReachabilityWaiter::kDefaultTimeout;
    };

    /// Substring of benign stderr output that is never broadcast.
    static constexpr const char* kTlsHandshakeNoise = "http: TLS handshake error";

    /// Collaborators are borrowed and must outlive the session.
    /// Destroying the session while run() is suspended makes that run()
    /// fail with SessionDestroyed once the io_context resumes it.
    ProxySession(net::io_context& ioc,
                 Cluster cluster,
                 Options options,
                 ProcessSpawner& spawner,
                 ApiEndpointResolver& resolver,
                 CertificateProvider& certificates,
                 StatusBroadcaster& broadcaster);
    ~ProxySession();

    ProxySession(const ProxySession&)            = delete;
    ProxySession& operator=(const ProxySession&) = delete;

    /// "/" followed by 16 random hex characters. Fixed for the session's life.
    const std::string& apiPrefix() const { return mApiPrefix; }

    /// Local port of the running proxy.
    /// @throws UninitializedPortAccess unless isReady().
    uint16_t port() const;

    bool isReady() const { return mReady; }
    int retryCount() const { return mRetryCount; }
    State state() const { return mState; }
    bool hasProcess() const { return mProcess != nullptr; }
    const Cluster& cluster() const { return mCluster; }

    /// Start the proxy, or join a start already in progress.
    /// Returns once ready. Concurrent callers share one start.
    /// @throws RetryExhausted when every retry failed.
    void run(net::yield_context yield);

    /// Stop the proxy and clear readiness. Idempotent.
    void exit();

    void resetRetryCount();

    /// Host teardown: exit() and make any in-flight or later run() fail with
    /// ProxyError instead of retrying. The session cannot be restarted.
    void shutdown();

    bool isShutDown() const { return mShutDown; }

    void setVerbose(bool v) { mVerbose = v; }

private:
    void startWithRetries(net::yield_context yield);
    void startOnce(net::yield_context yield);
    void finishStart();
    void attachListeners(ProcessHandle& process);
    Environment buildEnvironment(const CertificatePair& certificate) const;
    void broadcast(StatusLevel level, const std::string& message);
    void setState(State state);

    /// Expires when the destructor starts. Coroutines check it after every
    /// suspension, before touching the session again.
    using Lifetime = std::weak_ptr<bool>;
    static void throwIfDestroyed(const Lifetime& alive);

    net::io_context&     mIoc;
    Cluster              mCluster;
    Options              mOptions;
    ProcessSpawner&      mSpawner;
    ApiEndpointResolver& mResolver;
    CertificateProvider& mCertificates;
    StatusBroadcaster&   mBroadcaster;

    const std::string              mApiPrefix;
    std::optional<uint16_t>        mPort;
    bool                           mReady      = false;
    int                            mRetryCount = 0;
    State                          mState      = State::Idle;
    std::shared_ptr<ProcessHandle> mProcess;
    PortFromStreamScanner*         mActiveScanner = nullptr;
    PortReachabilityWaiter*        mActiveWaiter  = nullptr;
    net::steady_timer              mBackoffTimer;
    bool                           mShutDown = false;

    // Coalescing of concurrent run() calls.
    bool               mStartInFlight   = false;
    std::uint64_t      mCompletedStarts = 0;
    std::exception_ptr mLastStartFailure;
    AsyncEvent         mStateChanged;

    bool mVerbose = false;

    std::shared_ptr<bool> mAlive;
};

const char* toString(ProxySession::State state);

} // namespace kube_auth_proxy
