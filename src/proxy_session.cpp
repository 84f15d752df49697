#include "proxy_session.hpp"
#include "errors.hpp"
#include "port_scanner.hpp"
#include "util.hpp"

#include <iostream>

namespace kube_auth_proxy {

namespace {

/// Publishes the scanner or waiter of the current attempt so exit() can
/// cancel it. The slot lives in the session, so it is left alone once the
/// session is gone.
template <typename Stage>
class ActiveStageScope {
public:
    ActiveStageScope(Stage*& slot, Stage& stage, std::weak_ptr<bool> alive)
        : mSlot(slot), mAlive(std::move(alive)) {
        mSlot = &stage;
    }
    ~ActiveStageScope() {
        if (!mAlive.expired()) mSlot = nullptr;
    }

    ActiveStageScope(const ActiveStageScope&)            = delete;
    ActiveStageScope& operator=(const ActiveStageScope&) = delete;

private:
    Stage*&             mSlot;
    std::weak_ptr<bool> mAlive;
};

std::string retryNotice(FailureCause cause, int attempt, int maxAttempts) {
    const std::string counter =
        "(" + std::to_string(attempt) + "/" + std::to_string(maxAttempts) + ")...";
    if (cause == FailureCause::PortUnreachable) {
        return "Proxy port failed to be used within time limit, retrying " + counter;
    }
    return "Proxy port can't be found, retrying " + counter;
}

} // namespace

const char* toString(ProxySession::State state) {
    switch (state) {
    case ProxySession::State::Idle:                 return "Idle";
    case ProxySession::State::Starting:             return "Starting";
    case ProxySession::State::AwaitingPort:         return "AwaitingPort";
    case ProxySession::State::AwaitingReachability: return "AwaitingReachability";
    case ProxySession::State::Ready:                return "Ready";
    case ProxySession::State::Failing:              return "Failing";
    case ProxySession::State::Fatal:                return "Fatal";
    }
    return "Unknown";
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

ProxySession::ProxySession(net::io_context& ioc,
                           Cluster cluster,
                           Options options,
                           ProcessSpawner& spawner,
                           ApiEndpointResolver& resolver,
                           CertificateProvider& certificates,
                           StatusBroadcaster& broadcaster)
    : mIoc(ioc)
    , mCluster(std::move(cluster))
    , mOptions(std::move(options))
    , mSpawner(spawner)
    , mResolver(resolver)
    , mCertificates(certificates)
    , mBroadcaster(broadcaster)
    , mApiPrefix("/" + randomHex(8))
    , mBackoffTimer(ioc)
    , mStateChanged(ioc)
    , mAlive(std::make_shared<bool>(true)) {}

ProxySession::~ProxySession() {
    // Suspended runs resume after this returns; they must see the expiry.
    mAlive.reset();

    if (mActiveScanner) {
        mActiveScanner->cancel();
    }
    if (mActiveWaiter) {
        mActiveWaiter->cancel();
    }
    if (mProcess) {
        mProcess->removeAllListeners();
        mProcess->standardError()->removeAllListeners();
        mProcess->standardOutput()->removeAllListeners();
        mProcess->kill();
        mProcess.reset();
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

uint16_t ProxySession::port() const {
    if (!mReady || !mPort) {
        throw UninitializedPortAccess();
    }
    return *mPort;
}

void ProxySession::throwIfDestroyed(const Lifetime& alive) {
    if (alive.expired()) {
        throw SessionDestroyed();
    }
}

void ProxySession::run(net::yield_context yield) {
    const Lifetime alive = mAlive;
    for (;;) {
        if (mShutDown) {
            throw ProxyError("proxy session for cluster " + mCluster.id + " was shut down");
        }
        if (mReady) return;

        if (!mStartInFlight) {
            startWithRetries(yield);
            return;
        }

        // Another caller is already starting the proxy: wait for its outcome.
        const auto seen = mCompletedStarts;
        while (mStartInFlight && mCompletedStarts == seen && !mReady) {
            mStateChanged.wait(yield);
            throwIfDestroyed(alive);
        }
        if (mReady) return;
        if (mCompletedStarts != seen && mLastStartFailure) {
            std::rethrow_exception(mLastStartFailure);
        }
        // The start succeeded but the proxy is already gone again; start anew.
    }
}

void ProxySession::exit() {
    mReady = false;
    mPort.reset();

    if (mActiveScanner) {
        mActiveScanner->cancel();
    }
    if (mActiveWaiter) {
        mActiveWaiter->cancel();
    }

    if (mProcess) {
        std::cerr << "[ProxySession] stopping local proxy for cluster "
                  << mCluster.id << "\n";

        std::shared_ptr<ProcessHandle> process = std::move(mProcess);
        mProcess.reset();
        process->removeAllListeners();
        process->standardError()->removeAllListeners();
        process->standardOutput()->removeAllListeners();
        process->kill();

        // exit() may run inside one of the process's own event handlers;
        // keep the handle alive until that handler has unwound.
        net::post(mIoc, [process] {});
    }

    if (!mStartInFlight) {
        setState(State::Idle);
    }
    mStateChanged.notifyAll();
}

void ProxySession::resetRetryCount() {
    mRetryCount = RetryPolicy::reset();
    if (mVerbose) {
        std::cerr << "[ProxySession] retry count reset for cluster "
                  << mCluster.id << "\n";
    }
}

void ProxySession::shutdown() {
    mShutDown = true;
    mBackoffTimer.cancel();
    exit();
}

// ---------------------------------------------------------------------------
// Start sequence
// ---------------------------------------------------------------------------

void ProxySession::startWithRetries(net::yield_context yield) {
    const Lifetime alive = mAlive;
    mStartInFlight    = true;
    mLastStartFailure = nullptr;

    try {
        for (;;) {
            FailureCause cause = FailureCause::PortDiscoveryFailed;
            try {
                startOnce(yield);
                break;
            } catch (const SpawnError& e) {
                std::cerr << "[ProxySession] spawn failed: " << e.what() << "\n";
                cause = FailureCause::SpawnFailed;
            } catch (const PortDiscoveryFailed& e) {
                std::cerr << "[ProxySession] port discovery failed: " << e.what() << "\n";
                cause = FailureCause::PortDiscoveryFailed;
            } catch (const PortUnreachable& e) {
                std::cerr << "[ProxySession] waiting for port failed: " << e.what() << "\n";
                cause = FailureCause::PortUnreachable;
            }

            throwIfDestroyed(alive);
            exit();
            setState(State::Failing);
            if (mShutDown) {
                throw ProxyError("proxy session for cluster " + mCluster.id + " was shut down");
            }

            const RetryPolicy& policy = mOptions.retryPolicy;
            if (!policy.shouldRetry(mRetryCount)) {
                setState(State::Fatal);
                if (cause == FailureCause::PortUnreachable) {
                    broadcast(StatusLevel::Error,
                              "Proxy failed to connect after maximum retry attempts. "
                              "Please check your authentication and try reconnecting.");
                    throw RetryExhausted(cause,
                                         "Proxy connection failed after maximum retry attempts");
                }
                broadcast(StatusLevel::Error,
                          "Proxy failed to start after maximum retry attempts. "
                          "Please check your authentication and try reconnecting.");
                throw RetryExhausted(cause, "Proxy startup failed after maximum retry attempts");
            }

            ++mRetryCount;
            broadcast(StatusLevel::Error,
                      retryNotice(cause, mRetryCount, policy.maxAttempts()));

            const auto delay = policy.delay(mRetryCount);
            std::cerr << "[ProxySession] waiting " << delay.count()
                      << "ms before retry attempt " << mRetryCount << "/"
                      << policy.maxAttempts() << " (cluster " << mCluster.id << ")\n";
            boost::system::error_code ec;
            mBackoffTimer.expires_after(delay);
            mBackoffTimer.async_wait(yield[ec]);
            throwIfDestroyed(alive);
            if (mShutDown) {
                throw ProxyError("proxy session for cluster " + mCluster.id + " was shut down");
            }
        }
    } catch (const std::exception&) {
        // Nothing of the session is left to clean up.
        if (alive.expired()) throw;
        // Resolver and certificate errors skip the retry path; make sure no
        // half-started process survives them.
        exit();
        // Recorded for coalesced callers, then passed on to ours.
        mLastStartFailure = std::current_exception();
        finishStart();
        throw;
    }

    finishStart();
}

void ProxySession::startOnce(net::yield_context yield) {
    const Lifetime alive = mAlive;
    setState(State::Starting);

    const UrlParts apiUrl               = mResolver.resolve(yield);
    throwIfDestroyed(alive);
    const CertificatePair certificate   = mCertificates.certificateFor(apiUrl.host);

    SpawnOptions spawnOptions;
    spawnOptions.env = buildEnvironment(certificate);
    spawnOptions.cwd = dirnameOf(mCluster.kubeConfigPath);

    std::cerr << "[ProxySession] starting " << mOptions.proxyPath
              << " for cluster " << mCluster.id << "\n";

    auto process = mSpawner.spawn(mOptions.proxyPath, mOptions.proxyArgs, spawnOptions);
    mProcess = process;
    // Attached before the first suspension, so no event can be missed.
    attachListeners(*process);

    setState(State::AwaitingPort);
    uint16_t port = 0;
    {
        PortFromStreamScanner scanner(
            mIoc, process->standardOutput(),
            PortFromStreamScanner::startingServeOptions([this] {
                broadcast(StatusLevel::Info, "Authentication proxy started");
            }));
        scanner.setVerbose(mVerbose);

        ActiveStageScope<PortFromStreamScanner> scope(mActiveScanner, scanner, alive);
        port = scanner.scan(yield);
    }
    throwIfDestroyed(alive);
    if (mProcess != process) {
        throw PortDiscoveryFailed("proxy stopped during port discovery");
    }

    mPort = port;
    std::cerr << "[ProxySession] found port=" << port << " (cluster "
              << mCluster.id << ")\n";
    resetRetryCount();

    setState(State::AwaitingReachability);
    {
        PortReachabilityWaiter waiter(mIoc, mOptions.pollInterval, mOptions.reachabilityTimeout);
        waiter.setVerbose(mVerbose);

        ActiveStageScope<PortReachabilityWaiter> scope(mActiveWaiter, waiter, alive);
        waiter.waitUntilUsed(port, yield);
    }
    throwIfDestroyed(alive);

    if (mProcess != process) {
        throw PortUnreachable("proxy stopped while waiting for port " +
                              std::to_string(port));
    }

    mReady = true;
    resetRetryCount();
    setState(State::Ready);
    mStateChanged.notifyAll();
}

void ProxySession::finishStart() {
    mStartInFlight = false;
    ++mCompletedStarts;
    mStateChanged.notifyAll();
}

// ---------------------------------------------------------------------------
// Process events
// ---------------------------------------------------------------------------

void ProxySession::attachListeners(ProcessHandle& process) {
    process.onError([this](const std::string& message) {
        broadcast(StatusLevel::Error, message);
        exit();
    });

    process.onExit([this](int code) {
        if (code != 0) {
            broadcast(StatusLevel::Error, "proxy exited with code: " + std::to_string(code));
        } else {
            broadcast(StatusLevel::Info, "proxy exited successfully");
        }
        exit();
    });

    process.onDisconnect([this] {
        broadcast(StatusLevel::Error, "Proxy disconnected communications");
        exit();
    });

    process.standardError()->onData([this](const std::string& chunk) {
        if (chunk.find(kTlsHandshakeNoise) != std::string::npos) {
            return;
        }
        broadcast(StatusLevel::Error, chunk);
    });

    // Until the port is known, stdout belongs to the scanner alone.
    process.standardOutput()->onData([this](const std::string& chunk) {
        if (mPort) {
            broadcast(StatusLevel::Info, chunk);
        }
    });
}

Environment ProxySession::buildEnvironment(const CertificatePair& certificate) const {
    Environment env = mOptions.baseEnvironment;
    env["KUBECONFIG"]         = mCluster.kubeConfigPath;
    env["KUBECONFIG_CONTEXT"] = mCluster.contextName;
    env["API_PREFIX"]         = mApiPrefix;
    env["PROXY_KEY"]          = certificate.privateKey;
    env["PROXY_CERT"]         = certificate.cert;
    return env;
}

void ProxySession::broadcast(StatusLevel level, const std::string& message) {
    mBroadcaster.broadcast(ConnectionStatus{level, message});
}

void ProxySession::setState(State state) {
    if (mVerbose && state != mState) {
        std::cerr << "[ProxySession] " << mCluster.id << ": " << toString(mState)
                  << " -> " << toString(state) << "\n";
    }
    mState = state;
}

} // namespace kube_auth_proxy
