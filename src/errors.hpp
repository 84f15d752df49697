#pragma once

#include <stdexcept>
#include <string>

namespace kube_auth_proxy {

/// Base of all runtime failures raised while supervising the proxy.
class ProxyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The child process could not be created (fork / pipe failure).
class SpawnError : public ProxyError {
public:
    using ProxyError::ProxyError;
};

/// No matching "starting to serve on" line before stdout ended.
class PortDiscoveryFailed : public ProxyError {
public:
    using ProxyError::ProxyError;
};

/// A port was discovered but never accepted a connection in time.
class PortUnreachable : public ProxyError {
public:
    using ProxyError::ProxyError;
};

/// The session was destroyed while a run() was suspended in it.
class SessionDestroyed : public ProxyError {
public:
    SessionDestroyed() : ProxyError("proxy session destroyed during run()") {}
};

/// Stage that caused the last failed attempt.
enum class FailureCause {
    SpawnFailed,
    PortDiscoveryFailed,
    PortUnreachable,
};

inline const char* toString(FailureCause cause) {
    switch (cause) {
    case FailureCause::SpawnFailed:         return "SpawnFailed";
    case FailureCause::PortDiscoveryFailed: return "PortDiscoveryFailed";
    case FailureCause::PortUnreachable:     return "PortUnreachable";
    }
    return "Unknown";
}

/// Terminal failure of run(): every retry attempt was used up.
class RetryExhausted : public ProxyError {
public:
    RetryExhausted(FailureCause cause, const std::string& message)
        : ProxyError(message), mCause(cause) {}

    FailureCause cause() const { return mCause; }

private:
    FailureCause mCause;
};

/// port() was read while the session was not ready.
class UninitializedPortAccess : public std::logic_error {
public:
    UninitializedPortAccess()
        : std::logic_error("port has not yet been initialized") {}
};

} // namespace kube_auth_proxy
