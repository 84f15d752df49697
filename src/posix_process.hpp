#pragma once

#include "process.hpp"

#include <boost/asio.hpp>

namespace kube_auth_proxy {

namespace net = boost::asio;

/// ProcessSpawner backed by fork/execve.
///
/// stdout and stderr are pipes read asynchronously on @p ioc; child exit is
/// picked up through SIGCHLD. stdin is /dev/null. The executable path is used
/// as given (no PATH lookup).
class PosixProcessSpawner : public ProcessSpawner {
public:
    explicit PosixProcessSpawner(net::io_context& ioc);

    std::shared_ptr<ProcessHandle>
    spawn(const std::string& path,
          const std::vector<std::string>& args,
          const SpawnOptions& options) override;

    void setVerbose(bool v) { mVerbose = v; }

private:
    net::io_context& mIoc;
    bool             mVerbose = false;
};

/// The calling process's environment as a map.
Environment currentEnvironment();

} // namespace kube_auth_proxy
