/// @file fakes.hpp
/// In-memory collaborators for ProxySession and registry tests.

#pragma once

#include "certificate.hpp"
#include "endpoint.hpp"
#include "errors.hpp"
#include "process.hpp"
#include "status.hpp"

#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>

#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace kube_auth_proxy {
namespace fakes {

using tcp     = net::ip::tcp;

class FakeProcess : public ProcessHandle {
public:
    void kill() override { ++killCount; }
    int pid() const override { return 4242; }

    /// Write one line to stdout as the proxy would.
    void say(const std::string& line) { standardOutput()->push(line + "\n"); }

    int killCount = 0;
};

/// Records every spawn and plays one scripted behaviour per spawn. The
/// behaviour runs from the io_context after spawn() has returned.
class FakeSpawner : public ProcessSpawner {
public:
    using Behaviour = std::function<void(FakeProcess&)>;

    struct Call {
        std::string              path;
        std::vector<std::string> args;
        SpawnOptions             options;
    };

    explicit FakeSpawner(net::io_context& ioc) : mIoc(ioc) {}

    std::shared_ptr<ProcessHandle>
    spawn(const std::string& path,
          const std::vector<std::string>& args,
          const SpawnOptions& options) override {
        calls.push_back({path, args, options});

        Behaviour behaviour = fallback;
        if (!script.empty()) {
            behaviour = std::move(script.front());
            script.pop_front();
        }
        if (failSpawn) {
            throw SpawnError("fake spawn failure for " + path);
        }

        auto process = std::make_shared<FakeProcess>();
        processes.push_back(process);
        if (behaviour) {
            net::post(mIoc, [process, behaviour] { behaviour(*process); });
        }
        return process;
    }

    std::deque<Behaviour>                     script;
    Behaviour                                 fallback;
    bool                                      failSpawn = false;
    std::vector<Call>                         calls;
    std::vector<std::shared_ptr<FakeProcess>> processes;

private:
    net::io_context& mIoc;
};

class RecordingBroadcaster : public StatusBroadcaster {
public:
    void broadcast(const ConnectionStatus& status) override { updates.push_back(status); }

    std::size_t count(StatusLevel level, const std::string& message) const {
        std::size_t n = 0;
        for (const auto& u : updates) {
            if (u.level == level && u.message == message) ++n;
        }
        return n;
    }

    bool containsText(const std::string& fragment) const {
        for (const auto& u : updates) {
            if (u.message.find(fragment) != std::string::npos) return true;
        }
        return false;
    }

    std::vector<ConnectionStatus> updates;
};

class FakeCertificateProvider : public CertificateProvider {
public:
    CertificatePair certificateFor(const std::string& hostname) override {
        requestedHosts.push_back(hostname);
        if (fail) {
            throw std::runtime_error("no certificate for " + hostname);
        }
        return {"KEY-" + hostname, "CERT-" + hostname};
    }

    bool                     fail = false;
    std::vector<std::string> requestedHosts;
};

/// Loopback listener that never accepts; the kernel completes connects.
class LoopbackListener {
public:
    explicit LoopbackListener(net::io_context& ioc)
        : mAcceptor(ioc, tcp::endpoint(net::ip::address_v4::loopback(), 0)) {}

    uint16_t port() const { return mAcceptor.local_endpoint().port(); }

private:
    tcp::acceptor mAcceptor;
};

/// A loopback port with nothing listening on it.
inline uint16_t unusedLoopbackPort() {
    net::io_context ioc;
    tcp::acceptor acceptor(ioc, tcp::endpoint(net::ip::address_v4::loopback(), 0));
    return acceptor.local_endpoint().port();
}

/// Outcome of a coroutine launched with launch().
struct TaskResult {
    bool               done = false;
    std::exception_ptr error;

    template <typename E>
    bool failedWith() const {
        if (!error) return false;
        try {
            std::rethrow_exception(error);
        } catch (const E&) {
            return true;
        } catch (const std::exception&) {
        }
        return false;
    }
};

/// Spawn @p body on @p ioc; its outcome lands in the returned result.
template <typename Body>
std::shared_ptr<TaskResult> launch(net::io_context& ioc, Body body) {
    auto result = std::make_shared<TaskResult>();
    net::spawn(ioc, [result, body](net::yield_context yield) {
        try {
            body(yield);
        } catch (const std::exception&) {
            result->error = std::current_exception();
        }
        result->done = true;
    });
    return result;
}

} // namespace fakes
} // namespace kube_auth_proxy
