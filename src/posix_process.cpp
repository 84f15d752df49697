#include "posix_process.hpp"
#include "errors.hpp"

#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/signal_set.hpp>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace kube_auth_proxy {

namespace {

/// Step of the child's setup that failed.
enum class ChildStage : int {
    Chdir,
    Execve,
};

const char* toString(ChildStage stage) {
    switch (stage) {
    case ChildStage::Chdir:  return "chdir";
    case ChildStage::Execve: return "execve";
    }
    return "unknown";
}

/// Written by the child to the error pipe when it cannot exec.
struct ChildFailure {
    ChildStage stage;
    int        error;
};

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

[[noreturn]] void reportChildFailure(int fd, ChildStage stage) {
    ChildFailure failure{stage, errno};
    ssize_t written = ::write(fd, &failure, sizeof(failure));
    (void)written;
    ::_exit(127);
}

class PosixProcess : public ProcessHandle,
                     public std::enable_shared_from_this<PosixProcess> {
public:
    PosixProcess(net::io_context& ioc,
                 pid_t pid,
                 std::string path,
                 int stdoutFd,
                 int stderrFd,
                 int failureFd,
                 std::unique_ptr<net::signal_set> sigchld)
        : mPid(pid)
        , mPath(std::move(path))
        , mStdout{net::posix::stream_descriptor(ioc, stdoutFd), {}, standardOutput()}
        , mStderr{net::posix::stream_descriptor(ioc, stderrFd), {}, standardError()}
        , mFailurePipe(ioc, failureFd)
        , mSigchld(std::move(sigchld)) {}

    void start() {
        readPipe(mStdout);
        readPipe(mStderr);
        watchChildFailure();
        waitForExit();
    }

    void kill() override {
        if (!mReaped && !mKilled) {
            ::kill(mPid, SIGTERM);
        }
        mKilled = true;

        // Reads complete with operation_aborted and end their streams.
        boost::system::error_code ec;
        mStdout.descriptor.close(ec);
        mStderr.descriptor.close(ec);
        mFailurePipe.close(ec);
    }

    int pid() const override { return static_cast<int>(mPid); }

private:
    struct Pipe {
        net::posix::stream_descriptor  descriptor;
        std::array<char, 4096>         buffer;
        std::shared_ptr<OutputStream>  output;
    };

    void readPipe(Pipe& pipe) {
        auto self = shared_from_this();
        pipe.descriptor.async_read_some(
            net::buffer(pipe.buffer),
            [this, self, &pipe](const boost::system::error_code& ec, std::size_t n) {
                if (n > 0) {
                    pipe.output->push(std::string(pipe.buffer.data(), n));
                }
                if (ec) {
                    pipe.output->end();
                    return;
                }
                readPipe(pipe);
            });
    }

    void watchChildFailure() {
        auto self = shared_from_this();
        net::async_read(
            mFailurePipe, net::buffer(&mFailure, sizeof(mFailure)),
            [this, self](const boost::system::error_code& ec, std::size_t n) {
                // EOF with nothing read means execve succeeded (CLOEXEC).
                if (ec || n != sizeof(mFailure)) return;

                emitError("spawn " + mPath + " failed: " + toString(mFailure.stage) + ": " +
                          std::strerror(mFailure.error));
            });
    }

    void waitForExit() {
        auto self = shared_from_this();
        mSigchld->async_wait(
            [this, self](const boost::system::error_code& ec, int) {
                if (ec) return;

                int status = 0;
                pid_t r = ::waitpid(mPid, &status, WNOHANG);
                if (r == 0 || (r < 0 && errno == EINTR)) {
                    // Another child changed state.
                    waitForExit();
                    return;
                }

                mReaped = true;
                boost::system::error_code ignored;
                mSigchld->cancel(ignored);

                int code = -1;
                if (r > 0 && WIFEXITED(status)) {
                    code = WEXITSTATUS(status);
                } else if (r > 0 && WIFSIGNALED(status)) {
                    code = 128 + WTERMSIG(status);
                }
                emitExit(code);
            });
    }

    pid_t                             mPid;
    std::string                       mPath;
    Pipe                              mStdout;
    Pipe                              mStderr;
    net::posix::stream_descriptor     mFailurePipe;
    ChildFailure                      mFailure{};
    std::unique_ptr<net::signal_set>  mSigchld;
    bool                              mReaped = false;
    bool                              mKilled = false;
};

} // namespace

PosixProcessSpawner::PosixProcessSpawner(net::io_context& ioc) : mIoc(ioc) {}

std::shared_ptr<ProcessHandle>
PosixProcessSpawner::spawn(const std::string& path,
                           const std::vector<std::string>& args,
                           const SpawnOptions& options)
{
    // Everything the child touches is built before fork.
    std::vector<std::string> argStore;
    argStore.push_back(path);
    argStore.insert(argStore.end(), args.begin(), args.end());

    std::vector<char*> argv;
    for (auto& a : argStore) argv.push_back(&a[0]);
    argv.push_back(nullptr);

    std::vector<std::string> envStore;
    for (const auto& kv : options.env) {
        envStore.push_back(kv.first + "=" + kv.second);
    }
    std::vector<char*> envp;
    for (auto& e : envStore) envp.push_back(&e[0]);
    envp.push_back(nullptr);

    int outPipe[2]     = {-1, -1};
    int errPipe[2]     = {-1, -1};
    int failurePipe[2] = {-1, -1};

    auto closeAll = [&] {
        for (int* fds : {outPipe, errPipe, failurePipe}) {
            closeFd(fds[0]);
            closeFd(fds[1]);
        }
    };

    if (::pipe2(outPipe, O_CLOEXEC) < 0 ||
        ::pipe2(errPipe, O_CLOEXEC) < 0 ||
        ::pipe2(failurePipe, O_CLOEXEC) < 0) {
        const std::string reason = std::strerror(errno);
        closeAll();
        throw SpawnError("Failed to create pipes for " + path + ": " + reason);
    }

    // Registered before fork so an early exit is not missed.
    auto sigchld = std::make_unique<net::signal_set>(mIoc, SIGCHLD);

    const pid_t pid = ::fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        closeAll();
        throw SpawnError("fork() failed for " + path + ": " + reason);
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) ::dup2(devNull, STDIN_FILENO);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);

        if (!options.cwd.empty() && ::chdir(options.cwd.c_str()) != 0) {
            reportChildFailure(failurePipe[1], ChildStage::Chdir);
        }
        ::execve(argv[0], argv.data(), envp.data());
        reportChildFailure(failurePipe[1], ChildStage::Execve);
    }

    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(failurePipe[1]);

    if (mVerbose) {
        std::cerr << "[PosixProcessSpawner] started " << path
                  << " (pid " << pid << ")\n";
    }

    auto process = std::make_shared<PosixProcess>(
        mIoc, pid, path, outPipe[0], errPipe[0], failurePipe[0],
        std::move(sigchld));
    process->start();
    return process;
}

Environment currentEnvironment() {
    Environment env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string kv(*entry);
        auto eq = kv.find('=');
        if (eq == std::string::npos) continue;
        env[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    return env;
}

} // namespace kube_auth_proxy
