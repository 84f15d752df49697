#pragma once

#include "listeners.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace kube_auth_proxy {

using Environment = std::map<std::string, std::string>;

/// Byte stream coming out of a child process (stdout or stderr).
/// Chunks are delivered as read; they are not aligned to lines.
class OutputStream {
public:
    ListenerId onData(std::function<void(const std::string&)> callback) {
        return mData.add(std::move(callback));
    }
    ListenerId onEnd(std::function<void()> callback) {
        return mEnd.add(std::move(callback));
    }

    void removeListener(ListenerId id) {
        mData.remove(id);
        mEnd.remove(id);
    }

    void removeAllListeners() {
        mData.clear();
        mEnd.clear();
    }

    /// Deliver a chunk to the data listeners. Ignored after end.
    void push(const std::string& chunk) {
        if (mEnded) return;
        mData.emit(chunk);
    }

    /// Mark the stream as finished. Only the first call notifies.
    void end() {
        if (mEnded) return;
        mEnded = true;
        mEnd.emit();
    }

    bool ended() const { return mEnded; }

    std::size_t listenerCount() const { return mData.size() + mEnd.size(); }

private:
    Listeners<const std::string&> mData;
    Listeners<>                   mEnd;
    bool                          mEnded = false;
};

/// A spawned child process observed through events.
/// Spawner implementations call the emit* methods; supervisors subscribe.
class ProcessHandle {
public:
    ProcessHandle()
        : mStdout(std::make_shared<OutputStream>())
        , mStderr(std::make_shared<OutputStream>()) {}

    virtual ~ProcessHandle() = default;

    ProcessHandle(const ProcessHandle&)            = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    const std::shared_ptr<OutputStream>& standardOutput() const { return mStdout; }
    const std::shared_ptr<OutputStream>& standardError() const { return mStderr; }

    ListenerId onError(std::function<void(const std::string&)> callback) {
        return mError.add(std::move(callback));
    }
    ListenerId onExit(std::function<void(int)> callback) {
        return mExit.add(std::move(callback));
    }
    ListenerId onDisconnect(std::function<void()> callback) {
        return mDisconnect.add(std::move(callback));
    }

    /// Drop the process-level listeners (stdio streams are separate).
    void removeAllListeners() {
        mError.clear();
        mExit.clear();
        mDisconnect.clear();
    }

    std::size_t listenerCount() const {
        return mError.size() + mExit.size() + mDisconnect.size();
    }

    void emitError(const std::string& message) { mError.emit(message); }
    void emitExit(int code) { mExit.emit(code); }
    void emitDisconnect() { mDisconnect.emit(); }

    /// Ask the process to terminate. Safe to call more than once.
    virtual void kill() = 0;

    virtual int pid() const = 0;

private:
    std::shared_ptr<OutputStream>   mStdout;
    std::shared_ptr<OutputStream>   mStderr;
    Listeners<const std::string&>   mError;
    Listeners<int>                  mExit;
    Listeners<>                     mDisconnect;
};

struct SpawnOptions {
    Environment env;
    std::string cwd;
};

/// Starts child processes.
class ProcessSpawner {
public:
    virtual ~ProcessSpawner() = default;

    /// @throws SpawnError when the process cannot be created at all.
    ///         Failures inside the child (exec, chdir) arrive as the
    ///         handle's error event instead.
    virtual std::shared_ptr<ProcessHandle>
    spawn(const std::string& path,
          const std::vector<std::string>& args,
          const SpawnOptions& options) = 0;
};

} // namespace kube_auth_proxy
