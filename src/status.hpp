#pragma once

#include <ostream>
#include <string>

namespace kube_auth_proxy {

enum class StatusLevel { Info, Error };

const char* toString(StatusLevel level);

/// One connection-status update for the user-facing channel.
struct ConnectionStatus {
    StatusLevel level = StatusLevel::Info;
    std::string message;
};

/// Fire-and-forget sink for connection status updates.
class StatusBroadcaster {
public:
    virtual ~StatusBroadcaster() = default;
    virtual void broadcast(const ConnectionStatus& status) = 0;
};

/// Writes each status to a stream, as text or as one JSON object per line.
class StreamStatusBroadcaster : public StatusBroadcaster {
public:
    enum class Format { Text, JsonLines };

    /// @param clusterId  Tag added to every update so several clusters can
    ///                   share one stream.
    StreamStatusBroadcaster(std::ostream& out, std::string clusterId,
                            Format format = Format::Text);

    void broadcast(const ConnectionStatus& status) override;

private:
    std::ostream& mOut;
    std::string   mClusterId;
    Format        mFormat;
};

/// "text" or "json". Throws std::invalid_argument otherwise.
StreamStatusBroadcaster::Format parseStatusFormat(const std::string& name);

} // namespace kube_auth_proxy
