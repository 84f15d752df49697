#include "status.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace kube_auth_proxy {

const char* toString(StatusLevel level) {
    return level == StatusLevel::Error ? "error" : "info";
}

StreamStatusBroadcaster::StreamStatusBroadcaster(std::ostream& out,
                                                 std::string clusterId,
                                                 Format format)
    : mOut(out)
    , mClusterId(std::move(clusterId))
    , mFormat(format) {}

void StreamStatusBroadcaster::broadcast(const ConnectionStatus& status) {
    if (mFormat == Format::JsonLines) {
        nlohmann::json line;
        line["cluster"] = mClusterId;
        line["level"]   = toString(status.level);
        line["message"] = status.message;
        // Child output is not guaranteed to be valid UTF-8.
        mOut << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
             << "\n";
    } else {
        // Proxy output chunks usually carry their own newline.
        std::string message = status.message;
        while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
            message.pop_back();
        }
        mOut << "[" << mClusterId << "] [" << toString(status.level) << "] "
             << message << "\n";
    }
    mOut.flush();
}

StreamStatusBroadcaster::Format parseStatusFormat(const std::string& name) {
    if (name == "text") return StreamStatusBroadcaster::Format::Text;
    if (name == "json") return StreamStatusBroadcaster::Format::JsonLines;
    throw std::invalid_argument("Unknown status format: " + name);
}

} // namespace kube_auth_proxy
