#include "util.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <cctype>
#include <stdexcept>
#include <vector>

namespace kube_auth_proxy {

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Invalid URL (unsupported scheme): " + url);
    }

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find('/', hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = url.substr(hostStart);
        parts.target = "/";
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url.substr(pathStart);
    }

    // --- host / port ---
    std::string portText;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("Invalid URL (unterminated IPv6 host): " + url);
        }
        parts.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                throw std::invalid_argument("Invalid URL (bad authority): " + url);
            }
            portText = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.find(':');
        if (colon == std::string::npos) {
            parts.host = authority;
        } else {
            parts.host = authority.substr(0, colon);
            portText   = authority.substr(colon + 1);
        }
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }

    if (portText.empty()) {
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        if (!parseTrailingPort(":" + portText)) {
            throw std::invalid_argument("Invalid URL (bad port): " + url);
        }
        parts.port = portText;
    }
    return parts;
}

std::optional<uint16_t> parseTrailingPort(const std::string& address) {
    // Trim trailing whitespace left over from line-oriented output.
    auto end = address.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) return std::nullopt;

    auto colon = address.rfind(':', end);
    if (colon == std::string::npos || colon == end) return std::nullopt;

    const std::string digits = address.substr(colon + 1, end - colon);
    if (digits.size() > 5) return std::nullopt;

    unsigned long value = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        value = value * 10 + static_cast<unsigned long>(c - '0');
    }
    if (value == 0 || value > 65535) return std::nullopt;

    return static_cast<uint16_t>(value);
}

std::string dirnameOf(const std::string& path) {
    if (path.empty()) return ".";

    // Strip trailing slashes, but keep a lone root.
    auto end = path.find_last_not_of('/');
    if (end == std::string::npos) return "/";

    auto slash = path.rfind('/', end);
    if (slash == std::string::npos) return ".";

    auto dirEnd = path.find_last_not_of('/', slash);
    if (dirEnd == std::string::npos) return "/";

    return path.substr(0, dirEnd + 1);
}

std::string randomHex(std::size_t byteCount) {
    std::vector<unsigned char> bytes(byteCount);
    if (byteCount > 0 &&
        RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed: " +
                                 std::to_string(ERR_get_error()));
    }

    static const char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(byteCount * 2);
    for (unsigned char b : bytes) {
        out.push_back(kHex[b >> 4]);
        out.push_back(kHex[b & 0x0f]);
    }
    return out;
}

} // namespace kube_auth_proxy
