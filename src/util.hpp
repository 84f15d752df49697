#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace kube_auth_proxy {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;     // IPv6 literals are returned without brackets
    std::string port;     // "443", "6443", etc.
    std::string target;   // path component (e.g. "/")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Port number at the end of "host:port" style addresses
/// ("127.0.0.1:8001", "[::1]:8001", "localhost:8001").
/// Empty when the trailing segment is not a port in 1..65535.
std::optional<uint16_t> parseTrailingPort(const std::string& address);

/// Directory part of @p path, following POSIX dirname(1).
std::string dirnameOf(const std::string& path);

/// @p byteCount cryptographically random bytes as lowercase hex.
/// Throws std::runtime_error when the random source fails.
std::string randomHex(std::size_t byteCount);

} // namespace kube_auth_proxy
