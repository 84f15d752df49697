#include "proxy_client.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

namespace kube_auth_proxy {

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

ProxyClient::ProxyClient(uint16_t port,
                         std::string apiPrefix,
                         std::string certificate,
                         int timeoutMs)
    : mPort(std::to_string(port))
    , mApiPrefix(std::move(apiPrefix))
    , mCertificate(std::move(certificate))
    , mTimeoutMs(timeoutMs)
{
    if (port == 0) {
        throw std::invalid_argument("ProxyClient needs a non-zero port");
    }
    if (mCertificate.empty()) {
        throw std::invalid_argument("ProxyClient needs the proxy certificate");
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

ProxyClient::Response ProxyClient::get(net::io_context& ioc,
                                       const std::string& path,
                                       net::yield_context yield)
{
    const std::string target =
        mApiPrefix + (path.empty() || path.front() != '/' ? "/" : "") + path;

    if (mVerbose) {
        std::cerr << "[ProxyClient] GET https://" << mHost << ":" << mPort
                  << target << "\n";
    }

    ssl::context ctx(ssl::context::tlsv12_client);

    // The proxy's own certificate is the only trusted authority.
    boost::system::error_code ec;
    ctx.add_certificate_authority(net::buffer(mCertificate), ec);
    if (ec) {
        throw std::runtime_error("Invalid proxy certificate: " + ec.message());
    }
    ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
    const auto timeout = std::chrono::milliseconds(mTimeoutMs);

    auto fail = [](const char* step, const boost::system::error_code& error) {
        return std::runtime_error(std::string("Request through proxy failed (") + step +
                                  "): " + error.message());
    };

    auto const results = resolver.async_resolve(mHost, mPort, yield[ec]);
    if (ec) throw fail("resolve", ec);

    beast::get_lowest_layer(stream).expires_after(timeout);
    beast::get_lowest_layer(stream).async_connect(results, yield[ec]);
    if (ec) throw fail("connect", ec);

    beast::get_lowest_layer(stream).expires_after(timeout);
    stream.async_handshake(ssl::stream_base::client, yield[ec]);
    if (ec) throw fail("handshake", ec);

    // Build request.
    http::request<http::string_body> req{http::verb::get, target, 11};
    req.set(http::field::host, mHost + ":" + mPort);
    req.set(http::field::accept, "application/json");
    req.set(http::field::user_agent, "kube-auth-proxy-launcher/1.0");

    beast::get_lowest_layer(stream).expires_after(timeout);
    http::async_write(stream, req, yield[ec]);
    if (ec) throw fail("write", ec);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::get_lowest_layer(stream).expires_after(timeout);
    http::async_read(stream, buffer, res, yield[ec]);
    if (ec) throw fail("read", ec);

    Response response;
    response.httpStatus = res.result_int();
    try {
        response.body = nlohmann::json::parse(res.body());
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(
            std::string("Failed to parse JSON response: ") + e.what());
    }

    if (mVerbose) {
        std::cerr << "[ProxyClient] HTTPS " << response.httpStatus << "\n";
    }

    // Graceful shutdown (the proxy often just drops the connection).
    beast::get_lowest_layer(stream).expires_after(timeout);
    stream.async_shutdown(yield[ec]);

    return response;
}

} // namespace kube_auth_proxy
