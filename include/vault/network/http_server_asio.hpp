#pragma once

#include "vault/network/http_parser.hpp"
#include "vault/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <functional>
#include <memory>
#include <string>

namespace vault {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief Per-connection handler for async HTTP requests
 *
 * Uses enable_shared_from_this to keep the connection alive while async
 * operations are pending. One request per connection: the socket is shut
 * down after the response is written.
 *
 * Lifecycle:
 * 1. Created when connection is accepted
 * 2. start() begins async read operation
 * 3. Callbacks feed the parser until a full request is available
 * 4. Destroyed when the last pending operation completes
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, HttpRequestHandler handler, size_t max_body_bytes);

    void start();

private:
    void do_read();
    void do_write(const HttpResponse& response);
    void handle_error(HttpStatus status, const std::string& message);

    static HttpResponse create_error_response(HttpStatus status, const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpParser parser_;
    std::array<char, 64 * 1024> buffer_;
};

/**
 * @brief Event-driven HTTP server using Boost.Asio
 *
 * Thread safety:
 * - Call io_context.run() from server.threads threads
 * - The handler is called concurrently from those threads
 *
 * Usage:
 * ```cpp
 * asio::io_context io_context;
 * HttpServerAsio server(io_context, "0.0.0.0", 8080, max_body_bytes);
 * server.set_handler([&router](const HttpRequest& req) {
 *     return router.handle_request(req);
 * });
 * io_context.run();
 * ```
 */
class HttpServerAsio {
public:
    /**
     * @param io_context Boost.Asio event loop (must outlive this server)
     * @param port Port to listen on, 0 picks an ephemeral port
     */
    HttpServerAsio(asio::io_context& io_context, const std::string& bind_address,
                   uint16_t port, size_t max_body_bytes);

    void set_handler(HttpRequestHandler handler);

    /// Stop accepting; in-flight connections finish on their own.
    void stop();

    uint16_t get_port() const { return port_; }

private:
    void do_accept();

    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    size_t max_body_bytes_;
    uint16_t port_;
};

} // namespace network
} // namespace vault
