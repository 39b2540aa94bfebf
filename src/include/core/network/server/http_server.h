#pragma once

#include <atomic>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <core/model/connection_state.h>
#include <core/model/security_context.h>
#include <core/util/config.h>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace edgegate::core {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

// Everything the handlers may look at for one request. Built fresh per request.
struct RequestContext {
    HttpRequest request;
    std::string remote_address;
    std::optional<ConnectionState> tls; // absent when served over plain HTTP
};

using RouteHandler = std::function<boost::asio::awaitable<HttpResponse>(RequestContext&&)>;

// Runs before routing. Filters shape the context; they cannot answer the request.
using RequestFilter = std::function<void(RequestContext&)>;

struct RouteInfo {
    boost::beast::http::verb method;
    RouteHandler handler;
};

// HTTP(S) server class
class HttpServer {
public:
    // `security_context` is only used when settings.tls is set.
    HttpServer(boost::asio::io_context& io_context,
               const ServerSettings& settings,
               const SecurityContext& security_context);

    ~HttpServer();

    // Routes and filters must be installed before Start().
    void AddRoute(const std::string& path, boost::beast::http::verb method, RouteHandler&& handler);

    void AddFilter(RequestFilter&& filter);

    // Binds and starts accepting. Returns false when the listener could not be opened.
    bool Start();

    void Stop();

    bool running() const { return running_; }

    // Port the acceptor is bound to; resolves a configured port of 0. Zero when not listening.
    unsigned short local_port() const;

    static HttpResponse Ok(unsigned int version,
                           bool keep_alive,
                           std::string_view body = {},
                           std::string_view content_type = "text/plain");
    static HttpResponse Unauthorized(unsigned int version,
                                     bool keep_alive,
                                     std::string_view error_message = "Unauthorized");
    static HttpResponse NotFound(unsigned int version,
                                 bool keep_alive,
                                 std::string_view error_message = "Not Found");
    static HttpResponse InternalServerError(
        unsigned int version,
        bool keep_alive,
        std::string_view error_message = "Internal Server Error");
    static HttpResponse MethodNotAllowed(unsigned int version,
                                         bool keep_alive,
                                         std::string_view error_message = "Method Not Allowed");
    static HttpResponse PayloadTooLarge(unsigned int version,
                                        bool keep_alive,
                                        std::string_view error_message = "Payload Too Large");
    static HttpResponse Error(boost::beast::http::status status,
                              unsigned int version,
                              bool keep_alive,
                              std::string_view error_message);

    // Runs the filter chain, then the matching route. Never throws.
    boost::asio::awaitable<HttpResponse> HandleRequest(RequestContext&& context);

private:
    // Accept connections
    boost::asio::awaitable<void> acceptConnections();

    boost::asio::awaitable<void> handleTlsConnection(boost::asio::ip::tcp::socket socket);

    boost::asio::awaitable<void> handlePlainConnection(boost::asio::ip::tcp::socket socket);

    // Request loop shared by both transports
    template<typename Stream>
    boost::asio::awaitable<void> serveSession(Stream& stream,
                                              const std::string& remote_address,
                                              const std::optional<ConnectionState>& tls);

    boost::asio::io_context& io_context_;
    ServerSettings settings_;
    std::optional<boost::asio::ssl::context> ssl_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::atomic<bool> running_;
    std::map<std::string, RouteInfo> routes_;
    std::vector<RequestFilter> filters_;
};

} // namespace edgegate::core
