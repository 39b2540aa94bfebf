#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <chrono>
#include <core/network/server/http_server.h>
#include <core/security/open_ssl_provider.h>
#include <spdlog/spdlog.h>

namespace edgegate::core {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

constexpr auto kReadTimeout = std::chrono::seconds(30);

std::string remoteAddressOf(const tcp::socket& socket) {
    boost::system::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string();
}

void closeStream(beast::ssl_stream<beast::tcp_stream>& stream) {
    beast::error_code ec;
    stream.shutdown(ec);
    if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
        spdlog::debug("Shutdown notice: {}", ec.message());
    }
}

void closeStream(beast::tcp_stream& stream) {
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

} // namespace

HttpServer::HttpServer(net::io_context& io_context,
                       const ServerSettings& settings,
                       const SecurityContext& security_context)
    : io_context_(io_context)
    , settings_(settings)
    , acceptor_(io_context)
    , running_(false) {
    if (settings_.tls) {
        ssl_context_.emplace(OpenSSLProvider::BuildServerContext(security_context.certificate_pem,
                                                                 security_context.private_key_pem));
    }
    spdlog::info("HttpServer created ({}).", settings_.tls ? "https" : "plain http");
}

HttpServer::~HttpServer() {
    if (running_) {
        Stop();
    }
    spdlog::info("HttpServer destroyed.");
}

void HttpServer::AddRoute(const std::string& path, http::verb method, RouteHandler&& handler) {
    routes_[path] = {method, std::move(handler)};
    spdlog::info("Added route: {} {}", std::string(http::to_string(method)), path);
}

void HttpServer::AddFilter(RequestFilter&& filter) {
    filters_.push_back(std::move(filter));
}

bool HttpServer::Start() {
    if (running_) {
        spdlog::warn("Server is already running.");
        return true;
    }

    try {
        tcp::endpoint endpoint(net::ip::make_address(settings_.address), settings_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(net::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(net::socket_base::max_listen_connections);
        running_ = true;
        spdlog::info("Server listening on {}:{}", settings_.address, local_port());

        net::co_spawn(io_context_, acceptConnections(), net::detached);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to start server on {}:{}: {}",
                      settings_.address,
                      settings_.port,
                      e.what());
        running_ = false;
        if (acceptor_.is_open()) {
            boost::system::error_code ec;
            acceptor_.close(ec);
        }
        return false;
    }
}

void HttpServer::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    boost::system::error_code ec;
    acceptor_.cancel(ec);
    acceptor_.close(ec);
    spdlog::info("Server stopped.");
}

unsigned short HttpServer::local_port() const {
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

HttpResponse HttpServer::Ok(unsigned int version,
                            bool keep_alive,
                            std::string_view body,
                            std::string_view content_type) {
    HttpResponse res{http::status::ok, version};
    res.keep_alive(keep_alive);
    res.set(http::field::content_type, content_type);
    res.body() = body;
    res.prepare_payload();
    return res;
}

HttpResponse HttpServer::Error(http::status status,
                               unsigned int version,
                               bool keep_alive,
                               std::string_view error_message) {
    HttpResponse res{status, version};
    res.keep_alive(keep_alive);
    res.set(http::field::content_type, "text/plain");
    res.body() = error_message;
    res.prepare_payload();
    return res;
}

HttpResponse HttpServer::Unauthorized(unsigned int version,
                                      bool keep_alive,
                                      std::string_view error_message) {
    return Error(http::status::unauthorized, version, keep_alive, error_message);
}

HttpResponse HttpServer::NotFound(unsigned int version,
                                  bool keep_alive,
                                  std::string_view error_message) {
    return Error(http::status::not_found, version, keep_alive, error_message);
}

HttpResponse HttpServer::InternalServerError(unsigned int version,
                                             bool keep_alive,
                                             std::string_view error_message) {
    return Error(http::status::internal_server_error, version, keep_alive, error_message);
}

HttpResponse HttpServer::MethodNotAllowed(unsigned int version,
                                          bool keep_alive,
                                          std::string_view error_message) {
    return Error(http::status::method_not_allowed, version, keep_alive, error_message);
}

HttpResponse HttpServer::PayloadTooLarge(unsigned int version,
                                         bool keep_alive,
                                         std::string_view error_message) {
    return Error(http::status::payload_too_large, version, keep_alive, error_message);
}

net::awaitable<void> HttpServer::acceptConnections() {
    while (running_) {
        try {
            tcp::socket socket = co_await acceptor_.async_accept(net::use_awaitable);
            spdlog::debug("Accepted connection from: {}", remoteAddressOf(socket));

            if (ssl_context_) {
                net::co_spawn(io_context_, handleTlsConnection(std::move(socket)), net::detached);
            } else {
                net::co_spawn(io_context_, handlePlainConnection(std::move(socket)), net::detached);
            }
        } catch (const boost::system::system_error& e) {
            if (e.code() == net::error::operation_aborted || !running_) {
                spdlog::info("Accept operation cancelled.");
                break;
            }
            spdlog::error("Error accepting connection: {}", e.what());
        } catch (const std::exception& e) {
            spdlog::error("Unexpected error during accept: {}", e.what());
        }
    }
    spdlog::info("Stopped accepting connections.");
}

net::awaitable<void> HttpServer::handleTlsConnection(tcp::socket socket) {
    std::string remote_address = remoteAddressOf(socket);
    beast::ssl_stream<beast::tcp_stream> stream(beast::tcp_stream(std::move(socket)),
                                                *ssl_context_);
    try {
        beast::get_lowest_layer(stream).expires_after(kReadTimeout);
        co_await stream.async_handshake(ssl::stream_base::server, net::use_awaitable);
        spdlog::debug("TLS handshake with {} completed", remote_address);

        ConnectionState connection;
        if (X509Ptr peer = OpenSSLProvider::Adopt(SSL_get1_peer_certificate(stream.native_handle()))) {
            connection.peer_certificates.push_back(std::move(peer));
        }

        co_await serveSession(stream, remote_address, std::optional<ConnectionState>(connection));
    } catch (const std::exception& e) {
        spdlog::debug("TLS session with {} ended: {}", remote_address, e.what());
    }
}

net::awaitable<void> HttpServer::handlePlainConnection(tcp::socket socket) {
    std::string remote_address = remoteAddressOf(socket);
    beast::tcp_stream stream(std::move(socket));
    try {
        co_await serveSession(stream, remote_address, std::nullopt);
    } catch (const std::exception& e) {
        spdlog::debug("Session with {} ended: {}", remote_address, e.what());
    }
}

template<typename Stream>
net::awaitable<void> HttpServer::serveSession(Stream& stream,
                                              const std::string& remote_address,
                                              const std::optional<ConnectionState>& tls) {
    beast::flat_buffer buffer;
    bool keep_alive = true;

    while (keep_alive) {
        http::request_parser<http::string_body> parser;
        parser.body_limit(settings_.max_request_bytes);
        beast::get_lowest_layer(stream).expires_after(kReadTimeout);

        beast::error_code ec;
        co_await http::async_read(stream,
                                  buffer,
                                  parser,
                                  net::redirect_error(net::use_awaitable, ec));
        if (ec == http::error::body_limit) {
            spdlog::warn("Request body from {} exceeds {} bytes",
                         remote_address,
                         settings_.max_request_bytes);
            HttpResponse res = PayloadTooLarge(parser.get().version(), false);
            co_await http::async_write(stream, res, net::redirect_error(net::use_awaitable, ec));
            break;
        }
        if (ec) {
            if (ec != http::error::end_of_stream && ec != beast::error::timeout
                && ec != net::error::eof && ec != net::error::operation_aborted) {
                spdlog::debug("Read from {} failed: {}", remote_address, ec.message());
            }
            break;
        }

        RequestContext context{parser.release(), remote_address, tls};
        spdlog::info("Received {} request for {} from {}",
                     std::string(context.request.method_string()),
                     std::string(context.request.target()),
                     remote_address);
        keep_alive = context.request.keep_alive();

        HttpResponse res = co_await HandleRequest(std::move(context));
        co_await http::async_write(stream, res, net::use_awaitable);
    }

    closeStream(stream);
}

net::awaitable<HttpResponse> HttpServer::HandleRequest(RequestContext&& context) {
    auto request_version = context.request.version();
    bool request_keep_alive = context.request.keep_alive();

    std::string path(context.request.target());
    if (auto query = path.find('?'); query != std::string::npos) {
        path.erase(query);
    }

    try {
        for (const auto& filter : filters_) {
            filter(context);
        }

        auto it = routes_.find(path);
        if (it == routes_.end()) {
            spdlog::warn("Route not found: {}", path);
            co_return NotFound(request_version, request_keep_alive);
        }

        const auto& route_info = it->second;
        if (route_info.method != context.request.method()) {
            spdlog::warn("Method not allowed for route {}: requested {}, expected {}",
                         path,
                         std::string(http::to_string(context.request.method())),
                         std::string(http::to_string(route_info.method)));
            co_return MethodNotAllowed(request_version, request_keep_alive);
        }

        co_return co_await route_info.handler(std::move(context));
    } catch (const std::exception& e) {
        spdlog::error("Error executing handler for {}: {}", path, e.what());
        co_return InternalServerError(request_version, request_keep_alive);
    }
}

} // namespace edgegate::core
