#ifndef RELAY_HTTP_FRONT_HPP
#define RELAY_HTTP_FRONT_HPP

/**
 * @file http_front.hpp
 * @brief Page-serving HTTP server with one message endpoint.
 *
 * Routes:
 *   GET  /, /index.html     → index.html
 *   GET  /message.html      → message.html
 *   GET  /error.html        → error.html
 *   GET  /static/<path>     → file below the static root
 *   GET  anything else      → 404 + error page
 *   POST /message           → deliver {username, message}, 302 to "/"
 *   body over 1 MiB         → 413 + error page
 *
 * Every connection is served by its own thread and carries one request.
 */

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/http.hpp>

#include <relay/config.hpp>
#include <relay/socket_client.hpp>
#include <relay/tcp_server.hpp>

namespace relay
{
    namespace http = boost::beast::http;

    using Request = http::request<http::string_body>;
    using Response = http::response<http::string_body>;

    /**
     * @brief Stateless request dispatcher.
     *
     * Only reads configuration and the filesystem; delivery goes through the
     * injected IMessageSender, so handle() can be called from any number of
     * threads at once.
     */
    class RequestHandler
    {
    public:
        RequestHandler(std::string pagesRoot,
                       std::string staticRoot,
                       std::shared_ptr<IMessageSender> sender);

        [[nodiscard]] Response handle(const Request &req) const;

        /// 413 answer for a request whose body went over the size limit.
        [[nodiscard]] Response payload_too_large(unsigned version) const;

    private:
        Response handle_get(std::string_view path, unsigned version) const;
        Response handle_message_post(const Request &req) const;

        Response serve_page(const std::string &name, unsigned version) const;
        Response serve_static(std::string_view relative, unsigned version) const;
        Response error_page(unsigned version,
                            http::status status = http::status::not_found) const;
        Response redirect_home(unsigned version) const;
        Response not_implemented(unsigned version) const;

        std::string pagesRoot_;
        std::string staticRoot_;
        std::shared_ptr<IMessageSender> sender_;
    };

    class HttpFront
    {
    public:
        /**
         * @brief Bind the HTTP listener.
         *
         * Without an explicit @p sender, messages are delivered with a
         * SocketSender aimed at cfg.socketHost:cfg.socketPort.
         *
         * @throws std::system_error when the listener cannot be set up.
         */
        explicit HttpFront(const Config &cfg,
                           std::shared_ptr<IMessageSender> sender = nullptr);

        HttpFront(const HttpFront &) = delete;
        HttpFront &operator=(const HttpFront &) = delete;

        /// Serve until stop() is called. Blocks.
        void run();

        void stop();

        std::uint16_t port() const noexcept { return server_->port(); }

        /// Read one request from @p socket, answer it, close.
        static void handle_session(tcp::socket socket, const RequestHandler &handler);

    private:
        std::shared_ptr<RequestHandler> handler_;
        std::unique_ptr<TcpServer> server_;
    };

} // namespace relay

#endif // RELAY_HTTP_FRONT_HPP
