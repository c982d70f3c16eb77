#ifndef RELAY_TCP_SERVER_HPP
#define RELAY_TCP_SERVER_HPP

/**
 * @file tcp_server.hpp
 * @brief Low-level TCP accept engine shared by both relay units.
 *
 * This component:
 *  - owns the io_context and the acceptor
 *  - runs the asynchronous accept loop on the thread calling run()
 *  - hands every accepted socket to a dedicated handler thread
 *
 * Handlers run detached and keep the io_context alive through a shared_ptr,
 * so a slow peer never blocks the accept loop or other handlers.
 */

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <vix/utils/Logger.hpp>

namespace relay
{
    namespace net = boost::asio;
    using tcp = net::ip::tcp;
    using Logger = vix::utils::Logger;

    class TcpServer
    {
    public:
        /// Invoked on its own thread for every accepted connection.
        using ConnectionHandler = std::function<void(tcp::socket)>;

        /**
         * @brief Bind and listen immediately.
         * @throws std::system_error on resolve/open/bind/listen failure.
         */
        TcpServer(std::string name,
                  const std::string &host,
                  std::uint16_t port,
                  ConnectionHandler handler);

        ~TcpServer();

        TcpServer(const TcpServer &) = delete;
        TcpServer &operator=(const TcpServer &) = delete;

        /// Accept connections until stop_async() is called. Blocks.
        void run();

        /// Cooperative async stop: stops io_context_, run() then closes the acceptor.
        /// Safe to call from any thread.
        void stop_async();

        /// Actually bound port (useful when configured with port 0).
        std::uint16_t port() const noexcept { return boundPort_; }

    private:
        void init_acceptor(const std::string &host, std::uint16_t port);
        void start_accept();
        void dispatch(tcp::socket socket);

    private:
        std::string name_;
        ConnectionHandler handler_;

        std::shared_ptr<net::io_context> ioContext_;
        std::unique_ptr<tcp::acceptor> acceptor_;
        std::uint16_t boundPort_{0};

        std::atomic<bool> stopRequested_{false};
    };

} // namespace relay

#endif // RELAY_TCP_SERVER_HPP
