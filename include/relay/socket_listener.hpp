#ifndef RELAY_SOCKET_LISTENER_HPP
#define RELAY_SOCKET_LISTENER_HPP

/**
 * @file socket_listener.hpp
 * @brief Receives deliveries from the HTTP front and persists them.
 *
 * Responsibilities:
 *  - Check that the storage sink answers before accepting anything.
 *  - Accept TCP connections, one handler thread per connection.
 *  - Per connection: one read, parse JSON, stamp "date", insert once.
 *  - Always close the connection, never answer the peer.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <relay/config.hpp>
#include <relay/DocumentStore.hpp>
#include <relay/tcp_server.hpp>

namespace relay
{
    class SocketListener
    {
    public:
        SocketListener(const Config &cfg, std::shared_ptr<IDocumentStore> store);
        ~SocketListener();

        SocketListener(const SocketListener &) = delete;
        SocketListener &operator=(const SocketListener &) = delete;

        /**
         * @brief Ping the store, bind, then accept until stop() is called.
         *
         * @return false when startup was aborted because the store was
         *         unreachable (the accept loop was never entered), true once
         *         the accept loop has been stopped.
         * @throws std::system_error when the listening socket cannot be set up.
         */
        bool run();

        /// Stop accepting. Handlers already running finish on their own.
        void stop();

        /// Bound port, 0 until run() is listening.
        std::uint16_t port() const noexcept { return port_.load(); }

        bool is_listening() const noexcept { return listening_.load(); }

        /// Handle one accepted connection: single read, persist, close.
        static void handle_connection(tcp::socket socket,
                                      IDocumentStore &store,
                                      std::size_t bufferSize);

        /**
         * @brief Parse and persist one received payload.
         * @return true when exactly one document was inserted.
         */
        static bool process_payload(std::string_view data,
                                    IDocumentStore &store,
                                    const std::string &peer = "unknown");

    private:
        Config cfg_;
        std::shared_ptr<IDocumentStore> store_;

        std::mutex serverMutex_;
        std::unique_ptr<TcpServer> server_;

        std::atomic<bool> stopRequested_{false};
        std::atomic<bool> listening_{false};
        std::atomic<std::uint16_t> port_{0};
    };

} // namespace relay

#endif // RELAY_SOCKET_LISTENER_HPP
