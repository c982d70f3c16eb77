#ifndef RELAY_SOCKET_CLIENT_HPP
#define RELAY_SOCKET_CLIENT_HPP

/**
 * @file socket_client.hpp
 * @brief Delivery of one Message to the socket listener.
 *
 * One TCP connection per message: resolve, connect, write the JSON payload
 * once, shut down, close. No retry and no acknowledgment wait.
 */

#include <cstdint>
#include <string>

#include <relay/protocol.hpp>

namespace relay
{
    /// Seam between the HTTP front and the transport used for delivery.
    class IMessageSender
    {
    public:
        virtual ~IMessageSender() = default;

        /// Deliver @p msg. Throws on transport failure.
        virtual void send(const Message &msg) = 0;
    };

    class SocketSender : public IMessageSender
    {
    public:
        SocketSender(std::string host, std::uint16_t port);

        /// @throws boost::system::system_error when resolve, connect or write fails.
        void send(const Message &msg) override;

    private:
        std::string host_;
        std::uint16_t port_;
    };

} // namespace relay

#endif // RELAY_SOCKET_CLIENT_HPP
