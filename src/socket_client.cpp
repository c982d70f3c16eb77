#include <relay/socket_client.hpp>

#include <utility>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>

namespace relay
{
    namespace net = boost::asio;
    using tcp = net::ip::tcp;

    SocketSender::SocketSender(std::string host, std::uint16_t port)
        : host_(std::move(host)), port_(port)
    {
    }

    void SocketSender::send(const Message &msg)
    {
        const std::string payload = encode_message(msg);

        net::io_context ioc{1};
        tcp::resolver resolver{ioc};
        tcp::socket socket{ioc};

        auto results = resolver.resolve(host_, std::to_string(port_));
        net::connect(socket, results);

        net::write(socket, net::buffer(payload));

        boost::system::error_code ignore;
        socket.shutdown(tcp::socket::shutdown_both, ignore);
        socket.close(ignore);
    }

} // namespace relay
