#include <relay/tcp_server.hpp>

#include <system_error>
#include <thread>
#include <utility>

namespace relay
{
    static Logger &logger = Logger::getInstance();

    TcpServer::TcpServer(std::string name,
                         const std::string &host,
                         std::uint16_t port,
                         ConnectionHandler handler)
        : name_(std::move(name)),
          handler_(std::move(handler)),
          ioContext_(std::make_shared<net::io_context>()),
          acceptor_(nullptr),
          boundPort_(0),
          stopRequested_(false)
    {
        init_acceptor(host, port);
    }

    TcpServer::~TcpServer()
    {
        stop_async();
    }

    void TcpServer::init_acceptor(const std::string &host, std::uint16_t port)
    {
        boost::system::error_code ec;

        tcp::resolver resolver(*ioContext_);
        auto results = resolver.resolve(host, std::to_string(port),
                                        tcp::resolver::passive | tcp::resolver::numeric_service,
                                        ec);
        if (ec)
            throw std::system_error(ec, "resolve " + host);

        tcp::endpoint endpoint = results.begin()->endpoint();

        acceptor_ = std::make_unique<tcp::acceptor>(*ioContext_);

        acceptor_->open(endpoint.protocol(), ec);
        if (ec)
            throw std::system_error(ec, "open acceptor");

        acceptor_->set_option(net::socket_base::reuse_address(true), ec);
        if (ec)
            throw std::system_error(ec, "reuse_address");

        acceptor_->bind(endpoint, ec);
        if (ec)
            throw std::system_error(ec, "bind acceptor");

        acceptor_->listen(net::socket_base::max_listen_connections, ec);
        if (ec)
            throw std::system_error(ec, "listen acceptor");

        boundPort_ = acceptor_->local_endpoint().port();

        logger.log(Logger::Level::INFO,
                   "[Relay][{}] Listening on {}:{}", name_, host, boundPort_);
    }

    void TcpServer::run()
    {
        if (stopRequested_)
            return;

        start_accept();

        try
        {
            ioContext_->run();
        }
        catch (const std::exception &e)
        {
            logger.log(Logger::Level::ERROR,
                       "[Relay][{}] Accept loop error: {}", name_, e.what());
        }

        // the loop is over, so the acceptor is no longer shared with it
        if (acceptor_ && acceptor_->is_open())
        {
            boost::system::error_code ec;
            acceptor_->close(ec);
        }

        logger.log(Logger::Level::INFO, "[Relay][{}] Accept loop finished", name_);
    }

    void TcpServer::start_accept()
    {
        acceptor_->async_accept(
            [this](boost::system::error_code ec, tcp::socket socket)
            {
                if (ec)
                {
                    if (ec != net::error::operation_aborted)
                    {
                        logger.log(Logger::Level::WARN,
                                   "[Relay][{}] Accept error: {}", name_, ec.message());
                    }
                }
                else if (!stopRequested_)
                {
                    dispatch(std::move(socket));
                }

                if (!stopRequested_ && acceptor_->is_open())
                {
                    start_accept();
                }
            });
    }

    void TcpServer::dispatch(tcp::socket socket)
    {
        auto ctx = ioContext_;
        auto handler = handler_;
        auto sock = std::make_shared<tcp::socket>(std::move(socket));

        try
        {
            std::thread([ctx, handler, sock, name = name_]() mutable
                        {
                try
                {
                    handler(std::move(*sock));
                }
                catch (const std::exception &e)
                {
                    logger.log(Logger::Level::ERROR,
                               "[Relay][{}] Connection handler error: {}", name, e.what());
                }

                // the socket must go before the io_context it belongs to
                sock.reset(); })
                .detach();
        }
        catch (const std::system_error &e)
        {
            logger.log(Logger::Level::ERROR,
                       "[Relay][{}] Could not spawn handler thread: {}", name_, e.what());
        }
    }

    void TcpServer::stop_async()
    {
        stopRequested_.store(true);
        ioContext_->stop();
    }

} // namespace relay
