#include <relay/socket_listener.hpp>
#include <relay/protocol.hpp>

#include <utility>
#include <vector>

namespace relay
{
    static Logger &logger = Logger::getInstance();

    namespace
    {
        /// Shuts the connection down on every exit path.
        class ConnectionCloser
        {
        public:
            explicit ConnectionCloser(tcp::socket &socket) : socket_(socket) {}

            ~ConnectionCloser()
            {
                boost::system::error_code ignore;
                socket_.shutdown(tcp::socket::shutdown_both, ignore);
                socket_.close(ignore);
            }

            ConnectionCloser(const ConnectionCloser &) = delete;
            ConnectionCloser &operator=(const ConnectionCloser &) = delete;

        private:
            tcp::socket &socket_;
        };

        std::string peer_name(const tcp::socket &socket)
        {
            boost::system::error_code ec;
            auto ep = socket.remote_endpoint(ec);
            if (ec)
                return "unknown";
            return ep.address().to_string() + ":" + std::to_string(ep.port());
        }
    } // namespace

    SocketListener::SocketListener(const Config &cfg, std::shared_ptr<IDocumentStore> store)
        : cfg_(cfg),
          store_(std::move(store)),
          serverMutex_(),
          server_(nullptr),
          stopRequested_(false),
          listening_(false),
          port_(0)
    {
    }

    SocketListener::~SocketListener()
    {
        stop();
    }

    bool SocketListener::run()
    {
        bool reachable = false;
        try
        {
            reachable = store_ && store_->ping();
        }
        catch (const std::exception &e)
        {
            logger.log(Logger::Level::ERROR,
                       "[Relay][SocketListener] Storage health check failed: {}", e.what());
        }

        if (!reachable)
        {
            logger.log(Logger::Level::ERROR,
                       "[Relay][SocketListener] Could not connect to storage at {}, not accepting connections",
                       cfg_.storageUri);
            return false;
        }

        logger.log(Logger::Level::INFO,
                   "[Relay][SocketListener] Storage connection established");

        auto store = store_;
        const std::size_t bufferSize = cfg_.recvBufferSize;

        TcpServer *server = nullptr;
        {
            std::lock_guard<std::mutex> lock(serverMutex_);
            if (stopRequested_)
                return true;

            server_ = std::make_unique<TcpServer>(
                "SocketListener",
                cfg_.socketHost,
                cfg_.socketPort,
                [store, bufferSize](tcp::socket socket)
                {
                    handle_connection(std::move(socket), *store, bufferSize);
                });
            server = server_.get();
        }

        port_.store(server->port());
        listening_.store(true);

        server->run();

        listening_.store(false);
        return true;
    }

    void SocketListener::stop()
    {
        std::lock_guard<std::mutex> lock(serverMutex_);
        stopRequested_.store(true);
        if (server_)
            server_->stop_async();
    }

    void SocketListener::handle_connection(tcp::socket socket,
                                           IDocumentStore &store,
                                           std::size_t bufferSize)
    {
        ConnectionCloser closer(socket);
        const std::string peer = peer_name(socket);

        try
        {
            std::vector<char> buffer(bufferSize);

            boost::system::error_code ec;
            const std::size_t bytes = socket.read_some(net::buffer(buffer), ec);

            if (ec == net::error::eof || (!ec && bytes == 0))
            {
                logger.log(Logger::Level::DEBUG,
                           "[Relay][SocketListener] {} closed without a payload", peer);
                return;
            }

            if (ec)
            {
                logger.log(Logger::Level::ERROR,
                           "[Relay][SocketListener] Read error from {}: {}", peer, ec.message());
                return;
            }

            logger.log(Logger::Level::DEBUG,
                       "[Relay][SocketListener] Received {} bytes from {}", bytes, peer);

            process_payload(std::string_view(buffer.data(), bytes), store, peer);
        }
        catch (const std::exception &e)
        {
            logger.log(Logger::Level::ERROR,
                       "[Relay][SocketListener] Error handling connection from {}: {}", peer, e.what());
        }
    }

    bool SocketListener::process_payload(std::string_view data,
                                         IDocumentStore &store,
                                         const std::string &peer)
    {
        std::string error;
        auto doc = parse_document(data, &error);
        if (!doc)
        {
            logger.log(Logger::Level::ERROR,
                       "[Relay][SocketListener] Invalid payload from {}: {}", peer, error);
            return false;
        }

        stamp_document(*doc, current_timestamp());

        try
        {
            store.insert_one(*doc);
        }
        catch (const std::exception &e)
        {
            logger.log(Logger::Level::ERROR,
                       "[Relay][SocketListener] Error inserting message into storage: {}", e.what());
            return false;
        }

        logger.log(Logger::Level::INFO,
                   "[Relay][SocketListener] Stored message: {}",
                   doc->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        return true;
    }

} // namespace relay
