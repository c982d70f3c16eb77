#include <relay/units.hpp>
#include <relay/http_front.hpp>
#include <relay/socket_listener.hpp>
#include <relay/SqliteDocumentStore.hpp>

#include <memory>

namespace relay
{
    using Logger = vix::utils::Logger;

    Unit make_http_unit(const Config &cfg)
    {
        return Unit{
            "http",
            [cfg]()
            {
                HttpFront front(cfg);
                front.run();
                return 0;
            }};
    }

    Unit make_socket_unit(const Config &cfg)
    {
        return Unit{
            "socket",
            [cfg]()
            {
                auto store = std::make_shared<SqliteDocumentStore>(
                    cfg.storageUri, cfg.databaseName, cfg.collectionName, cfg.pingTimeout);

                SocketListener listener(cfg, store);
                return listener.run() ? 0 : 1;
            }};
    }

    Logger::Level parse_log_level(std::string_view name) noexcept
    {
        if (name == "debug")
            return Logger::Level::DEBUG;
        if (name == "warn" || name == "warning")
            return Logger::Level::WARN;
        if (name == "error")
            return Logger::Level::ERROR;
        return Logger::Level::INFO;
    }

    void init_logging(const Config &cfg)
    {
        auto &log = Logger::getInstance();
        log.setPattern("%Y-%m-%d %H:%M:%S.%e - %l - %v");
        log.setLevel(parse_log_level(cfg.logLevel));
    }

} // namespace relay
