#include <relay/config.hpp>

#include <algorithm>
#include <stdexcept>

namespace relay
{
    std::uint16_t checked_port(int value, const char *key)
    {
        if (value < 0 || value > 65535)
        {
            std::string msg = "Invalid port for ";
            msg += key;
            msg += ": ";
            msg += std::to_string(value);
            throw std::invalid_argument(msg);
        }
        return static_cast<std::uint16_t>(value);
    }

    Config Config::from_core(const vix::config::Config &core)
    {
        Config cfg;

        if (core.has("relay.http.host"))
            cfg.httpHost = core.getString("relay.http.host", cfg.httpHost);

        if (core.has("relay.http.port"))
            cfg.httpPort = checked_port(core.getInt("relay.http.port", cfg.httpPort), "relay.http.port");

        if (core.has("relay.http.pages_root"))
            cfg.pagesRoot = core.getString("relay.http.pages_root", cfg.pagesRoot);

        if (core.has("relay.http.static_root"))
            cfg.staticRoot = core.getString("relay.http.static_root", cfg.staticRoot);

        if (core.has("relay.socket.host"))
            cfg.socketHost = core.getString("relay.socket.host", cfg.socketHost);

        if (core.has("relay.socket.port"))
            cfg.socketPort = checked_port(core.getInt("relay.socket.port", cfg.socketPort), "relay.socket.port");

        if (core.has("relay.socket.recv_buffer"))
        {
            auto v = core.getInt("relay.socket.recv_buffer", static_cast<int>(cfg.recvBufferSize));
            cfg.recvBufferSize = static_cast<std::size_t>(std::max(64, v)); // min 64 bytes
        }

        if (core.has("relay.storage.uri"))
            cfg.storageUri = core.getString("relay.storage.uri", cfg.storageUri);

        if (core.has("relay.storage.database"))
            cfg.databaseName = core.getString("relay.storage.database", cfg.databaseName);

        if (core.has("relay.storage.collection"))
            cfg.collectionName = core.getString("relay.storage.collection", cfg.collectionName);

        if (core.has("relay.storage.ping_timeout_ms"))
        {
            auto v = core.getInt("relay.storage.ping_timeout_ms", static_cast<int>(cfg.pingTimeout.count()));
            cfg.pingTimeout = std::chrono::milliseconds(std::max(100, v)); // min 100ms
        }

        if (core.has("relay.supervisor.mode"))
        {
            const std::string mode = core.getString("relay.supervisor.mode", "process");
            if (mode == "process")
                cfg.supervisorMode = SupervisorMode::Process;
            else if (mode == "thread")
                cfg.supervisorMode = SupervisorMode::Thread;
            else
                throw std::invalid_argument("Invalid relay.supervisor.mode: " + mode);
        }

        if (core.has("relay.log_level"))
            cfg.logLevel = core.getString("relay.log_level", cfg.logLevel);

        return cfg;
    }

} // namespace relay
