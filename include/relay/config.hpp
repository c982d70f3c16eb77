#ifndef RELAY_CONFIG_HPP
#define RELAY_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Relay-specific configuration.
 *
 * @details
 * Wraps the core `vix::config::Config` into a strongly-typed structure used
 * by the HTTP front, the socket listener and the storage sink. Keeps all
 * relay knobs in one place instead of scattering literals across the codebase.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include <vix/config/Config.hpp>

namespace relay
{
    enum class SupervisorMode
    {
        Process,
        Thread
    };

    /**
     * @struct Config
     * @brief Tunables for both relay units.
     */
    struct Config
    {
        // HTTP front
        std::string httpHost = "0.0.0.0";
        std::uint16_t httpPort = 8080;
        std::string pagesRoot = "public";
        std::string staticRoot = "public/static";

        // Socket listener
        std::string socketHost = "127.0.0.1";
        std::uint16_t socketPort = 5000;

        /// Size of the single read performed per delivery connection.
        std::size_t recvBufferSize = 1024;

        // Storage sink
        std::string storageUri = "sqlite://data";
        std::string databaseName = "relay";
        std::string collectionName = "messages";
        std::chrono::milliseconds pingTimeout{5000};

        SupervisorMode supervisorMode = SupervisorMode::Process;
        std::string logLevel = "info";

        /**
         * @brief Build a Config from the core Vix config.
         *
         * Expected keys (optional):
         *  - relay.http.host / relay.http.port
         *  - relay.http.pages_root / relay.http.static_root
         *  - relay.socket.host / relay.socket.port
         *  - relay.socket.recv_buffer        (int, bytes)
         *  - relay.storage.uri / relay.storage.database / relay.storage.collection
         *  - relay.storage.ping_timeout_ms   (int, milliseconds)
         *  - relay.supervisor.mode           ("process" | "thread")
         *  - relay.log_level                 ("debug" | "info" | "warn" | "error")
         *
         * @throws std::invalid_argument on out-of-range ports or an unknown
         *         supervisor mode.
         */
        static Config from_core(const vix::config::Config &core);
    };

    /// Validates a port number read from configuration (0 = ephemeral).
    std::uint16_t checked_port(int value, const char *key);

} // namespace relay

#endif // RELAY_CONFIG_HPP
