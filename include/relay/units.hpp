#ifndef RELAY_UNITS_HPP
#define RELAY_UNITS_HPP

#include <string_view>

#include <vix/utils/Logger.hpp>

#include <relay/config.hpp>
#include <relay/supervisor.hpp>

namespace relay
{
    /// HTTP front unit: exit code 0 when the server loop returns.
    Unit make_http_unit(const Config &cfg);

    /// Socket listener unit backed by SqliteDocumentStore: exit code 1 when
    /// startup was aborted because storage was unreachable.
    Unit make_socket_unit(const Config &cfg);

    /// "debug" | "info" | "warn" | "error", anything else maps to INFO.
    vix::utils::Logger::Level parse_log_level(std::string_view name) noexcept;

    /// Process-wide logging setup. Called once, before any unit starts.
    void init_logging(const Config &cfg);

} // namespace relay

#endif // RELAY_UNITS_HPP
