#ifndef RELAY_SUPERVISOR_HPP
#define RELAY_SUPERVISOR_HPP

/**
 * @file supervisor.hpp
 * @brief Starts the relay units side by side and waits for all of them.
 *
 * In Process mode every unit gets its own forked process, so a crash in one
 * unit never takes another one down. In Thread mode units share the current
 * process and only exceptions are contained. Crashed units are not restarted.
 */

#include <functional>
#include <string>
#include <vector>

#include <relay/config.hpp>

namespace relay
{
    /// A named unit of execution. run() returns the unit's exit code.
    struct Unit
    {
        std::string name;
        std::function<int()> run;
    };

    struct UnitResult
    {
        std::string name;
        int exitCode = 0;
        int signal = 0; ///< terminating signal in Process mode, 0 otherwise

        bool ok() const noexcept { return exitCode == 0 && signal == 0; }
    };

    class Supervisor
    {
    public:
        explicit Supervisor(SupervisorMode mode = SupervisorMode::Process);

        Supervisor &add(Unit unit);

        /**
         * @brief Start every unit concurrently and wait for all of them.
         * @return one result per unit, in registration order. A unit that
         *         could not be started reports exit code 1.
         */
        std::vector<UnitResult> run_all();

        SupervisorMode mode() const noexcept { return mode_; }

    private:
        std::vector<UnitResult> run_processes();
        std::vector<UnitResult> run_threads();

        SupervisorMode mode_;
        std::vector<Unit> units_;
    };

} // namespace relay

#endif // RELAY_SUPERVISOR_HPP
