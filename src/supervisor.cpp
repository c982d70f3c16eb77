#include <relay/supervisor.hpp>

#include <cerrno>
#include <cstdio>
#include <system_error>
#include <thread>
#include <utility>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <vix/utils/Logger.hpp>

namespace relay
{
    using Logger = vix::utils::Logger;

    static Logger &logger = Logger::getInstance();

    namespace
    {
        int run_guarded(const Unit &unit)
        {
            if (!unit.run)
                return 1;

            try
            {
                return unit.run();
            }
            catch (const std::exception &e)
            {
                logger.log(Logger::Level::ERROR,
                           "[Relay][Supervisor] Unit '{}' failed: {}", unit.name, e.what());
                return 1;
            }
        }

        void log_result(const UnitResult &r)
        {
            if (r.signal != 0)
            {
                logger.log(Logger::Level::ERROR,
                           "[Relay][Supervisor] Unit '{}' killed by signal {}", r.name, r.signal);
            }
            else if (r.exitCode != 0)
            {
                logger.log(Logger::Level::WARN,
                           "[Relay][Supervisor] Unit '{}' exited with code {}", r.name, r.exitCode);
            }
            else
            {
                logger.log(Logger::Level::INFO,
                           "[Relay][Supervisor] Unit '{}' finished", r.name);
            }
        }
    } // namespace

    Supervisor::Supervisor(SupervisorMode mode)
        : mode_(mode), units_()
    {
    }

    Supervisor &Supervisor::add(Unit unit)
    {
        units_.push_back(std::move(unit));
        return *this;
    }

    std::vector<UnitResult> Supervisor::run_all()
    {
        auto results = (mode_ == SupervisorMode::Process) ? run_processes() : run_threads();

        for (const auto &r : results)
            log_result(r);

        return results;
    }

    std::vector<UnitResult> Supervisor::run_processes()
    {
        std::vector<UnitResult> results(units_.size());
        std::vector<pid_t> pids(units_.size(), -1);

        // children must not replay buffered parent output
        std::fflush(nullptr);

        for (std::size_t i = 0; i < units_.size(); ++i)
        {
            results[i].name = units_[i].name;

            pid_t pid = ::fork();
            if (pid < 0)
            {
                const std::error_code ec(errno, std::generic_category());
                logger.log(Logger::Level::ERROR,
                           "[Relay][Supervisor] Could not start unit '{}': {}", units_[i].name, ec.message());
                results[i].exitCode = 1;
                continue;
            }

            if (pid == 0)
            {
                const int code = run_guarded(units_[i]);
                std::fflush(nullptr);
                ::_exit(code);
            }

            pids[i] = pid;
            logger.log(Logger::Level::INFO,
                       "[Relay][Supervisor] Started unit '{}' (pid {})", units_[i].name, static_cast<long>(pid));
        }

        for (std::size_t i = 0; i < units_.size(); ++i)
        {
            if (pids[i] < 0)
                continue;

            int status = 0;
            pid_t rc;
            do
            {
                rc = ::waitpid(pids[i], &status, 0);
            } while (rc < 0 && errno == EINTR);

            if (rc < 0)
            {
                const std::error_code ec(errno, std::generic_category());
                logger.log(Logger::Level::ERROR,
                           "[Relay][Supervisor] waitpid for '{}' failed: {}", units_[i].name, ec.message());
                results[i].exitCode = 1;
                continue;
            }

            if (WIFEXITED(status))
            {
                results[i].exitCode = WEXITSTATUS(status);
            }
            else if (WIFSIGNALED(status))
            {
                results[i].signal = WTERMSIG(status);
                results[i].exitCode = 128 + results[i].signal;
            }
        }

        return results;
    }

    std::vector<UnitResult> Supervisor::run_threads()
    {
        std::vector<UnitResult> results(units_.size());
        std::vector<std::thread> threads;
        threads.reserve(units_.size());

        for (std::size_t i = 0; i < units_.size(); ++i)
        {
            results[i].name = units_[i].name;

            try
            {
                // each thread writes only its own slot
                threads.emplace_back([this, i, &results]()
                                     { results[i].exitCode = run_guarded(units_[i]); });
            }
            catch (const std::system_error &e)
            {
                logger.log(Logger::Level::ERROR,
                           "[Relay][Supervisor] Could not start unit '{}': {}", units_[i].name, e.what());
                results[i].exitCode = 1;
                continue;
            }

            logger.log(Logger::Level::INFO,
                       "[Relay][Supervisor] Started unit '{}' (thread)", units_[i].name);
        }

        for (auto &t : threads)
        {
            if (t.joinable())
                t.join();
        }

        return results;
    }

} // namespace relay
