#include <iostream>
#include <string>

#include <vix/config/Config.hpp>

#include <relay/config.hpp>
#include <relay/supervisor.hpp>
#include <relay/units.hpp>

int main(int argc, char **argv)
{
    const std::string configPath = (argc > 1) ? argv[1] : "config/config.json";

    relay::Config cfg;
    try
    {
        vix::config::Config coreConfig{configPath};
        cfg = relay::Config::from_core(coreConfig);
    }
    catch (const std::exception &e)
    {
        std::cerr << "[main] Cannot load configuration " << configPath << ": " << e.what() << std::endl;
        return 2;
    }

    relay::init_logging(cfg);

    relay::Supervisor supervisor{cfg.supervisorMode};
    supervisor.add(relay::make_http_unit(cfg))
        .add(relay::make_socket_unit(cfg));

    int rc = 0;
    for (const auto &result : supervisor.run_all())
    {
        if (!result.ok())
            rc = 1;
    }
    return rc;
}
