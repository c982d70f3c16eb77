//
// examples/send_message.cpp
//
// Delivers one message straight to a running socket listener, the same way
// the HTTP front does after a form POST.
//
// Usage:
//   ./send_message <username> <message> [config/config.json]
//
// Wire format (written once, then the connection is closed):
//   { "username": "alice", "message": "hello" }
//

#include <iostream>
#include <string>

#include <vix/config/Config.hpp>

#include <relay.hpp>

int main(int argc, char **argv)
{
    if (argc < 3)
    {
        std::cerr << "usage: " << argv[0] << " <username> <message> [config.json]" << std::endl;
        return 2;
    }

    // ------------------------------------------------------------
    // 1) Load configuration (listener host/port)
    // ------------------------------------------------------------
    const std::string configPath = (argc > 3) ? argv[3] : "config/config.json";

    relay::Config cfg;
    try
    {
        vix::config::Config core{configPath};
        cfg = relay::Config::from_core(core);
    }
    catch (const std::exception &e)
    {
        std::cerr << "[send_message] Cannot load " << configPath << ": " << e.what() << std::endl;
        return 2;
    }

    // ------------------------------------------------------------
    // 2) Build the message, same presence check as the HTTP front
    // ------------------------------------------------------------
    relay::Message msg{argv[1], argv[2]};
    if (!msg.complete())
    {
        std::cerr << "[send_message] username and message must not be empty" << std::endl;
        return 2;
    }

    // ------------------------------------------------------------
    // 3) Send once, no acknowledgment
    // ------------------------------------------------------------
    try
    {
        relay::SocketSender sender{cfg.socketHost, cfg.socketPort};
        sender.send(msg);
    }
    catch (const std::exception &e)
    {
        std::cerr << "[send_message] Delivery failed: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "sent to " << cfg.socketHost << ":" << cfg.socketPort << std::endl;
    return 0;
}
