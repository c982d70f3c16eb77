#include <gtest/gtest.h>

#include <stdexcept>

#include <vix/config/Config.hpp>

#include <relay/config.hpp>

#include "test_util.hpp"

using namespace relay;

namespace
{
    Config load(const test::TempDir &dir, const std::string &json)
    {
        dir.write("config.json", json);
        vix::config::Config core{(dir.path() / "config.json").string()};
        return Config::from_core(core);
    }
} // namespace

TEST(RelayConfig, DefaultsWhenKeysAreAbsent)
{
    test::TempDir dir;
    const Config cfg = load(dir, "{}");

    EXPECT_EQ(cfg.httpHost, "0.0.0.0");
    EXPECT_EQ(cfg.httpPort, 8080);
    EXPECT_EQ(cfg.pagesRoot, "public");
    EXPECT_EQ(cfg.staticRoot, "public/static");
    EXPECT_EQ(cfg.socketHost, "127.0.0.1");
    EXPECT_EQ(cfg.socketPort, 5000);
    EXPECT_EQ(cfg.recvBufferSize, 1024u);
    EXPECT_EQ(cfg.storageUri, "sqlite://data");
    EXPECT_EQ(cfg.databaseName, "relay");
    EXPECT_EQ(cfg.collectionName, "messages");
    EXPECT_EQ(cfg.pingTimeout.count(), 5000);
    EXPECT_EQ(cfg.supervisorMode, SupervisorMode::Process);
    EXPECT_EQ(cfg.logLevel, "info");
}

TEST(RelayConfig, ReadsEveryKey)
{
    test::TempDir dir;
    const Config cfg = load(dir, R"({
        "relay": {
            "http": { "host": "127.0.0.1", "port": 9090,
                      "pages_root": "www", "static_root": "www/assets" },
            "socket": { "host": "localhost", "port": 6000, "recv_buffer": 4096 },
            "storage": { "uri": "sqlite:///var/lib/relay", "database": "db1",
                         "collection": "inbox", "ping_timeout_ms": 250 },
            "supervisor": { "mode": "thread" },
            "log_level": "debug"
        }
    })");

    EXPECT_EQ(cfg.httpHost, "127.0.0.1");
    EXPECT_EQ(cfg.httpPort, 9090);
    EXPECT_EQ(cfg.pagesRoot, "www");
    EXPECT_EQ(cfg.staticRoot, "www/assets");
    EXPECT_EQ(cfg.socketHost, "localhost");
    EXPECT_EQ(cfg.socketPort, 6000);
    EXPECT_EQ(cfg.recvBufferSize, 4096u);
    EXPECT_EQ(cfg.storageUri, "sqlite:///var/lib/relay");
    EXPECT_EQ(cfg.databaseName, "db1");
    EXPECT_EQ(cfg.collectionName, "inbox");
    EXPECT_EQ(cfg.pingTimeout.count(), 250);
    EXPECT_EQ(cfg.supervisorMode, SupervisorMode::Thread);
    EXPECT_EQ(cfg.logLevel, "debug");
}

TEST(RelayConfig, ClampsSmallBuffersAndTimeouts)
{
    test::TempDir dir;
    const Config cfg = load(dir, R"({"relay": {"socket": {"recv_buffer": 8},
                                               "storage": {"ping_timeout_ms": 1}}})");

    EXPECT_EQ(cfg.recvBufferSize, 64u);
    EXPECT_EQ(cfg.pingTimeout.count(), 100);
}

TEST(RelayConfig, RejectsInvalidValues)
{
    test::TempDir dir;

    EXPECT_THROW(load(dir, R"({"relay": {"http": {"port": 70000}}})"), std::invalid_argument);
    EXPECT_THROW(load(dir, R"({"relay": {"socket": {"port": -1}}})"), std::invalid_argument);
    EXPECT_THROW(load(dir, R"({"relay": {"supervisor": {"mode": "fiber"}}})"), std::invalid_argument);
}

TEST(RelayConfig, CheckedPortBounds)
{
    EXPECT_EQ(checked_port(0, "p"), 0);
    EXPECT_EQ(checked_port(65535, "p"), 65535);
    EXPECT_THROW(checked_port(65536, "p"), std::invalid_argument);
}
