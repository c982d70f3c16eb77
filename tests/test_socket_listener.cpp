#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <boost/system/system_error.hpp>

#include <relay/socket_client.hpp>
#include <relay/socket_listener.hpp>

#include "test_util.hpp"

using namespace relay;

namespace
{
    Config loopback_config()
    {
        Config cfg;
        cfg.socketHost = "127.0.0.1";
        cfg.socketPort = 0;
        cfg.storageUri = "memory";
        return cfg;
    }

    /// Runs a SocketListener on its own thread for the lifetime of the object.
    class RunningListener
    {
    public:
        RunningListener(const Config &cfg, std::shared_ptr<IDocumentStore> store)
            : listener_(cfg, std::move(store))
        {
            thread_ = std::thread([this]()
                                  { result_ = listener_.run(); });
        }

        ~RunningListener()
        {
            listener_.stop();
            if (thread_.joinable())
                thread_.join();
        }

        bool wait_listening()
        {
            return test::wait_until([this]()
                                    { return listener_.is_listening(); });
        }

        std::uint16_t port() const { return listener_.port(); }

    private:
        SocketListener listener_;
        bool result_ = false;
        std::thread thread_;
    };
} // namespace

TEST(SocketListenerPayload, StampsAndStoresObject)
{
    test::MemoryStore store;

    const std::string before = format_timestamp(std::chrono::system_clock::now());
    ASSERT_TRUE(SocketListener::process_payload(
        R"({"username":"alice","message":"hello","date":"1999-01-01T00:00:00.000Z"})", store));
    const std::string after = format_timestamp(std::chrono::system_clock::now());

    auto docs = store.documents();
    ASSERT_EQ(docs.size(), 1u);
    EXPECT_EQ(docs[0]["username"], "alice");
    EXPECT_EQ(docs[0]["message"], "hello");
    ASSERT_TRUE(docs[0]["date"].is_string());

    // fixed-width ISO-8601 compares chronologically as text
    const std::string date = docs[0]["date"].get<std::string>();
    EXPECT_LE(before, date);
    EXPECT_LE(date, after);
}

TEST(SocketListenerPayload, PersistsObjectsWithoutExpectedFields)
{
    test::MemoryStore store;

    ASSERT_TRUE(SocketListener::process_payload(R"({"other":true})", store));
    EXPECT_EQ(store.size(), 1u);
}

TEST(SocketListenerPayload, MalformedInputInsertsNothing)
{
    test::MemoryStore store;

    EXPECT_FALSE(SocketListener::process_payload("not json at all", store));
    EXPECT_FALSE(SocketListener::process_payload(R"({"username":"trunc)", store));
    EXPECT_FALSE(SocketListener::process_payload("[1,2]", store));
    EXPECT_FALSE(SocketListener::process_payload("", store));
    EXPECT_EQ(store.size(), 0u);
}

TEST(SocketListenerPayload, InsertFailureIsReported)
{
    test::MemoryStore store;
    store.failInserts = true;

    EXPECT_FALSE(SocketListener::process_payload(R"({"username":"a","message":"b"})", store));
}

TEST(SocketListener, UnreachableStorageAbortsStartup)
{
    auto store = std::make_shared<test::MemoryStore>();
    store->reachable = false;

    SocketListener listener{loopback_config(), store};

    EXPECT_FALSE(listener.run());
    EXPECT_FALSE(listener.is_listening());
    EXPECT_EQ(listener.port(), 0);
}

TEST(SocketListener, StopBeforeRunReturnsWithoutListening)
{
    auto store = std::make_shared<test::MemoryStore>();
    SocketListener listener{loopback_config(), store};

    listener.stop();
    EXPECT_TRUE(listener.run());
    EXPECT_FALSE(listener.is_listening());
}

TEST(SocketListener, StoresMessagesSentOverLoopback)
{
    auto store = std::make_shared<test::MemoryStore>();
    RunningListener running{loopback_config(), store};
    ASSERT_TRUE(running.wait_listening());
    ASSERT_NE(running.port(), 0);

    SocketSender sender{"127.0.0.1", running.port()};
    sender.send(Message{"alice", "hello"});

    ASSERT_TRUE(test::wait_until([&]()
                                 { return store->size() == 1; }));

    auto doc = store->documents().front();
    EXPECT_EQ(doc["username"], "alice");
    EXPECT_EQ(doc["message"], "hello");
    EXPECT_TRUE(doc.contains("date"));
}

TEST(SocketListener, BadConnectionsDoNotStopTheListener)
{
    auto store = std::make_shared<test::MemoryStore>();
    RunningListener running{loopback_config(), store};
    ASSERT_TRUE(running.wait_listening());

    test::send_raw(running.port(), "");
    test::send_raw(running.port(), "garbage{");

    SocketSender sender{"127.0.0.1", running.port()};
    sender.send(Message{"bob", "still here"});

    ASSERT_TRUE(test::wait_until([&]()
                                 { return store->size() == 1; }));
    EXPECT_EQ(store->documents().front()["username"], "bob");
}

TEST(SocketSender, ConnectFailureThrows)
{
    // bind a port, then release it so nothing listens there
    std::uint16_t port = 0;
    {
        TcpServer probe{"probe", "127.0.0.1", 0, [](tcp::socket) {}};
        port = probe.port();
    }

    SocketSender sender{"127.0.0.1", port};
    EXPECT_THROW(sender.send(Message{"a", "b"}), boost::system::system_error);
}
