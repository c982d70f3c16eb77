#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <relay/http_front.hpp>
#include <relay/socket_listener.hpp>
#include <relay/SqliteDocumentStore.hpp>

#include "test_util.hpp"

using namespace relay;

namespace
{
    /// Both units on loopback, ephemeral ports, SQLite in a temp dir.
    class RelayEndToEnd : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            site_.write("index.html", "<h1>home</h1>");
            site_.write("message.html", "<form method=\"post\" action=\"/message\"></form>");
            site_.write("error.html", "<h1>oops</h1>");
            site_.write("static/style.css", "body{}");

            cfg_.httpHost = "127.0.0.1";
            cfg_.httpPort = 0;
            cfg_.pagesRoot = site_.str();
            cfg_.staticRoot = (site_.path() / "static").string();
            cfg_.socketHost = "127.0.0.1";
            cfg_.socketPort = 0;
            cfg_.storageUri = "sqlite://" + data_.str();
        }

        void TearDown() override
        {
            if (front_)
                front_->stop();
            if (listener_)
                listener_->stop();

            for (auto *t : {&frontThread_, &listenerThread_})
            {
                if (t->joinable())
                    t->join();
            }
        }

        void start_listener()
        {
            store_ = std::make_shared<SqliteDocumentStore>(
                cfg_.storageUri, cfg_.databaseName, cfg_.collectionName);
            listener_ = std::make_unique<SocketListener>(cfg_, store_);
            listenerThread_ = std::thread([this]()
                                          { listener_->run(); });

            ASSERT_TRUE(test::wait_until([this]()
                                         { return listener_->is_listening(); }));
            cfg_.socketPort = listener_->port();
        }

        void start_front()
        {
            front_ = std::make_unique<HttpFront>(cfg_);
            frontThread_ = std::thread([this]()
                                       { front_->run(); });
        }

        test::HttpResult post_message(const std::string &user, const std::string &text)
        {
            return test::http_request(front_->port(), "POST", "/message",
                                      "username=" + user + "&message=" + text);
        }

        test::TempDir site_;
        test::TempDir data_;
        Config cfg_;

        std::shared_ptr<SqliteDocumentStore> store_;
        std::unique_ptr<SocketListener> listener_;
        std::unique_ptr<HttpFront> front_;
        std::thread listenerThread_;
        std::thread frontThread_;
    };
} // namespace

TEST_F(RelayEndToEnd, SubmittedMessageIsStored)
{
    start_listener();
    start_front();

    const std::string before = format_timestamp(std::chrono::system_clock::now());

    auto res = post_message("alice", "hello");
    EXPECT_EQ(res.status, 302u);
    EXPECT_EQ(res.location, "/");

    ASSERT_TRUE(test::wait_until([this]()
                                 { return store_->count() == 1; }));
    const std::string after = format_timestamp(std::chrono::system_clock::now());

    auto docs = store_->find_recent(1);
    ASSERT_EQ(docs.size(), 1u);
    EXPECT_EQ(docs[0].username, "alice");
    EXPECT_EQ(docs[0].message, "hello");
    EXPECT_LE(before, docs[0].date);
    EXPECT_LE(docs[0].date, after);
}

TEST_F(RelayEndToEnd, OversizedPostGets413AndIsNotDelivered)
{
    start_listener();
    start_front();

    // declared length over the 1 MiB limit; the body is never fully sent
    const std::string head =
        "POST /message HTTP/1.1\r\n"
        "Host: 127.0.0.1\r\n"
        "Content-Type: application/x-www-form-urlencoded\r\n"
        "Content-Length: 2097152\r\n"
        "\r\n"
        "username=alice&message=";

    auto res = test::http_exchange(front_->port(), head);
    EXPECT_EQ(res.status, 413u);
    EXPECT_EQ(res.body, "<h1>oops</h1>");

    // the front keeps serving and nothing reached storage
    EXPECT_EQ(post_message("alice", "small").status, 302u);
    ASSERT_TRUE(test::wait_until([this]()
                                 { return store_->count() == 1; }));
    EXPECT_EQ(store_->find_recent(5)[0].message, "small");
}

TEST_F(RelayEndToEnd, ResubmittingStoresTwoDocuments)
{
    start_listener();
    start_front();

    EXPECT_EQ(post_message("bob", "again").status, 302u);
    EXPECT_EQ(post_message("bob", "again").status, 302u);

    ASSERT_TRUE(test::wait_until([this]()
                                 { return store_->count() == 2; }));
}

TEST_F(RelayEndToEnd, ConcurrentPostsAreAllStored)
{
    start_listener();
    start_front();

    constexpr int clients = 12;

    std::vector<std::thread> threads;
    std::vector<unsigned> statuses(clients, 0);
    for (int i = 0; i < clients; ++i)
    {
        threads.emplace_back([this, i, &statuses]()
                             { statuses[i] = post_message("user" + std::to_string(i), "msg" + std::to_string(i)).status; });
    }
    for (auto &t : threads)
        t.join();

    for (unsigned s : statuses)
        EXPECT_EQ(s, 302u);

    ASSERT_TRUE(test::wait_until([this]()
                                 { return store_->count() == static_cast<std::size_t>(clients); }));

    std::set<std::string> users;
    for (const auto &doc : store_->find_recent(clients))
        users.insert(doc.username);
    EXPECT_EQ(users.size(), static_cast<std::size_t>(clients));
}

TEST_F(RelayEndToEnd, InvalidPostReachesNothing)
{
    start_listener();
    start_front();

    auto res = test::http_request(front_->port(), "POST", "/message", "username=alice");
    EXPECT_EQ(res.status, 404u);
    EXPECT_EQ(res.body, "<h1>oops</h1>");

    // a valid one afterwards is the only stored document
    EXPECT_EQ(post_message("alice", "ok").status, 302u);
    ASSERT_TRUE(test::wait_until([this]()
                                 { return store_->count() == 1; }));
    EXPECT_EQ(store_->find_recent(5).size(), 1u);
}

TEST_F(RelayEndToEnd, FrontServesPagesWhileStorageIsDown)
{
    // no listener: deliveries fail, pages are still served
    cfg_.socketPort = 1;
    start_front();

    auto index = test::http_request(front_->port(), "GET", "/");
    EXPECT_EQ(index.status, 200u);
    EXPECT_EQ(index.body, "<h1>home</h1>");

    auto css = test::http_request(front_->port(), "GET", "/static/style.css");
    EXPECT_EQ(css.status, 200u);
    EXPECT_EQ(css.contentType, "text/css");

    auto res = post_message("carol", "lost");
    EXPECT_EQ(res.status, 302u);
    EXPECT_EQ(res.location, "/");
}

TEST_F(RelayEndToEnd, ListenerRefusesToStartWithoutStorage)
{
    cfg_.storageUri = "sqlite://" + data_.str() + "/missing";

    auto store = std::make_shared<SqliteDocumentStore>(
        cfg_.storageUri, cfg_.databaseName, cfg_.collectionName, std::chrono::milliseconds{100});
    SocketListener listener{cfg_, store};

    EXPECT_FALSE(listener.run());
    EXPECT_FALSE(listener.is_listening());
}
