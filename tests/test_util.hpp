#ifndef RELAY_TESTS_TEST_UTIL_HPP
#define RELAY_TESTS_TEST_UTIL_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include <relay/DocumentStore.hpp>
#include <relay/socket_client.hpp>

namespace relay::test
{
    /// Fresh directory under the system temp dir, removed on destruction.
    class TempDir
    {
    public:
        TempDir();
        ~TempDir();

        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;

        const std::filesystem::path &path() const noexcept { return path_; }
        std::string str() const { return path_.string(); }

        /// Write @p content to path()/relative, creating parent directories.
        void write(const std::string &relative, const std::string &content) const;

    private:
        std::filesystem::path path_;
    };

    /// In-memory IDocumentStore recording every insert.
    class MemoryStore : public IDocumentStore
    {
    public:
        bool reachable = true;
        bool failInserts = false;

        bool ping() override;
        void insert_one(const nlohmann::json &doc) override;

        std::vector<nlohmann::json> documents() const;
        std::size_t size() const;

    private:
        mutable std::mutex mutex_;
        std::vector<nlohmann::json> docs_;
    };

    /// IMessageSender recording deliveries, optionally failing them.
    class RecordingSender : public IMessageSender
    {
    public:
        bool fail = false;

        void send(const Message &msg) override;

        std::vector<Message> sent() const;

    private:
        mutable std::mutex mutex_;
        std::vector<Message> sent_;
    };

    /// Poll @p pred until it holds or @p timeout elapses.
    bool wait_until(const std::function<bool()> &pred,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

    /// Write raw bytes to 127.0.0.1:port and close.
    void send_raw(unsigned short port, const std::string &bytes);

    struct HttpResult
    {
        unsigned status = 0;
        std::string location;
        std::string contentType;
        std::string body;
    };

    /// Minimal blocking HTTP/1.1 client against 127.0.0.1:port.
    HttpResult http_request(unsigned short port,
                            const std::string &method,
                            const std::string &target,
                            const std::string &body = {},
                            const std::string &contentType = "application/x-www-form-urlencoded");

    /// Write @p raw as-is, then read one HTTP response.
    HttpResult http_exchange(unsigned short port, const std::string &raw);

} // namespace relay::test

#endif // RELAY_TESTS_TEST_UTIL_HPP
