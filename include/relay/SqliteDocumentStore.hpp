#ifndef RELAY_SQLITE_DOCUMENT_STORE_HPP
#define RELAY_SQLITE_DOCUMENT_STORE_HPP

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include <relay/DocumentStore.hpp>

struct sqlite3;

namespace relay
{
    /// A persisted row, as read back by find_recent().
    struct StoredDocument
    {
        long long id = 0;
        std::string username;
        std::string message;
        std::string date;
        nlohmann::json document;
    };

    /**
     * @brief SQLite implementation of IDocumentStore.
     *
     * The storage URI designates a directory (`sqlite://<dir>` or a plain
     * path). The database lives in `<dir>/<database>.db` and the collection
     * is a table of that database. The directory is never created: a
     * missing directory means the store is unreachable.
     *
     * The connection is opened lazily by ping() or the first insert, in
     * serialized mode, so one instance can be shared by all handler threads.
     */
    class SqliteDocumentStore : public IDocumentStore
    {
    public:
        SqliteDocumentStore(const std::string &uri,
                            const std::string &database,
                            const std::string &collection,
                            std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});
        ~SqliteDocumentStore() override;

        SqliteDocumentStore(const SqliteDocumentStore &) = delete;
        SqliteDocumentStore &operator=(const SqliteDocumentStore &) = delete;
        SqliteDocumentStore(SqliteDocumentStore &&) = delete;
        SqliteDocumentStore &operator=(SqliteDocumentStore &&) = delete;

        bool ping() override;

        void insert_one(const nlohmann::json &doc) override;

        /// Number of documents in the collection.
        [[nodiscard]] std::size_t count();

        /// Latest documents, newest-first.
        [[nodiscard]] std::vector<StoredDocument> find_recent(std::size_t limit);

        /// `<dir>/<database>.db` for a storage URI.
        static std::string resolve_path(const std::string &uri, const std::string &database);

    private:
        std::string path_;
        std::string collection_;
        std::chrono::milliseconds timeout_;

        std::mutex openMutex_;
        sqlite3 *db_{nullptr};

        sqlite3 *connection();
        void init_schema();
    };

} // namespace relay

#endif // RELAY_SQLITE_DOCUMENT_STORE_HPP
