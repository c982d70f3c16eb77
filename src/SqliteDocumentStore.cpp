#include <relay/SqliteDocumentStore.hpp>
#include <relay/protocol.hpp>

#include <cctype>
#include <stdexcept>

#include <sqlite3.h>

#include <vix/utils/Logger.hpp>

namespace relay
{
    using Logger = vix::utils::Logger;

    // ───────────────────────── Internal helpers ─────────────────────────

    namespace
    {
        void sqlite_check(int rc, sqlite3 *db, const char *stage)
        {
            if (rc != SQLITE_OK && rc != SQLITE_ROW && rc != SQLITE_DONE)
            {
                std::string msg = "[SqliteDocumentStore] ";
                msg += stage;
                msg += " error: ";
                msg += sqlite3_errmsg(db);
                throw StoreError(msg);
            }
        }

        bool is_identifier(const std::string &name)
        {
            if (name.empty())
                return false;

            const auto first = static_cast<unsigned char>(name.front());
            if (!std::isalpha(first) && name.front() != '_')
                return false;

            for (char c : name)
            {
                const auto uc = static_cast<unsigned char>(c);
                if (!std::isalnum(uc) && c != '_')
                    return false;
            }
            return true;
        }

        /// Holds the connection mutex so errmsg stays tied to our own calls.
        class DbLock
        {
        public:
            explicit DbLock(sqlite3 *db) : mutex_(sqlite3_db_mutex(db))
            {
                if (mutex_)
                    sqlite3_mutex_enter(mutex_);
            }

            ~DbLock()
            {
                if (mutex_)
                    sqlite3_mutex_leave(mutex_);
            }

            DbLock(const DbLock &) = delete;
            DbLock &operator=(const DbLock &) = delete;

        private:
            sqlite3_mutex *mutex_;
        };

        /// Finalizes a prepared statement on every exit path.
        struct StmtGuard
        {
            sqlite3_stmt *stmt = nullptr;
            ~StmtGuard()
            {
                if (stmt)
                    sqlite3_finalize(stmt);
            }
        };

        std::string column_string(sqlite3_stmt *stmt, int col)
        {
            const unsigned char *text = sqlite3_column_text(stmt, col);
            if (!text)
                return {};
            return reinterpret_cast<const char *>(text);
        }

        void bind_optional_string(sqlite3_stmt *stmt, sqlite3 *db, int idx,
                                  const nlohmann::json &doc, const char *key)
        {
            int rc;
            auto it = doc.find(key);
            if (it != doc.end() && it->is_string())
            {
                const auto &s = it->get_ref<const std::string &>();
                rc = sqlite3_bind_text(stmt, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
            }
            else
            {
                rc = sqlite3_bind_null(stmt, idx);
            }
            sqlite_check(rc, db, key);
        }
    } // namespace

    // ───────────────────────── Ctor / Dtor ─────────────────────────

    SqliteDocumentStore::SqliteDocumentStore(const std::string &uri,
                                             const std::string &database,
                                             const std::string &collection,
                                             std::chrono::milliseconds timeout)
        : path_(),
          collection_(collection),
          timeout_(timeout),
          openMutex_(),
          db_(nullptr)
    {
        if (!is_identifier(database))
            throw std::invalid_argument("[SqliteDocumentStore] Invalid database name: " + database);

        if (!is_identifier(collection))
            throw std::invalid_argument("[SqliteDocumentStore] Invalid collection name: " + collection);

        path_ = resolve_path(uri, database);
    }

    SqliteDocumentStore::~SqliteDocumentStore()
    {
        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    std::string SqliteDocumentStore::resolve_path(const std::string &uri, const std::string &database)
    {
        static const std::string scheme = "sqlite://";

        std::string dir = uri;
        if (dir.compare(0, scheme.size(), scheme) == 0)
            dir.erase(0, scheme.size());

        if (dir.empty())
            dir = ".";

        if (dir.back() != '/')
            dir.push_back('/');

        return dir + database + ".db";
    }

    // ───────────────────────── Connection ─────────────────────────

    sqlite3 *SqliteDocumentStore::connection()
    {
        std::lock_guard<std::mutex> lock(openMutex_);
        if (db_)
            return db_;

        sqlite3 *db = nullptr;
        const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;

        int rc = sqlite3_open_v2(path_.c_str(), &db, flags, nullptr);
        if (rc != SQLITE_OK)
        {
            std::string msg = "[SqliteDocumentStore] Failed to open ";
            msg += path_;
            msg += ": ";
            msg += db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
            sqlite3_close(db);
            throw StoreError(msg);
        }

        sqlite3_busy_timeout(db, static_cast<int>(timeout_.count()));
        db_ = db;

        try
        {
            init_schema();
        }
        catch (const StoreError &)
        {
            sqlite3_close(db_);
            db_ = nullptr;
            throw;
        }

        return db_;
    }

    void SqliteDocumentStore::init_schema()
    {
        // WAL
        {
            char *errmsg = nullptr;
            int rc = sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, &errmsg);
            if (rc != SQLITE_OK)
            {
                std::string msg = "[SqliteDocumentStore] Failed to set WAL: ";
                if (errmsg)
                {
                    msg += errmsg;
                    sqlite3_free(errmsg);
                }
                throw StoreError(msg);
            }
        }

        const std::string sql =
            "CREATE TABLE IF NOT EXISTS \"" + collection_ + "\" ("
            "  _id      INTEGER PRIMARY KEY AUTOINCREMENT,"
            "  username TEXT,"
            "  message  TEXT,"
            "  date     TEXT NOT NULL,"
            "  document TEXT NOT NULL"
            ");";

        char *errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK)
        {
            std::string msg = "[SqliteDocumentStore] Failed to create collection: ";
            if (errmsg)
            {
                msg += errmsg;
                sqlite3_free(errmsg);
            }
            throw StoreError(msg);
        }
    }

    // ───────────────────────── ping() ─────────────────────────

    bool SqliteDocumentStore::ping()
    {
        try
        {
            sqlite3 *db = connection();
            DbLock lock(db);

            char *errmsg = nullptr;
            int rc = sqlite3_exec(db, "SELECT 1;", nullptr, nullptr, &errmsg);
            if (rc != SQLITE_OK)
            {
                std::string msg = errmsg ? errmsg : sqlite3_errstr(rc);
                sqlite3_free(errmsg);
                throw StoreError("[SqliteDocumentStore] ping error: " + msg);
            }
            return true;
        }
        catch (const StoreError &e)
        {
            Logger::getInstance().log(Logger::Level::ERROR,
                                      "[Relay][Storage] Ping failed: {}", e.what());
            return false;
        }
    }

    // ───────────────────────── insert_one() ─────────────────────────

    void SqliteDocumentStore::insert_one(const nlohmann::json &doc)
    {
        if (!doc.is_object())
            throw StoreError("[SqliteDocumentStore] insert_one expects a JSON object");

        nlohmann::json d = doc;
        if (!d.contains("date") || !d["date"].is_string())
            stamp_document(d, current_timestamp());

        const std::string date = d["date"].get<std::string>();
        const std::string text = d.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

        sqlite3 *db = connection();
        DbLock lock(db);

        const std::string sql =
            "INSERT INTO \"" + collection_ + "\" (username, message, date, document) "
            "VALUES (?, ?, ?, ?);";

        StmtGuard guard;
        int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &guard.stmt, nullptr);
        sqlite_check(rc, db, "prepare insert_one");

        bind_optional_string(guard.stmt, db, 1, d, "username");
        bind_optional_string(guard.stmt, db, 2, d, "message");

        rc = sqlite3_bind_text(guard.stmt, 3, date.c_str(), -1, SQLITE_TRANSIENT);
        sqlite_check(rc, db, "bind date");

        rc = sqlite3_bind_text(guard.stmt, 4, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
        sqlite_check(rc, db, "bind document");

        rc = sqlite3_step(guard.stmt);
        sqlite_check(rc, db, "step insert_one");
    }

    // ───────────────────────── Queries ─────────────────────────

    std::size_t SqliteDocumentStore::count()
    {
        sqlite3 *db = connection();
        DbLock lock(db);

        const std::string sql = "SELECT COUNT(*) FROM \"" + collection_ + "\";";

        StmtGuard guard;
        int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &guard.stmt, nullptr);
        sqlite_check(rc, db, "prepare count");

        rc = sqlite3_step(guard.stmt);
        sqlite_check(rc, db, "step count");

        if (rc != SQLITE_ROW)
            return 0;

        return static_cast<std::size_t>(sqlite3_column_int64(guard.stmt, 0));
    }

    std::vector<StoredDocument> SqliteDocumentStore::find_recent(std::size_t limit)
    {
        std::vector<StoredDocument> out;
        if (limit == 0)
            return out;

        sqlite3 *db = connection();
        DbLock lock(db);

        const std::string sql =
            "SELECT _id, username, message, date, document "
            "FROM \"" + collection_ + "\" "
            "ORDER BY _id DESC "
            "LIMIT ?1;";

        StmtGuard guard;
        int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &guard.stmt, nullptr);
        sqlite_check(rc, db, "prepare find_recent");

        rc = sqlite3_bind_int64(guard.stmt, 1, static_cast<sqlite3_int64>(limit));
        sqlite_check(rc, db, "bind limit");

        while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW)
        {
            StoredDocument doc;
            doc.id = sqlite3_column_int64(guard.stmt, 0);
            doc.username = column_string(guard.stmt, 1);
            doc.message = column_string(guard.stmt, 2);
            doc.date = column_string(guard.stmt, 3);

            // invalid document text -> empty object
            doc.document = nlohmann::json::parse(column_string(guard.stmt, 4), nullptr, false);
            if (doc.document.is_discarded())
                doc.document = nlohmann::json::object();

            out.push_back(std::move(doc));
        }

        if (rc != SQLITE_DONE)
        {
            sqlite_check(rc, db, "step find_recent");
        }

        return out; // newest-first
    }

} // namespace relay
