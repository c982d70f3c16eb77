#ifndef RELAY_DOCUMENT_STORE_HPP
#define RELAY_DOCUMENT_STORE_HPP

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace relay
{
    /// Raised by document stores when a write or a connection fails.
    class StoreError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief Storage abstraction for delivered messages.
     *
     * Expected semantics:
     *  - ping() : synchronous reachability check bounded by the store's own
     *             timeout. Never throws, returns false when unreachable.
     *  - insert_one(doc) : persists one JSON object as one document. Throws
     *             StoreError on failure. Must be callable concurrently from
     *             several handler threads.
     */
    class IDocumentStore
    {
    public:
        virtual ~IDocumentStore() = default;

        virtual bool ping() = 0;

        virtual void insert_one(const nlohmann::json &doc) = 0;
    };

} // namespace relay

#endif // RELAY_DOCUMENT_STORE_HPP
