#ifndef RELAY_PROTOCOL_HPP
#define RELAY_PROTOCOL_HPP

/**
 * @file protocol.hpp
 * @brief JSON wire format between the HTTP front and the socket listener.
 *
 * Format on the wire (one TCP connection per message, written once):
 *
 * {
 *   "username": "alice",   // required, non-empty
 *   "message":  "hello"    // required, non-empty
 * }
 *
 * No length prefix, no acknowledgment, no schema version. The receiver adds
 * "date" (ISO-8601 UTC, milliseconds) before persisting:
 *
 *   "date": "2025-12-07T10:15:30.123Z"
 */

#include <chrono>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace relay
{
    /// A user submission as carried end-to-end.
    struct Message
    {
        std::string username;
        std::string message;

        /// Both fields must be non-empty before a Message leaves the HTTP front.
        bool complete() const noexcept
        {
            return !username.empty() && !message.empty();
        }
    };

    /// Serialize a Message to its UTF-8 JSON wire form.
    ///
    /// Invalid UTF-8 sequences coming from the form body are replaced with
    /// U+FFFD instead of throwing.
    inline std::string encode_message(const Message &m)
    {
        nlohmann::json j = nlohmann::json::object();
        j["username"] = m.username;
        j["message"] = m.message;

        return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    /// ISO-8601 UTC timestamp with millisecond precision: YYYY-MM-DDTHH:MM:SS.mmmZ
    inline std::string format_timestamp(std::chrono::system_clock::time_point tp)
    {
        using clock = std::chrono::system_clock;

        auto tt = clock::to_time_t(tp);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          tp.time_since_epoch())
                          .count() %
                      1000;
        if (millis < 0)
            millis += 1000;

        std::tm tm{};
#if defined(_WIN32)
        gmtime_s(&tm, &tt);
#else
        gmtime_r(&tt, &tm);
#endif
        char buf[40];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                      tm.tm_year + 1900,
                      tm.tm_mon + 1,
                      tm.tm_mday,
                      tm.tm_hour,
                      tm.tm_min,
                      tm.tm_sec,
                      static_cast<int>(millis));
        return buf;
    }

    inline std::string current_timestamp()
    {
        return format_timestamp(std::chrono::system_clock::now());
    }

    /// Parse a received payload into a storable document.
    ///
    /// Returns std::nullopt when the text is not valid JSON or not a JSON
    /// object; the reason goes to @p error when given. Does not check for
    /// `username` / `message`: the listener persists whatever object it
    /// receives.
    inline std::optional<nlohmann::json> parse_document(std::string_view text,
                                                        std::string *error = nullptr)
    {
        try
        {
            auto j = nlohmann::json::parse(text);
            if (!j.is_object())
            {
                if (error)
                    *error = std::string{"payload is a JSON "} + j.type_name() + ", not an object";
                return std::nullopt;
            }
            return j;
        }
        catch (const nlohmann::json::exception &e)
        {
            if (error)
                *error = e.what();
            return std::nullopt;
        }
    }

    /// Attach the receipt timestamp, replacing any sender-supplied date.
    inline void stamp_document(nlohmann::json &doc, const std::string &ts)
    {
        doc["date"] = ts;
    }

} // namespace relay

#endif // RELAY_PROTOCOL_HPP
