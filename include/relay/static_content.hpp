#ifndef RELAY_STATIC_CONTENT_HPP
#define RELAY_STATIC_CONTENT_HPP

#include <optional>
#include <string>
#include <string_view>

namespace relay
{
    /// Content type for a path, from its extension.
    /// Unknown extensions map to "application/octet-stream".
    std::string_view mime_type(std::string_view path);

    /// Whole file contents, or std::nullopt when it cannot be read.
    std::optional<std::string> load_file(const std::string &path);

    /**
     * @brief Map a request path below "/static/" onto the static root.
     *
     * Returns std::nullopt for anything that could escape the root: empty,
     * "." or ".." segments, backslashes and NUL bytes.
     */
    std::optional<std::string> resolve_static_path(const std::string &root,
                                                   std::string_view relative);

} // namespace relay

#endif // RELAY_STATIC_CONTENT_HPP
