#ifndef RELAY_FORM_HPP
#define RELAY_FORM_HPP

#include <string>
#include <string_view>
#include <unordered_map>

namespace relay
{
    using FormFields = std::unordered_map<std::string, std::string>;

    /// Decode one application/x-www-form-urlencoded component.
    /// '+' becomes a space, %XX a byte; malformed escapes are kept as-is.
    std::string url_decode(std::string_view in);

    /// Parse an application/x-www-form-urlencoded body.
    ///
    /// Pairs without '=' or with an empty value are dropped, and the first
    /// occurrence of a repeated key wins.
    FormFields parse_form(std::string_view body);

    /// Value of @p key in @p fields, or an empty string when absent.
    std::string form_value(const FormFields &fields, const std::string &key);

} // namespace relay

#endif // RELAY_FORM_HPP
