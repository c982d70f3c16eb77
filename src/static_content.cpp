#include <relay/static_content.hpp>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace relay
{
    namespace
    {
        struct MimeEntry
        {
            std::string_view ext;
            std::string_view type;
        };

        constexpr MimeEntry mimeTable[] = {
            {"html", "text/html"},
            {"htm", "text/html"},
            {"css", "text/css"},
            {"js", "text/javascript"},
            {"mjs", "text/javascript"},
            {"json", "application/json"},
            {"txt", "text/plain"},
            {"csv", "text/csv"},
            {"xml", "application/xml"},
            {"png", "image/png"},
            {"jpg", "image/jpeg"},
            {"jpeg", "image/jpeg"},
            {"gif", "image/gif"},
            {"bmp", "image/bmp"},
            {"ico", "image/vnd.microsoft.icon"},
            {"svg", "image/svg+xml"},
            {"webp", "image/webp"},
            {"woff", "font/woff"},
            {"woff2", "font/woff2"},
            {"ttf", "font/ttf"},
            {"pdf", "application/pdf"},
            {"wasm", "application/wasm"},
        };

        bool iequals(std::string_view a, std::string_view b) noexcept
        {
            if (a.size() != b.size())
                return false;

            for (std::size_t i = 0; i < a.size(); ++i)
            {
                if (std::tolower(static_cast<unsigned char>(a[i])) !=
                    std::tolower(static_cast<unsigned char>(b[i])))
                    return false;
            }
            return true;
        }
    } // namespace

    std::string_view mime_type(std::string_view path)
    {
        const auto slash = path.rfind('/');
        const auto dot = path.rfind('.');

        if (dot == std::string_view::npos ||
            (slash != std::string_view::npos && dot < slash))
            return "application/octet-stream";

        const std::string_view ext = path.substr(dot + 1);
        for (const auto &entry : mimeTable)
        {
            if (iequals(ext, entry.ext))
                return entry.type;
        }
        return "application/octet-stream";
    }

    std::optional<std::string> load_file(const std::string &path)
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
            return std::nullopt;

        std::ifstream in(path, std::ios::binary);
        if (!in)
            return std::nullopt;

        std::ostringstream ss;
        ss << in.rdbuf();
        if (in.bad())
            return std::nullopt;

        return ss.str();
    }

    std::optional<std::string> resolve_static_path(const std::string &root,
                                                   std::string_view relative)
    {
        if (relative.empty())
            return std::nullopt;

        std::size_t pos = 0;
        while (pos <= relative.size())
        {
            std::size_t end = relative.find('/', pos);
            if (end == std::string_view::npos)
                end = relative.size();

            const std::string_view segment = relative.substr(pos, end - pos);
            if (segment.empty() || segment == "." || segment == "..")
                return std::nullopt;

            if (segment.find('\\') != std::string_view::npos ||
                segment.find('\0') != std::string_view::npos)
                return std::nullopt;

            pos = end + 1;
        }

        std::string out = root.empty() ? std::string{"."} : root;
        if (out.back() != '/')
            out.push_back('/');
        out.append(relative.data(), relative.size());
        return out;
    }

} // namespace relay
