#include <relay/form.hpp>

namespace relay
{
    namespace
    {
        int hex_value(char c) noexcept
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }
    } // namespace

    std::string url_decode(std::string_view in)
    {
        std::string out;
        out.reserve(in.size());

        for (std::size_t i = 0; i < in.size(); ++i)
        {
            const char c = in[i];
            if (c == '+')
            {
                out.push_back(' ');
            }
            else if (c == '%' && i + 2 < in.size())
            {
                const int hi = hex_value(in[i + 1]);
                const int lo = hex_value(in[i + 2]);
                if (hi < 0 || lo < 0)
                {
                    out.push_back(c);
                    continue;
                }
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
            }
            else
            {
                out.push_back(c);
            }
        }
        return out;
    }

    FormFields parse_form(std::string_view body)
    {
        FormFields fields;

        std::size_t pos = 0;
        while (pos <= body.size())
        {
            std::size_t end = body.find('&', pos);
            if (end == std::string_view::npos)
                end = body.size();

            const std::string_view pair = body.substr(pos, end - pos);
            const std::size_t eq = pair.find('=');

            if (eq != std::string_view::npos)
            {
                std::string key = url_decode(pair.substr(0, eq));
                std::string value = url_decode(pair.substr(eq + 1));

                if (!value.empty())
                    fields.emplace(std::move(key), std::move(value)); // keeps the first one
            }

            pos = end + 1;
        }
        return fields;
    }

    std::string form_value(const FormFields &fields, const std::string &key)
    {
        auto it = fields.find(key);
        if (it == fields.end())
            return {};
        return it->second;
    }

} // namespace relay
