#include "restgate/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

namespace restgate
{

    bool CaseInsensitiveLess::operator()(const std::string &a, const std::string &b) const
    {
        return std::lexicographical_compare(
            a.begin(), a.end(), b.begin(), b.end(),
            [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
    }

    std::string to_lower(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    std::string trim(const std::string &value, const char *chars)
    {
        size_t start = value.find_first_not_of(chars);
        if (start == std::string::npos)
        {
            return "";
        }
        size_t end = value.find_last_not_of(chars);
        return value.substr(start, end - start + 1);
    }

    bool iequals(const std::string &a, const std::string &b)
    {
        if (a.size() != b.size())
        {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i)
        {
            if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            {
                return false;
            }
        }
        return true;
    }

    bool istarts_with(const std::string &value, const std::string &prefix)
    {
        return value.size() >= prefix.size() && iequals(value.substr(0, prefix.size()), prefix);
    }

    bool icontains(const std::string &haystack, const std::string &needle)
    {
        return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
    }

    std::vector<std::string> split(const std::string &value, char delimiter, bool skipEmpty)
    {
        std::vector<std::string> parts;
        size_t start = 0;
        while (true)
        {
            size_t pos = value.find(delimiter, start);
            std::string piece = value.substr(start, pos == std::string::npos ? std::string::npos : pos - start);
            if (!skipEmpty || !piece.empty())
            {
                parts.push_back(piece);
            }
            if (pos == std::string::npos)
            {
                break;
            }
            start = pos + 1;
        }
        return parts;
    }

    std::string join(const std::vector<std::string> &items, const std::string &separator)
    {
        std::ostringstream oss;
        for (size_t i = 0; i < items.size(); ++i)
        {
            if (i > 0)
            {
                oss << separator;
            }
            oss << items[i];
        }
        return oss.str();
    }

    static int hex_value(char c)
    {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    }

    std::string url_decode(const std::string &value, bool plusAsSpace)
    {
        std::string decoded;
        decoded.reserve(value.size());
        for (size_t i = 0; i < value.size(); ++i)
        {
            char c = value[i];
            if (c == '%' && i + 2 < value.size())
            {
                int hi = hex_value(value[i + 1]);
                int lo = hex_value(value[i + 2]);
                if (hi >= 0 && lo >= 0)
                {
                    decoded.push_back(static_cast<char>((hi << 4) | lo));
                    i += 2;
                    continue;
                }
            }
            if (c == '+' && plusAsSpace)
            {
                decoded.push_back(' ');
                continue;
            }
            decoded.push_back(c);
        }
        return decoded;
    }

    std::string format_utc(std::chrono::system_clock::time_point tp, const char *format)
    {
        std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm utcTm{};
#ifdef _WIN32
        gmtime_s(&utcTm, &t);
#else
        gmtime_r(&t, &utcTm);
#endif
        std::ostringstream oss;
        oss << std::put_time(&utcTm, format);
        return oss.str();
    }

    std::string to_iso8601(std::chrono::system_clock::time_point tp)
    {
        return format_utc(tp, "%Y-%m-%dT%H:%M:%SZ");
    }

    std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string &text)
    {
        std::tm tm{};
        std::istringstream iss(text);
        iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (iss.fail())
        {
            return std::nullopt;
        }
#ifdef _WIN32
        std::time_t t = _mkgmtime(&tm);
#else
        std::time_t t = timegm(&tm);
#endif
        if (t == static_cast<std::time_t>(-1))
        {
            return std::nullopt;
        }
        return std::chrono::system_clock::from_time_t(t);
    }

    std::string thread_tag()
    {
        std::ostringstream oss;
        oss << std::hex << (std::hash<std::thread::id>{}(std::this_thread::get_id()) & 0xFFFFFF);
        return oss.str();
    }

} // namespace restgate
