#pragma once

#include "export.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace restgate
{

    // Get standard status text for HTTP status code
    inline std::string get_status_text(int status_code)
    {
        switch (status_code)
        {
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 415: return "Unsupported Media Type";
        case 422: return "Unprocessable Entity";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 503: return "Service Unavailable";
        default:  return "Error";
        }
    }

    /**
     * @brief Case-insensitive ordering for header, form and query keys
     */
    struct RESTGATE_SERVER_API CaseInsensitiveLess
    {
        bool operator()(const std::string &a, const std::string &b) const;
    };

    using CaseInsensitiveMap = std::map<std::string, std::string, CaseInsensitiveLess>;

    RESTGATE_SERVER_API std::string to_lower(std::string value);
    RESTGATE_SERVER_API std::string trim(const std::string &value, const char *chars = " \t\r\n");
    RESTGATE_SERVER_API bool iequals(const std::string &a, const std::string &b);
    RESTGATE_SERVER_API bool istarts_with(const std::string &value, const std::string &prefix);
    RESTGATE_SERVER_API bool icontains(const std::string &haystack, const std::string &needle);

    // Split on a single character; empty pieces are dropped when skipEmpty is set
    RESTGATE_SERVER_API std::vector<std::string> split(const std::string &value, char delimiter, bool skipEmpty = false);

    RESTGATE_SERVER_API std::string join(const std::vector<std::string> &items, const std::string &separator);

    // Percent-decoding; '+' becomes a space when plusAsSpace is set
    RESTGATE_SERVER_API std::string url_decode(const std::string &value, bool plusAsSpace = true);

    // UTC formatting, "%Y-%m-%d %H:%M:%S" by default
    RESTGATE_SERVER_API std::string format_utc(std::chrono::system_clock::time_point tp,
                                               const char *format = "%Y-%m-%d %H:%M:%S");

    // ISO-8601 UTC, e.g. 2026-10-19T08:30:00Z
    RESTGATE_SERVER_API std::string to_iso8601(std::chrono::system_clock::time_point tp);
    RESTGATE_SERVER_API std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string &text);

    // Short identifier for the calling thread, used in request logs
    RESTGATE_SERVER_API std::string thread_tag();

} // namespace restgate
