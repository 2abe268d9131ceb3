#include "restgate/http/http_request.hpp"
#include "restgate/http/errors.hpp"
#include "restgate/logger.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#endif

namespace restgate
{
    namespace http
    {

        HttpRequest::HttpRequest(const std::string &m, const std::string &t)
            : method(m)
        {
            std::transform(method.begin(), method.end(), method.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            setTarget(t);
        }

        HttpRequest HttpRequest::parseHead(const std::string &head)
        {
            size_t lineEnd = head.find('\n');
            std::string requestLine = trim(head.substr(0, lineEnd));

            std::vector<std::string> parts = split(requestLine, ' ', true);
            if (parts.size() < 2 || parts.size() > 3)
            {
                throw ClientInputError("Malformed request line");
            }

            HttpRequest request(parts[0], parts[1]);
            if (parts.size() == 3)
            {
                request.version = parts[2];
            }

            if (lineEnd == std::string::npos)
            {
                return request;
            }

            std::istringstream headerStream(head.substr(lineEnd + 1));
            std::string line;
            while (std::getline(headerStream, line))
            {
                line.erase(std::remove(line.begin(), line.end(), '\r'), line.end());
                if (line.empty())
                {
                    break;
                }

                size_t colonPos = line.find(':');
                if (colonPos == std::string::npos)
                {
                    ServerLogger::logDebug("Ignoring header line without colon: %s", line.c_str());
                    continue;
                }

                std::string name = trim(line.substr(0, colonPos), " \t");
                std::string value = trim(line.substr(colonPos + 1), " \t");
                if (!name.empty())
                {
                    request.headers[name] = value;
                }
            }

            return request;
        }

        void HttpRequest::setTarget(const std::string &t)
        {
            target = t;
            size_t queryPos = target.find('?');
            std::string rawPath = queryPos == std::string::npos ? target : target.substr(0, queryPos);
            queryString = queryPos == std::string::npos ? "" : target.substr(queryPos + 1);

            size_t fragmentPos = queryString.find('#');
            if (fragmentPos != std::string::npos)
            {
                queryString.erase(fragmentPos);
            }

            path = url_decode(rawPath, false);
            if (path.empty())
            {
                path = "/";
            }
            query = parse_query_string(queryString);
        }

        std::string HttpRequest::header(const std::string &name, const std::string &fallback) const
        {
            auto it = headers.find(name);
            return it != headers.end() ? it->second : fallback;
        }

        bool HttpRequest::hasHeader(const std::string &name) const
        {
            return headers.find(name) != headers.end();
        }

        void HttpRequest::setHeader(const std::string &name, const std::string &value)
        {
            headers[name] = value;
        }

        std::optional<std::string> HttpRequest::queryValue(const std::string &name) const
        {
            auto it = query.find(name);
            if (it == query.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::string HttpRequest::contentType() const
        {
            return header("Content-Type");
        }

        std::optional<size_t> HttpRequest::contentLength() const
        {
            auto it = headers.find("Content-Length");
            if (it == headers.end() || it->second.empty())
            {
                return std::nullopt;
            }

            const std::string &value = it->second;
            if (!std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); }))
            {
                throw ClientInputError("Invalid Content-Length header: " + value);
            }

            try
            {
                return static_cast<size_t>(std::stoull(value));
            }
            catch (const std::out_of_range &)
            {
                throw ClientInputError("Invalid Content-Length header: " + value);
            }
        }

        void HttpRequest::setBodySource(std::shared_ptr<IByteSource> source)
        {
            bodySource_ = std::move(source);
            bodyLoaded_ = false;
        }

        const std::string &HttpRequest::loadBody(size_t maxBytes)
        {
            if (bodyLoaded_)
            {
                return body_;
            }

            bodyLoaded_ = true;
            if (!bodySource_)
            {
                return body_;
            }

            BodyReader reader(maxBytes);
            body_ = reader.read(*bodySource_, contentLength());
            ServerLogger::logDebug("[Conn %s] Read request body: %zu bytes", thread_tag().c_str(), body_.size());
            return body_;
        }

        void HttpRequest::setBody(std::string body)
        {
            body_ = std::move(body);
            bodyLoaded_ = true;
            bodySource_.reset();
        }

        CaseInsensitiveMap parse_query_string(const std::string &query)
        {
            CaseInsensitiveMap result;
            for (const auto &pair : split(query, '&', true))
            {
                size_t eq = pair.find('=');
                std::string key = url_decode(eq == std::string::npos ? pair : pair.substr(0, eq));
                std::string value = eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1));
                if (!key.empty())
                {
                    result[key] = value;
                }
            }
            return result;
        }

        bool is_valid_ip(const std::string &text)
        {
            if (text.empty())
            {
                return false;
            }
            unsigned char buffer[sizeof(struct in6_addr)];
            return inet_pton(AF_INET, text.c_str(), buffer) == 1 ||
                   inet_pton(AF_INET6, text.c_str(), buffer) == 1;
        }

        // "for=192.0.2.60;proto=http" or for="[2001:db8::1]:4711"
        static std::string parse_forwarded_for(const std::string &value)
        {
            std::string lower = to_lower(value);
            size_t pos = lower.find("for=");
            if (pos == std::string::npos)
            {
                return "";
            }

            std::string candidate = value.substr(pos + 4);
            size_t end = candidate.find_first_of(";,");
            if (end != std::string::npos)
            {
                candidate = candidate.substr(0, end);
            }
            candidate = trim(candidate, " \t\"");

            if (!candidate.empty() && candidate.front() == '[')
            {
                size_t close = candidate.find(']');
                return close == std::string::npos ? "" : candidate.substr(1, close - 1);
            }

            // IPv4 with port
            size_t colon = candidate.find(':');
            if (colon != std::string::npos && candidate.find(':', colon + 1) == std::string::npos)
            {
                candidate = candidate.substr(0, colon);
            }
            return candidate;
        }

        std::string resolve_client_ip(const HttpRequest &request, const std::string &peerIP, bool trustProxyHeaders)
        {
            if (trustProxyHeaders)
            {
                static const char *proxyHeaders[] = {
                    "CF-Connecting-IP",
                    "True-Client-IP",
                    "X-Real-IP",
                    "X-Forwarded-For",
                    "X-Client-IP",
                    "Forwarded"};

                for (const char *name : proxyHeaders)
                {
                    std::string value = request.header(name);
                    if (value.empty())
                    {
                        continue;
                    }

                    std::string candidate;
                    if (iequals(name, "Forwarded"))
                    {
                        candidate = parse_forwarded_for(value);
                    }
                    else
                    {
                        // X-Forwarded-For: client, proxy1, proxy2
                        candidate = trim(value.substr(0, value.find(',')));
                    }

                    if (is_valid_ip(candidate))
                    {
                        return candidate;
                    }
                    ServerLogger::logDebug("Ignoring invalid address in %s header: %s", name, value.c_str());
                }
            }

            return peerIP.empty() ? "unknown" : peerIP;
        }

    } // namespace http
} // namespace restgate
