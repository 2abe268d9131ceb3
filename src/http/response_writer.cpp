#include "restgate/http/response_writer.hpp"
#include "restgate/logger.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace restgate
{
    namespace http
    {

        namespace
        {
            constexpr size_t kStreamBufferSize = 81920;

            const char *kStrictCsp = "default-src 'self'";
            const char *kDocsCsp =
                "default-src 'self'; "
                "script-src 'self' 'unsafe-inline' 'unsafe-eval' https://unpkg.com https://cdn.jsdelivr.net; "
                "style-src 'self' 'unsafe-inline' https://unpkg.com https://cdn.jsdelivr.net; "
                "img-src 'self' data: https: http:; "
                "font-src 'self' data: https://unpkg.com; "
                "connect-src 'self' https://unpkg.com";

            void setIfAbsent(CaseInsensitiveMap &headers, const std::string &name, const std::string &value)
            {
                if (headers.find(name) == headers.end())
                {
                    headers[name] = value;
                }
            }

            std::string disposition(const std::string &kind, const std::string &fileName)
            {
                return kind + "; filename=\"" + fileName + "\"";
            }

            // Invalid UTF-8 from client input is replaced with U+FFFD instead of throwing
            std::string serialize(const nlohmann::json &value)
            {
                return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            }
        } // namespace

        ResponseWriter::ResponseWriter(std::shared_ptr<const auth::CorsHandler> cors, ResponseWriterOptions options)
            : cors_(std::move(cors)), options_(options)
        {
        }

        void ResponseWriter::write(IByteSink &sink, const HttpRequest &request, const ActionResult &result) const noexcept
        {
            bool headSent = false;
            const bool withBody = request.method != "HEAD";

            try
            {
                CaseInsensitiveMap headers = baseHeaders(request, result);
                const int status = result.status;

                std::visit(
                    [&](const auto &payload)
                    {
                        using T = std::decay_t<decltype(payload)>;

                        if constexpr (std::is_same_v<T, std::monostate>)
                        {
                            send(sink, status, headers, "", withBody, headSent);
                        }
                        else if constexpr (std::is_same_v<T, nlohmann::json>)
                        {
                            std::string body = serialize(options_.camelCaseKeys ? toCamelCase(payload) : payload);
                            setIfAbsent(headers, "Content-Type", "application/json; charset=utf-8");
                            send(sink, status, headers, body, withBody, headSent);
                        }
                        else if constexpr (std::is_same_v<T, ContentBody>)
                        {
                            std::string type = payload.contentType;
                            if (!payload.charset.empty() && !icontains(type, "charset="))
                            {
                                type += "; charset=" + payload.charset;
                            }
                            headers["Content-Type"] = type;
                            send(sink, status, headers, payload.content, withBody, headSent);
                        }
                        else if constexpr (std::is_same_v<T, FileBody>)
                        {
                            headers["Content-Type"] = payload.contentType.empty() ? "application/octet-stream" : payload.contentType;
                            headers["Content-Disposition"] = disposition("attachment", payload.fileName);
                            send(sink, status, headers, payload.data, withBody, headSent);
                        }
                        else if constexpr (std::is_same_v<T, StreamFileBody>)
                        {
                            if (!payload.stream)
                            {
                                throw std::runtime_error("Stream file result has no stream");
                            }
                            headers["Content-Type"] = payload.contentType.empty() ? "application/octet-stream" : payload.contentType;
                            if (!payload.fileName.empty())
                            {
                                headers["Content-Disposition"] =
                                    disposition(payload.attachment ? "attachment" : "inline", payload.fileName);
                            }
                            sendStream(sink, status, headers, *payload.stream, withBody, headSent);
                        }
                        else if constexpr (std::is_same_v<T, StreamBody>)
                        {
                            if (!payload.stream)
                            {
                                throw std::runtime_error("Stream result has no stream");
                            }
                            headers["Content-Type"] = "application/octet-stream";
                            sendStream(sink, status, headers, *payload.stream, withBody, headSent);
                        }
                        else if constexpr (std::is_same_v<T, TextBody>)
                        {
                            headers["Content-Type"] = "text/plain; charset=utf-8";
                            send(sink, status, headers, payload.text, withBody, headSent);
                        }
                    },
                    result.payload);
            }
            catch (const std::exception &ex)
            {
                ServerLogger::logError("Error writing response for %s %s: %s",
                                       request.method.c_str(), request.path.c_str(), ex.what());

                if (!headSent)
                {
                    try
                    {
                        ActionResult failure(500);
                        CaseInsensitiveMap headers = baseHeaders(request, failure);
                        headers["Content-Type"] = "application/json; charset=utf-8";
                        nlohmann::json body = {{"error", "Internal server error"}};
                        send(sink, 500, headers, serialize(body), withBody, headSent);
                    }
                    catch (const std::exception &inner)
                    {
                        ServerLogger::logError("Failed to write fallback error response: %s", inner.what());
                    }
                }
            }
            catch (...)
            {
                ServerLogger::logError("Unknown error writing response for %s %s",
                                       request.method.c_str(), request.path.c_str());
            }

            sink.close();
        }

        void ResponseWriter::writeJson(IByteSink &sink, const HttpRequest &request, int status,
                                       const nlohmann::json &body) const noexcept
        {
            try
            {
                ActionResult result(status, ResultPayload(std::in_place_type<nlohmann::json>, body));
                write(sink, request, result);
            }
            catch (const std::exception &ex)
            {
                ServerLogger::logError("Failed to prepare JSON response: %s", ex.what());
                sink.close();
            }
        }

        void ResponseWriter::writePreflight(IByteSink &sink, const HttpRequest &request) const noexcept
        {
            try
            {
                CaseInsensitiveMap headers;
                if (cors_)
                {
                    for (const auto &kv : cors_->preflightHeaders(request.header("Origin")))
                    {
                        headers[kv.first] = kv.second;
                    }
                }
                headers["Connection"] = "close";
                bool headSent = false;
                send(sink, 204, headers, "", false, headSent);
            }
            catch (const std::exception &ex)
            {
                ServerLogger::logError("Error writing preflight response: %s", ex.what());
            }
            sink.close();
        }

        CaseInsensitiveMap ResponseWriter::baseHeaders(const HttpRequest &request, const ActionResult &result) const
        {
            CaseInsensitiveMap headers = result.headers;

            if (cors_)
            {
                for (const auto &kv : cors_->headersFor(request.header("Origin")))
                {
                    setIfAbsent(headers, kv.first, kv.second);
                }
            }

            addSecurityHeaders(headers, request);
            headers["Connection"] = "close";
            return headers;
        }

        void ResponseWriter::addSecurityHeaders(CaseInsensitiveMap &headers, const HttpRequest &request) const
        {
            setIfAbsent(headers, "X-Content-Type-Options", "nosniff");
            setIfAbsent(headers, "X-Frame-Options", "DENY");
            setIfAbsent(headers, "X-XSS-Protection", "1; mode=block");
            setIfAbsent(headers, "Strict-Transport-Security", "max-age=31536000; includeSubDomains");
            setIfAbsent(headers, "Referrer-Policy", "no-referrer");
            setIfAbsent(headers, "Permissions-Policy", "geolocation=(), microphone=()");

            std::string path = to_lower(request.path);
            bool docs = path.find("/docs") != std::string::npos || path.find("/swagger") != std::string::npos;
            setIfAbsent(headers, "Content-Security-Policy",
                        docs && options_.relaxedCspForDocs ? kDocsCsp : kStrictCsp);
        }

        void ResponseWriter::send(IByteSink &sink, int status, const CaseInsensitiveMap &headers,
                                  const std::string &body, bool withBody, bool &headSent) const
        {
            std::ostringstream head;
            head << "HTTP/1.1 " << status << " " << get_status_text(status) << "\r\n";
            for (const auto &kv : headers)
            {
                if (iequals(kv.first, "Content-Length"))
                {
                    continue;
                }
                head << kv.first << ": " << kv.second << "\r\n";
            }
            if (status != 204)
            {
                head << "Content-Length: " << body.size() << "\r\n";
            }
            head << "\r\n";

            headSent = true;
            if (!sink.write(head.str()))
            {
                ServerLogger::logWarning("Client disconnected before response head was written");
                return;
            }

            if (withBody && !body.empty() && !sink.write(body))
            {
                ServerLogger::logWarning("Client disconnected while writing %zu byte response body", body.size());
            }
        }

        void ResponseWriter::sendStream(IByteSink &sink, int status, CaseInsensitiveMap &headers,
                                        std::istream &stream, bool withBody, bool &headSent) const
        {
            // Content-Length only when the stream can report its size
            std::streampos start = stream.tellg();
            bool sized = false;
            std::streamoff length = 0;
            if (start != std::streampos(-1))
            {
                stream.seekg(0, std::ios::end);
                std::streampos end = stream.tellg();
                stream.seekg(start);
                if (end != std::streampos(-1) && stream)
                {
                    length = end - start;
                    sized = true;
                }
                else
                {
                    stream.clear();
                    stream.seekg(start);
                }
            }

            std::ostringstream head;
            head << "HTTP/1.1 " << status << " " << get_status_text(status) << "\r\n";
            for (const auto &kv : headers)
            {
                if (!iequals(kv.first, "Content-Length"))
                {
                    head << kv.first << ": " << kv.second << "\r\n";
                }
            }
            if (sized)
            {
                head << "Content-Length: " << length << "\r\n";
            }
            head << "\r\n";

            headSent = true;
            if (!sink.write(head.str()) || !withBody)
            {
                return;
            }

            std::vector<char> buffer(kStreamBufferSize);
            size_t total = 0;
            while (stream)
            {
                stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                std::streamsize got = stream.gcount();
                if (got <= 0)
                {
                    break;
                }
                if (!sink.write(buffer.data(), static_cast<size_t>(got)))
                {
                    ServerLogger::logWarning("Client disconnected after %zu streamed bytes", total);
                    return;
                }
                total += static_cast<size_t>(got);
            }

            if (stream.bad())
            {
                throw std::runtime_error("Error reading response stream after " + std::to_string(total) + " bytes");
            }
        }

        nlohmann::json ResponseWriter::toCamelCase(const nlohmann::json &value)
        {
            if (value.is_object())
            {
                nlohmann::json result = nlohmann::json::object();
                for (auto it = value.begin(); it != value.end(); ++it)
                {
                    result[camelCase(it.key())] = toCamelCase(it.value());
                }
                return result;
            }

            if (value.is_array())
            {
                nlohmann::json result = nlohmann::json::array();
                for (const auto &item : value)
                {
                    result.push_back(toCamelCase(item));
                }
                return result;
            }

            return value;
        }

        std::string ResponseWriter::camelCase(const std::string &key)
        {
            if (key.empty() || !std::isupper(static_cast<unsigned char>(key[0])))
            {
                return key;
            }

            // Lowercase the leading capital run, keeping the capital that starts the next word
            std::string result = key;
            for (size_t i = 0; i < result.size(); ++i)
            {
                unsigned char c = static_cast<unsigned char>(result[i]);
                if (!std::isupper(c))
                {
                    break;
                }
                bool nextIsLower = i + 1 < result.size() &&
                                   std::islower(static_cast<unsigned char>(result[i + 1]));
                if (i > 0 && nextIsLower)
                {
                    break;
                }
                result[i] = static_cast<char>(std::tolower(c));
            }
            return result;
        }

    } // namespace http
} // namespace restgate
