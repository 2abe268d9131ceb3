#pragma once

#include "../export.hpp"
#include "../utils.hpp"
#include "body_reader.hpp"

#include <memory>
#include <optional>
#include <string>

namespace restgate
{
    namespace http
    {

        /**
         * @brief A parsed HTTP request: request line, headers, query and a lazily read body
         */
        class RESTGATE_SERVER_API HttpRequest
        {
        public:
            std::string method;      // Upper-cased verb
            std::string target;      // Raw request target
            std::string path;        // Percent-decoded path, without query
            std::string queryString; // Raw query string, without '?'
            std::string version = "HTTP/1.1";
#pragma warning(push)
#pragma warning(disable: 4251)
            CaseInsensitiveMap headers;
            CaseInsensitiveMap query;
#pragma warning(pop)
            std::string peerIP;   // Socket peer address
            std::string clientIP; // Peer address or the proxy-reported address

            HttpRequest() = default;
            HttpRequest(const std::string &method, const std::string &target);

            /**
             * @brief Parse the request line and header block (everything before the blank line)
             * @throws ClientInputError on a malformed request line
             */
            static HttpRequest parseHead(const std::string &head);

            void setTarget(const std::string &target);

            std::string header(const std::string &name, const std::string &fallback = "") const;
            bool hasHeader(const std::string &name) const;
            void setHeader(const std::string &name, const std::string &value);

            std::optional<std::string> queryValue(const std::string &name) const;

            std::string contentType() const;

            /**
             * @brief Declared Content-Length, if any
             * @throws ClientInputError when the header is not a non-negative integer
             */
            std::optional<size_t> contentLength() const;

            void setBodySource(std::shared_ptr<IByteSource> source);

            /**
             * @brief Read the body once, enforcing maxBytes while streaming
             * @throws PayloadTooLargeError once more than maxBytes arrive
             */
            const std::string &loadBody(size_t maxBytes);

            void setBody(std::string body);
            const std::string &body() const { return body_; }
            bool bodyLoaded() const { return bodyLoaded_; }

        private:
#pragma warning(push)
#pragma warning(disable: 4251)
            std::shared_ptr<IByteSource> bodySource_;
            std::string body_;
#pragma warning(pop)
            bool bodyLoaded_ = false;
        };

        /**
         * @brief Parse "a=1&b=two" into a case-insensitive map; later keys win
         */
        RESTGATE_SERVER_API CaseInsensitiveMap parse_query_string(const std::string &query);

        /**
         * @brief Whether the text is a literal IPv4 or IPv6 address
         */
        RESTGATE_SERVER_API bool is_valid_ip(const std::string &text);

        /**
         * @brief Pick the address used for rate limiting
         *
         * With trustProxyHeaders the first valid address from CF-Connecting-IP,
         * True-Client-IP, X-Real-IP, X-Forwarded-For (first hop), X-Client-IP and
         * Forwarded (for=) is used; otherwise, or when none is valid, the peer address.
         */
        RESTGATE_SERVER_API std::string resolve_client_ip(const HttpRequest &request,
                                                          const std::string &peerIP,
                                                          bool trustProxyHeaders);

    } // namespace http
} // namespace restgate
