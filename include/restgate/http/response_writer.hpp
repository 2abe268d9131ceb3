#pragma once

#include "../export.hpp"
#include "../auth/cors_handler.hpp"
#include "action_result.hpp"
#include "byte_sink.hpp"
#include "http_request.hpp"

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace restgate
{
    namespace http
    {

        struct RESTGATE_SERVER_API ResponseWriterOptions
        {
            bool relaxedCspForDocs = true; // Looser CSP for /docs and /swagger pages
            bool camelCaseKeys = true;     // Rewrite structured keys to camelCase
        };

        /**
         * @brief Serializes an ActionResult to the wire
         *
         * Every response gets CORS and security headers (unless the result already
         * set them) and Connection: close. The sink is closed on every exit path.
         */
        class RESTGATE_SERVER_API ResponseWriter
        {
        public:
            explicit ResponseWriter(std::shared_ptr<const auth::CorsHandler> cors,
                                    ResponseWriterOptions options = ResponseWriterOptions());

            /**
             * @brief Write the result and close the sink
             *
             * A failure before the status line is sent degrades to a 500 JSON body
             * carrying the failure detail.
             */
            void write(IByteSink &sink, const HttpRequest &request, const ActionResult &result) const noexcept;

            void writeJson(IByteSink &sink, const HttpRequest &request, int status,
                           const nlohmann::json &body) const noexcept;

            // 204 with CORS headers only
            void writePreflight(IByteSink &sink, const HttpRequest &request) const noexcept;

            static nlohmann::json toCamelCase(const nlohmann::json &value);
            static std::string camelCase(const std::string &key);

        private:
            CaseInsensitiveMap baseHeaders(const HttpRequest &request, const ActionResult &result) const;
            void addSecurityHeaders(CaseInsensitiveMap &headers, const HttpRequest &request) const;

            // Writes status line, headers and body; headSent flips once the head is out
            void send(IByteSink &sink, int status, const CaseInsensitiveMap &headers,
                      const std::string &body, bool withBody, bool &headSent) const;

            void sendStream(IByteSink &sink, int status, CaseInsensitiveMap &headers,
                            std::istream &stream, bool withBody, bool &headSent) const;

#pragma warning(push)
#pragma warning(disable: 4251)
            std::shared_ptr<const auth::CorsHandler> cors_;
#pragma warning(pop)
            ResponseWriterOptions options_;
        };

    } // namespace http
} // namespace restgate
