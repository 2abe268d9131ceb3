#pragma once

#include "../export.hpp"

#include <map>
#include <string>
#include <unordered_set>
#include <vector>

namespace restgate
{
    namespace auth
    {

        /**
         * @brief CORS (Cross-Origin Resource Sharing) handler
         *
         * Produces the Access-Control-* headers attached to every response and to
         * OPTIONS preflight answers.
         */
        class RESTGATE_SERVER_API CorsHandler
        {
        public:
            /**
             * @brief CORS configuration
             */
            struct Config
            {
                std::vector<std::string> allowedOrigins; // Allowed origins (use "*" for all)
                std::vector<std::string> allowedMethods; // Allowed HTTP methods
                std::vector<std::string> allowedHeaders; // Allowed headers
                bool allowCredentials = true;            // Whether to allow credentials
                int maxAge = 86400;                      // Preflight cache duration in seconds
                bool enabled = true;                     // Whether CORS headers are emitted

                Config()
                {
                    allowedMethods = {"GET", "POST", "PUT", "DELETE", "PATCH", "OPTIONS", "HEAD"};
                    allowedHeaders = {"Content-Type", "Authorization", "X-Requested-With", "Accept", "Origin"};
                    allowedOrigins = {"*"};
                }
            };

            using HeaderMap = std::map<std::string, std::string>;

        public:
            CorsHandler();
            explicit CorsHandler(const Config &config);

            /**
             * @brief Headers for a regular response
             * @param origin Origin request header, may be empty
             * @return Allow-Origin, Allow-Methods, Allow-Headers and Allow-Credentials
             */
            HeaderMap headersFor(const std::string &origin) const;

            /**
             * @brief Headers for a 204 preflight answer; adds Max-Age
             */
            HeaderMap preflightHeaders(const std::string &origin) const;

            void updateConfig(const Config &config);
            const Config &getConfig() const { return config_; }

            void addAllowedOrigin(const std::string &origin);

            /**
             * @brief Check if an origin is allowed
             * @param origin Origin to check
             * @return True if the origin is allowed
             */
            bool isOriginAllowed(const std::string &origin) const;

        private:
            /**
             * @brief Value for Access-Control-Allow-Origin
             *
             * A wildcard combined with credentials echoes the caller's origin, since
             * browsers refuse "*" with credentials. An allowed origin is echoed;
             * anything else gets the first configured origin.
             */
            std::string allowOriginValue(const std::string &origin) const;

#pragma warning(push)
#pragma warning(disable: 4251)
            Config config_;
            std::unordered_set<std::string> allowedOriginsSet_;
            std::string methodsValue_;
            std::string headersValue_;
#pragma warning(pop)
        };

    } // namespace auth
} // namespace restgate
