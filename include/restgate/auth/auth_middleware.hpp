#pragma once

#include "../export.hpp"
#include "../http/http_request.hpp"
#include "rate_limiter.hpp"
#include "token_verifier.hpp"

#include <memory>
#include <optional>
#include <string>

namespace restgate
{
    namespace auth
    {

        /**
         * @brief Request admission: rate limiting and bearer-token authorization
         *
         * The dispatcher calls checkRateLimit() before anything else and
         * authorize() once the target action is known.
         */
        class RESTGATE_SERVER_API AuthMiddleware
        {
        public:
            /**
             * @brief Result of authentication processing
             */
            struct AuthResult
            {
                bool authorized = true;
                int statusCode = 200;
#pragma warning(push)
#pragma warning(disable: 4251)
                std::string errorMessage;
                std::optional<Identity> identity;
#pragma warning(pop)

                static AuthResult deny(int status, const std::string &message)
                {
                    AuthResult result;
                    result.authorized = false;
                    result.statusCode = status;
                    result.errorMessage = message;
                    return result;
                }
            };

        public:
            /**
             * @param rateLimiter Limiter consulted for every request; may be null to disable
             * @param verifier Token verifier; without one every protected action answers 401
             */
            AuthMiddleware(std::shared_ptr<RateLimiter> rateLimiter,
                           std::shared_ptr<const ITokenVerifier> verifier);

            /**
             * @brief Rate-limit a request by client IP, user agent and bearer token
             */
            RateLimiter::RateLimitResult checkRateLimit(const http::HttpRequest &request) const;

            /**
             * @brief Evaluate an action's effective requirement against the request
             * @param requirement Effective requirement; std::nullopt means anonymous
             */
            AuthResult authorize(const std::optional<AuthRequirement> &requirement,
                                 const http::HttpRequest &request) const;

            /**
             * @brief Token from "Authorization: Bearer <token>", empty when absent
             */
            static std::string extractBearerToken(const http::HttpRequest &request);

            RateLimiter *getRateLimiter() const { return rateLimiter_.get(); }

        private:
#pragma warning(push)
#pragma warning(disable: 4251)
            std::shared_ptr<RateLimiter> rateLimiter_;
            std::shared_ptr<const ITokenVerifier> verifier_;
#pragma warning(pop)
        };

    } // namespace auth
} // namespace restgate
