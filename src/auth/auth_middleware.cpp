#include "restgate/auth/auth_middleware.hpp"
#include "restgate/logger.hpp"
#include "restgate/utils.hpp"

namespace restgate
{
    namespace auth
    {

        AuthMiddleware::AuthMiddleware(std::shared_ptr<RateLimiter> rateLimiter,
                                       std::shared_ptr<const ITokenVerifier> verifier)
            : rateLimiter_(std::move(rateLimiter)), verifier_(std::move(verifier))
        {
            ServerLogger::logInfo("Authentication middleware initialized - Rate limiting: %s, Token verifier: %s",
                                  rateLimiter_ ? "enabled" : "disabled",
                                  verifier_ ? "configured" : "none");
        }

        RateLimiter::RateLimitResult AuthMiddleware::checkRateLimit(const http::HttpRequest &request) const
        {
            if (!rateLimiter_)
            {
                return RateLimiter::RateLimitResult{};
            }

            auto result = rateLimiter_->check(request.clientIP, request.path,
                                              request.header("User-Agent"), extractBearerToken(request));

            ServerLogger::logDebug("Rate limit result for %s %s - Allowed: %s",
                                   request.clientIP.c_str(), request.path.c_str(),
                                   result.allowed ? "true" : "false");
            return result;
        }

        AuthMiddleware::AuthResult AuthMiddleware::authorize(const std::optional<AuthRequirement> &requirement,
                                                             const http::HttpRequest &request) const
        {
            if (!requirement)
            {
                return AuthResult{};
            }

            if (!iequals(requirement->scheme, "Bearer"))
            {
                return AuthResult::deny(401, "Unauthorized: Unsupported authentication scheme");
            }

            std::string header = request.header("Authorization");
            if (header.empty() || !istarts_with(header, "Bearer "))
            {
                return AuthResult::deny(401, "Unauthorized: Missing or invalid token");
            }

            std::string token = trim(header.substr(7));
            std::optional<Identity> identity = verifier_ ? verifier_->verify(token) : std::nullopt;
            if (!identity)
            {
                ServerLogger::logWarning("Invalid token presented by %s for %s %s",
                                         request.clientIP.c_str(), request.method.c_str(), request.path.c_str());
                return AuthResult::deny(401, "Unauthorized: Invalid token");
            }

            if (!requirement->roles.empty())
            {
                bool hasAny = false;
                for (const auto &role : requirement->roles)
                {
                    if (identity->hasRole(role))
                    {
                        hasAny = true;
                        break;
                    }
                }

                if (!hasAny)
                {
                    ServerLogger::logWarning("User %s lacks required role (%s) for %s",
                                             identity->name.c_str(), join(requirement->roles, ", ").c_str(),
                                             request.path.c_str());
                    return AuthResult::deny(403, "Forbidden: Insufficient role");
                }
            }

            AuthResult result;
            result.identity = std::move(identity);
            return result;
        }

        std::string AuthMiddleware::extractBearerToken(const http::HttpRequest &request)
        {
            std::string header = request.header("Authorization");
            if (!istarts_with(header, "Bearer "))
            {
                return "";
            }
            return trim(header.substr(7));
        }

    } // namespace auth
} // namespace restgate
