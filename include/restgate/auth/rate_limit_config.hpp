#pragma once

#include "../export.hpp"

#include <chrono>
#include <map>
#include <set>
#include <string>

namespace restgate
{
    namespace auth
    {

        /**
         * @brief Request budget for a path prefix
         */
        struct RESTGATE_SERVER_API EndpointLimit
        {
#pragma warning(push)
#pragma warning(disable: 4251)
            std::string path; // Lowercase prefix, or "" for the default limit
            size_t maxRequests = 100;
            std::chrono::seconds timeWindow{60};
            std::string description;
#pragma warning(pop)
        };

        /**
         * @brief Rate limiting policy: per-endpoint budgets, block escalation and IP lists
         */
        struct RESTGATE_SERVER_API RateLimitConfig
        {
#pragma warning(push)
#pragma warning(disable: 4251)
            bool enabled = true;
            size_t defaultMaxRequests = 100;
            std::chrono::seconds defaultTimeWindow{60};
            int blockDurationMinutes = 15;    // Base of the escalation ladder
            int maxViolationsBeforeBlock = 3; // Violations within one window before a block
            std::chrono::seconds sweepInterval{300};
            std::chrono::seconds inactiveClientTimeout{3600};
            std::string blockFile = "blocked_ips.json";

            std::map<std::string, EndpointLimit> endpointLimits; // Keyed by lowercase prefix
            std::set<std::string> whitelist;
            std::set<std::string> blacklist;
#pragma warning(pop)

            RateLimitConfig();

            /**
             * @brief Limit applying to a request path
             *
             * Exact prefix match first (trailing '/' ignored), then the longest
             * configured prefix the path starts with, else the default limit.
             */
            EndpointLimit limitForPath(const std::string &path) const;

            EndpointLimit defaultLimit() const;

            void setEndpointLimit(const std::string &path, size_t maxRequests,
                                  std::chrono::seconds window, const std::string &description = "");
            void clearEndpointLimits();

            // Built-in table used when configuration does not replace it
            void applyDefaultEndpointLimits();
        };

    } // namespace auth
} // namespace restgate
