#include "restgate/auth/rate_limit_config.hpp"
#include "restgate/utils.hpp"

#include <algorithm>
#include <vector>

namespace restgate
{
    namespace auth
    {

        namespace
        {
            std::string normalizePrefix(const std::string &path)
            {
                std::string lowered = to_lower(trim(path));
                while (lowered.size() > 1 && lowered.back() == '/')
                {
                    lowered.pop_back();
                }
                return lowered;
            }
        } // namespace

        RateLimitConfig::RateLimitConfig()
        {
            applyDefaultEndpointLimits();
        }

        void RateLimitConfig::applyDefaultEndpointLimits()
        {
            using std::chrono::minutes;

            endpointLimits.clear();
            setEndpointLimit("/api/auth/store", 5, minutes(1), "Store login");
            setEndpointLimit("/api/auth/user", 5, minutes(1), "User login");
            setEndpointLimit("/api/auth/register-user", 3, minutes(5), "User registration");
            setEndpointLimit("/api/auth/register-store", 3, minutes(5), "Store registration");
            setEndpointLimit("/api/auth/forgot-password", 3, minutes(10), "Password recovery");
            setEndpointLimit("/api/auth/reset-password", 5, minutes(10), "Password reset");
            setEndpointLimit("/api/upload", 10, minutes(1), "File upload");
            setEndpointLimit("/api/", 100, minutes(1), "General API");
        }

        EndpointLimit RateLimitConfig::limitForPath(const std::string &path) const
        {
            if (path.empty())
            {
                return defaultLimit();
            }

            std::string normalized = normalizePrefix(path);

            auto exact = endpointLimits.find(normalized);
            if (exact != endpointLimits.end())
            {
                return exact->second;
            }

            // Longest prefix first
            std::vector<const EndpointLimit *> candidates;
            for (const auto &kv : endpointLimits)
            {
                candidates.push_back(&kv.second);
            }
            std::stable_sort(candidates.begin(), candidates.end(),
                             [](const EndpointLimit *a, const EndpointLimit *b)
                             { return a->path.size() > b->path.size(); });

            for (const auto *limit : candidates)
            {
                if (istarts_with(normalized, normalizePrefix(limit->path)))
                {
                    return *limit;
                }
            }

            return defaultLimit();
        }

        EndpointLimit RateLimitConfig::defaultLimit() const
        {
            EndpointLimit limit;
            limit.path = "";
            limit.maxRequests = defaultMaxRequests;
            limit.timeWindow = defaultTimeWindow;
            limit.description = "Default limit";
            return limit;
        }

        void RateLimitConfig::setEndpointLimit(const std::string &path, size_t maxRequests,
                                               std::chrono::seconds window, const std::string &description)
        {
            EndpointLimit limit;
            limit.path = to_lower(trim(path));
            limit.maxRequests = maxRequests;
            limit.timeWindow = window;
            limit.description = description;
            endpointLimits[normalizePrefix(path)] = limit;
        }

        void RateLimitConfig::clearEndpointLimits()
        {
            endpointLimits.clear();
        }

    } // namespace auth
} // namespace restgate
