#pragma once

#include "../export.hpp"
#include "../clock.hpp"
#include "ip_block_list.hpp"
#include "rate_limit_config.hpp"
#include "security_logger.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace restgate
{
    namespace auth
    {

        /**
         * @brief Sliding-window rate limiter with escalating temporary IP blocks
         *
         * Requests are counted per client identity (IP, user-agent hash and token
         * prefix) and per matched endpoint limit. Crossing a limit is a violation;
         * enough violations within one window block the IP for a duration that
         * grows with the IP's cumulative violation count.
         */
        class RESTGATE_SERVER_API RateLimiter
        {
        public:
            /**
             * @brief Result of rate limit check
             */
            struct RateLimitResult
            {
                bool allowed = true;
#pragma warning(push)
#pragma warning(disable: 4251)
                EndpointLimit limit;                           // Limit that applied
                std::optional<Clock::time_point> blockedUntil; // Set when the IP is blocked
                std::chrono::seconds retryAfter{0};            // Until blockedUntil, on the limiter's clock
                std::string reason;
#pragma warning(pop)
            };

            /**
             * @brief Read-only view of a client's standing
             */
            struct Status
            {
                bool allowed = true;
                bool whitelisted = false;
                bool blacklisted = false;
                bool blocked = false;
#pragma warning(push)
#pragma warning(disable: 4251)
                std::optional<Clock::time_point> blockedUntil;
                std::string blockReason;
                size_t currentRequests = 0;
                size_t maxRequests = 0;
                std::chrono::seconds timeWindow{0};
                size_t remainingRequests = 0;
                Clock::time_point resetTime;
                std::string message;
#pragma warning(pop)

                nlohmann::json toJson() const;
            };

        private:
            /**
             * @brief Request window for one identity and endpoint limit
             */
            struct ClientWindow
            {
                std::mutex lock;
                std::string ip;
                std::deque<Clock::time_point> requests;
                int violationCount = 0;
                Clock::time_point lastRequestTime;
                bool retired = false; // Removed from the map; callers must re-fetch
            };

            struct ViolationHistory
            {
                int count = 0;
                Clock::time_point lastActivity; // Last violation or end of the last block
            };

        public:
            RateLimiter(const RateLimitConfig &config,
                        std::shared_ptr<IPBlockList> blockList,
                        std::shared_ptr<SecurityLogger> securityLogger,
                        std::shared_ptr<const Clock> clock = Clock::system());
            ~RateLimiter();

            RateLimiter(const RateLimiter &) = delete;
            RateLimiter &operator=(const RateLimiter &) = delete;

            /**
             * @brief Check and record one request
             * @param ip Client address
             * @param endpoint Request path used to pick the endpoint limit
             * @param userAgent User-Agent header, may be empty
             * @param token Bearer token, may be empty
             */
            RateLimitResult check(const std::string &ip, const std::string &endpoint,
                                  const std::string &userAgent = "", const std::string &token = "");

            bool isAllowed(const std::string &ip, const std::string &endpoint,
                           const std::string &userAgent = "", const std::string &token = "")
            {
                return check(ip, endpoint, userAgent, token).allowed;
            }

            Status getStatus(const std::string &ip, const std::string &endpoint,
                             const std::string &userAgent = "", const std::string &token = "");

            static std::string generateIdentifier(const std::string &ip, const std::string &userAgent,
                                                  const std::string &token);

            /**
             * @brief Block duration for an IP's cumulative violation count
             */
            std::chrono::seconds calculateBlockDuration(int violationCount) const;

            void addToWhitelist(const std::string &ip);
            void removeFromWhitelist(const std::string &ip);
            void addToBlacklist(const std::string &ip);
            void removeFromBlacklist(const std::string &ip);
            bool isWhitelisted(const std::string &ip) const;
            bool isBlacklisted(const std::string &ip) const;

            bool unblockIP(const std::string &ip);
            std::vector<BlockedIPInfo> getBlockedIPs() const;

            nlohmann::json getStatistics() const;

            size_t activeClientCount() const;

            /**
             * @brief Clear expired blocks and evict windows idle past the inactivity timeout
             */
            void sweep();

            void startSweeper();
            void stopSweeper();

            RateLimitConfig getConfig() const;

        private:
            std::shared_ptr<ClientWindow> windowFor(const std::string &key, const std::string &ip);
            void evictWindow(const std::string &key, const std::shared_ptr<ClientWindow> &window);
            int recordViolation(const std::string &ip, Clock::time_point now);
            void noteBlock(const std::string &ip, Clock::time_point blockedUntil);

#pragma warning(push)
#pragma warning(disable: 4251)
            RateLimitConfig config_;
            std::shared_ptr<IPBlockList> blockList_;
            std::shared_ptr<SecurityLogger> securityLogger_;
            std::shared_ptr<const Clock> clock_;

            mutable std::mutex listsMutex_;

            mutable std::shared_mutex clientsMutex_;
            std::unordered_map<std::string, std::shared_ptr<ClientWindow>> clients_;

            mutable std::mutex violationsMutex_;
            std::unordered_map<std::string, ViolationHistory> violations_;

            std::thread sweeper_;
            std::mutex sweeperMutex_;
            std::condition_variable sweeperCv_;
            bool sweeperStop_ = false;
#pragma warning(pop)
        };

    } // namespace auth
} // namespace restgate
