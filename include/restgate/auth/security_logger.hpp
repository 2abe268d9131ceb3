#pragma once

#include "../export.hpp"
#include "../clock.hpp"

#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace restgate
{
    namespace auth
    {

        /**
         * @brief Append-only security event log
         *
         * Each event is one JSON object per line. Rate-limit violations also go to
         * rate_limit.log, block and unblock events to blocked_ips.log; everything
         * goes to security.log. High-severity events are echoed to ServerLogger.
         */
        class RESTGATE_SERVER_API SecurityLogger
        {
        public:
            struct Config
            {
                bool enabled = true;
                std::string directory = "logs";
                int maxFileSizeMB = 10; // Rotation threshold checked at startup
                int retentionDays = 30; // Older *.log files are deleted at startup
            };

            static constexpr const char *SECURITY_LOG_FILE = "security.log";
            static constexpr const char *RATE_LIMIT_LOG_FILE = "rate_limit.log";
            static constexpr const char *BLOCKED_IPS_LOG_FILE = "blocked_ips.log";

        public:
            explicit SecurityLogger(const Config &config,
                                    std::shared_ptr<const Clock> clock = Clock::system());

            void logRateLimitViolation(const std::string &identifier, const std::string &endpoint,
                                       const std::string &ip, size_t currentCount, size_t maxAllowed);

            void logIPBlocked(const std::string &ip, const std::string &reason,
                              Clock::time_point blockedUntil, int violationCount);

            void logIPUnblocked(const std::string &ip, const std::string &reason);

            void logSuspiciousActivity(const std::string &activity, const std::string &ip,
                                       const std::string &endpoint, const std::string &details = "");

            void logWhitelistAction(const std::string &ip, const std::string &action,
                                    const std::string &performedBy = "System");

            void logBlacklistAction(const std::string &ip, const std::string &action,
                                    const std::string &performedBy = "System");

            /**
             * @brief Move log files larger than maxFileSizeMB aside with a timestamp suffix
             */
            void rotateLogs(int maxFileSizeMB = 10);

            /**
             * @brief Delete *.log files not written in the last daysToKeep days
             * @return Number of files removed
             */
            size_t pruneOldLogs(int daysToKeep = 30);

            const Config &getConfig() const { return config_; }

        private:
            nlohmann::json entry(const char *type, const char *severity) const;
            void write(const char *fileName, const nlohmann::json &entry);

#pragma warning(push)
#pragma warning(disable: 4251)
            Config config_;
            std::shared_ptr<const Clock> clock_;
            std::mutex fileMutex_;
#pragma warning(pop)
        };

    } // namespace auth
} // namespace restgate
