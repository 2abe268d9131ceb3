#pragma once

#include "../export.hpp"
#include "../clock.hpp"
#include "security_logger.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace restgate
{
    namespace auth
    {

        struct RESTGATE_SERVER_API BlockedIPInfo
        {
#pragma warning(push)
#pragma warning(disable: 4251)
            std::string ip;
            Clock::time_point blockedAt;
            Clock::time_point blockedUntil;
            std::string reason;
#pragma warning(pop)
            int violationCount = 0;
        };

        // Persisted form: camelCase keys, ISO-8601 UTC times
        RESTGATE_SERVER_API void to_json(nlohmann::json &j, const BlockedIPInfo &info);
        RESTGATE_SERVER_API void from_json(const nlohmann::json &j, BlockedIPInfo &info);

        /**
         * @brief Temporarily blocked IP addresses, persisted to a JSON file
         *
         * The file is rewritten after every mutation. Map updates and file writes
         * are serialized by separate mutexes.
         */
        class RESTGATE_SERVER_API IPBlockList
        {
        public:
            /**
             * @param filePath Block file; empty keeps the list in memory only
             */
            IPBlockList(std::string filePath,
                        std::shared_ptr<const Clock> clock,
                        std::shared_ptr<SecurityLogger> securityLogger);

            /**
             * @brief Load records from the block file, dropping expired ones
             * @return Number of live records loaded; a missing file loads nothing
             */
            size_t load();

            /**
             * @brief Whether a live block exists; an expired one is removed on the spot
             */
            bool isBlocked(const std::string &ip);

            /**
             * @brief Block or re-block an address
             * @return The resulting expiry time
             */
            Clock::time_point blockIP(const std::string &ip, std::chrono::seconds duration,
                                      const std::string &reason, int violationCount = 1);

            /**
             * @return True when a record was removed
             */
            bool unblockIP(const std::string &ip, const std::string &reason);

            std::optional<BlockedIPInfo> getBlockInfo(const std::string &ip) const;
            std::vector<BlockedIPInfo> getAllBlockedIPs() const;
            size_t getBlockedCount() const;

            /**
             * @brief Remove every expired record
             * @return Number of records removed
             */
            size_t clearExpiredBlocks();

            const std::string &filePath() const { return filePath_; }

        private:
            void save() const;

            // Erases the record only if it is still expired at `now`
            bool unblockIfExpired(const std::string &ip, Clock::time_point now, const std::string &reason);

#pragma warning(push)
#pragma warning(disable: 4251)
            std::string filePath_;
            std::shared_ptr<const Clock> clock_;
            std::shared_ptr<SecurityLogger> securityLogger_;

            mutable std::mutex mapMutex_;
            mutable std::mutex fileMutex_;
            std::map<std::string, BlockedIPInfo> blocked_;
#pragma warning(pop)
        };

    } // namespace auth
} // namespace restgate
