#include "restgate/auth/ip_block_list.hpp"
#include "restgate/logger.hpp"
#include "restgate/utils.hpp"

#include <cstdio>
#include <fstream>
#include <stdexcept>

namespace restgate
{
    namespace auth
    {

        void to_json(nlohmann::json &j, const BlockedIPInfo &info)
        {
            j = nlohmann::json{
                {"ip", info.ip},
                {"blockedAt", to_iso8601(info.blockedAt)},
                {"blockedUntil", to_iso8601(info.blockedUntil)},
                {"reason", info.reason},
                {"violationCount", info.violationCount}};
        }

        void from_json(const nlohmann::json &j, BlockedIPInfo &info)
        {
            j.at("ip").get_to(info.ip);
            info.reason = j.value("reason", "");
            info.violationCount = j.value("violationCount", 0);

            auto blockedAt = parse_iso8601(j.at("blockedAt").get<std::string>());
            auto blockedUntil = parse_iso8601(j.at("blockedUntil").get<std::string>());
            if (!blockedAt || !blockedUntil)
            {
                throw std::runtime_error("Invalid timestamp in block record for " + info.ip);
            }
            info.blockedAt = *blockedAt;
            info.blockedUntil = *blockedUntil;
        }

        IPBlockList::IPBlockList(std::string filePath,
                                 std::shared_ptr<const Clock> clock,
                                 std::shared_ptr<SecurityLogger> securityLogger)
            : filePath_(std::move(filePath)), clock_(std::move(clock)), securityLogger_(std::move(securityLogger))
        {
            if (!clock_)
            {
                clock_ = Clock::system();
            }
        }

        size_t IPBlockList::load()
        {
            if (filePath_.empty())
            {
                return 0;
            }

            nlohmann::json records;
            {
                std::lock_guard<std::mutex> fileLock(fileMutex_);
                std::ifstream in(filePath_);
                if (!in.is_open())
                {
                    ServerLogger::logDebug("No block file at %s", filePath_.c_str());
                    return 0;
                }

                try
                {
                    in >> records;
                }
                catch (const nlohmann::json::exception &ex)
                {
                    ServerLogger::logError("Failed to parse block file %s: %s", filePath_.c_str(), ex.what());
                    return 0;
                }
            }

            if (!records.is_array())
            {
                ServerLogger::logError("Block file %s does not contain a list of records", filePath_.c_str());
                return 0;
            }

            const auto now = clock_->now();
            size_t loaded = 0;
            std::lock_guard<std::mutex> lock(mapMutex_);
            for (const auto &record : records)
            {
                try
                {
                    BlockedIPInfo info = record.get<BlockedIPInfo>();
                    if (info.blockedUntil > now)
                    {
                        blocked_[info.ip] = info;
                        ++loaded;
                    }
                }
                catch (const std::exception &ex)
                {
                    ServerLogger::logWarning("Skipping invalid block record: %s", ex.what());
                }
            }

            ServerLogger::logInfo("Loaded %zu blocked IPs from %s", loaded, filePath_.c_str());
            return loaded;
        }

        bool IPBlockList::isBlocked(const std::string &ip)
        {
            if (trim(ip).empty())
            {
                return false;
            }

            const auto now = clock_->now();
            {
                std::lock_guard<std::mutex> lock(mapMutex_);
                auto it = blocked_.find(ip);
                if (it == blocked_.end())
                {
                    return false;
                }
                if (now < it->second.blockedUntil)
                {
                    return true;
                }
            }

            if (unblockIfExpired(ip, now, "Block expired"))
            {
                return false;
            }
            // A concurrent blockIP refreshed the record in the meantime
            return getBlockInfo(ip).has_value();
        }

        Clock::time_point IPBlockList::blockIP(const std::string &ip, std::chrono::seconds duration,
                                               const std::string &reason, int violationCount)
        {
            const auto now = clock_->now();
            const auto blockedUntil = now + duration;

            if (trim(ip).empty())
            {
                return blockedUntil;
            }

            {
                std::lock_guard<std::mutex> lock(mapMutex_);
                auto it = blocked_.find(ip);
                if (it != blocked_.end())
                {
                    it->second.blockedUntil = blockedUntil;
                    it->second.reason = reason;
                    it->second.violationCount = violationCount;
                }
                else
                {
                    blocked_[ip] = BlockedIPInfo{ip, now, blockedUntil, reason, violationCount};
                }
            }

            save();
            if (securityLogger_)
            {
                securityLogger_->logIPBlocked(ip, reason, blockedUntil, violationCount);
            }
            return blockedUntil;
        }

        bool IPBlockList::unblockIP(const std::string &ip, const std::string &reason)
        {
            {
                std::lock_guard<std::mutex> lock(mapMutex_);
                if (blocked_.erase(ip) == 0)
                {
                    return false;
                }
            }

            save();
            if (securityLogger_)
            {
                securityLogger_->logIPUnblocked(ip, reason);
            }
            return true;
        }

        bool IPBlockList::unblockIfExpired(const std::string &ip, Clock::time_point now, const std::string &reason)
        {
            {
                std::lock_guard<std::mutex> lock(mapMutex_);
                auto it = blocked_.find(ip);
                if (it == blocked_.end() || now < it->second.blockedUntil)
                {
                    return false;
                }
                blocked_.erase(it);
            }

            save();
            if (securityLogger_)
            {
                securityLogger_->logIPUnblocked(ip, reason);
            }
            return true;
        }

        std::optional<BlockedIPInfo> IPBlockList::getBlockInfo(const std::string &ip) const
        {
            std::lock_guard<std::mutex> lock(mapMutex_);
            auto it = blocked_.find(ip);
            if (it == blocked_.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::vector<BlockedIPInfo> IPBlockList::getAllBlockedIPs() const
        {
            std::lock_guard<std::mutex> lock(mapMutex_);
            std::vector<BlockedIPInfo> result;
            result.reserve(blocked_.size());
            for (const auto &kv : blocked_)
            {
                result.push_back(kv.second);
            }
            return result;
        }

        size_t IPBlockList::getBlockedCount() const
        {
            std::lock_guard<std::mutex> lock(mapMutex_);
            return blocked_.size();
        }

        size_t IPBlockList::clearExpiredBlocks()
        {
            const auto now = clock_->now();
            std::vector<std::string> expired;
            {
                std::lock_guard<std::mutex> lock(mapMutex_);
                for (const auto &kv : blocked_)
                {
                    if (kv.second.blockedUntil <= now)
                    {
                        expired.push_back(kv.first);
                    }
                }
            }

            size_t removed = 0;
            for (const auto &ip : expired)
            {
                if (unblockIfExpired(ip, now, "Block expired (sweep)"))
                {
                    ++removed;
                }
            }

            if (removed > 0)
            {
                ServerLogger::logInfo("Removed %zu expired IP blocks", removed);
            }
            return removed;
        }

        void IPBlockList::save() const
        {
            if (filePath_.empty())
            {
                return;
            }

            // Snapshot under the file lock so writes land in mutation order
            std::lock_guard<std::mutex> fileLock(fileMutex_);
            nlohmann::json records = nlohmann::json::array();
            {
                std::lock_guard<std::mutex> lock(mapMutex_);
                for (const auto &kv : blocked_)
                {
                    records.push_back(kv.second);
                }
            }

            const std::string tempPath = filePath_ + ".tmp";
            {
                std::ofstream out(tempPath, std::ios::trunc);
                if (!out.is_open())
                {
                    ServerLogger::logError("Failed to write block file %s", tempPath.c_str());
                    return;
                }
                out << records.dump(2);
                if (!out)
                {
                    ServerLogger::logError("Failed to write block file %s", tempPath.c_str());
                    return;
                }
            }

            if (std::rename(tempPath.c_str(), filePath_.c_str()) != 0)
            {
                ServerLogger::logError("Failed to replace block file %s", filePath_.c_str());
            }
        }

    } // namespace auth
} // namespace restgate
