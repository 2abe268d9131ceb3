#include "restgate/auth/rate_limiter.hpp"
#include "restgate/logger.hpp"
#include "restgate/utils.hpp"

#include <algorithm>
#include <functional>

namespace restgate
{
    namespace auth
    {

        namespace
        {
            const std::chrono::seconds kBlacklistDuration = std::chrono::hours(24 * 3650);
            constexpr int kBlacklistViolationCount = 999;

            std::chrono::seconds secondsUntil(Clock::time_point until, Clock::time_point now)
            {
                const auto remaining = std::chrono::duration_cast<std::chrono::seconds>(until - now);
                return remaining.count() > 0 ? remaining : std::chrono::seconds(0);
            }
        }

        nlohmann::json RateLimiter::Status::toJson() const
        {
            nlohmann::json j = {
                {"isAllowed", allowed},
                {"isWhitelisted", whitelisted},
                {"isBlacklisted", blacklisted},
                {"isBlocked", blocked},
                {"currentRequests", currentRequests},
                {"maxRequests", maxRequests},
                {"timeWindowSeconds", timeWindow.count()},
                {"remainingRequests", remainingRequests},
                {"resetTime", format_utc(resetTime)},
                {"message", message}};
            j["blockedUntil"] = blockedUntil ? nlohmann::json(format_utc(*blockedUntil)) : nlohmann::json(nullptr);
            j["blockReason"] = blockReason.empty() ? nlohmann::json(nullptr) : nlohmann::json(blockReason);
            return j;
        }

        RateLimiter::RateLimiter(const RateLimitConfig &config,
                                 std::shared_ptr<IPBlockList> blockList,
                                 std::shared_ptr<SecurityLogger> securityLogger,
                                 std::shared_ptr<const Clock> clock)
            : config_(config), blockList_(std::move(blockList)),
              securityLogger_(std::move(securityLogger)), clock_(std::move(clock))
        {
            if (!clock_)
            {
                clock_ = Clock::system();
            }

            ServerLogger::logInfo("Rate limiter initialized - Default: %zu requests/%lld seconds, Endpoints: %zu, "
                                  "Whitelisted: %zu, Blacklisted: %zu, Enabled: %s",
                                  config_.defaultMaxRequests,
                                  static_cast<long long>(config_.defaultTimeWindow.count()),
                                  config_.endpointLimits.size(), config_.whitelist.size(),
                                  config_.blacklist.size(), config_.enabled ? "true" : "false");
        }

        RateLimiter::~RateLimiter()
        {
            stopSweeper();
        }

        RateLimiter::RateLimitResult RateLimiter::check(const std::string &ip, const std::string &endpoint,
                                                        const std::string &userAgent, const std::string &token)
        {
            RateLimitResult result;
            result.limit = config_.limitForPath(endpoint);

            if (trim(ip).empty())
            {
                if (securityLogger_)
                {
                    securityLogger_->logSuspiciousActivity("Request without client IP", "unknown", endpoint);
                }
                result.allowed = false;
                result.reason = "Missing client IP";
                return result;
            }

            if (isBlacklisted(ip))
            {
                if (securityLogger_)
                {
                    securityLogger_->logSuspiciousActivity("Blacklisted IP attempted access", ip, endpoint);
                }
                result.allowed = false;
                result.reason = "IP is blacklisted";
                if (auto info = blockList_->getBlockInfo(ip))
                {
                    result.blockedUntil = info->blockedUntil;
                    result.retryAfter = secondsUntil(info->blockedUntil, clock_->now());
                }
                return result;
            }

            if (isWhitelisted(ip) || !config_.enabled)
            {
                return result;
            }

            if (blockList_->isBlocked(ip))
            {
                result.allowed = false;
                result.reason = "IP is temporarily blocked";
                if (auto info = blockList_->getBlockInfo(ip))
                {
                    result.blockedUntil = info->blockedUntil;
                    result.retryAfter = secondsUntil(info->blockedUntil, clock_->now());
                }
                return result;
            }

            const std::string identifier = generateIdentifier(ip, userAgent, token);
            const std::string key = identifier + "|" + result.limit.path;

            while (true)
            {
                auto window = windowFor(key, ip);
                std::unique_lock<std::mutex> lock(window->lock);
                if (window->retired)
                {
                    continue;
                }

                const auto now = clock_->now();
                const auto cutoff = now - result.limit.timeWindow;
                while (!window->requests.empty() && window->requests.front() <= cutoff)
                {
                    window->requests.pop_front();
                }

                if (window->requests.size() < result.limit.maxRequests)
                {
                    window->requests.push_back(now);
                    window->lastRequestTime = now;
                    ServerLogger::logDebug("Rate limit check passed for %s on %s - %zu/%zu",
                                           identifier.c_str(), endpoint.c_str(),
                                           window->requests.size(), result.limit.maxRequests);
                    return result;
                }

                window->violationCount++;
                window->lastRequestTime = now;
                const int cumulative = recordViolation(ip, now);

                if (securityLogger_)
                {
                    securityLogger_->logRateLimitViolation(identifier, endpoint, ip,
                                                           window->requests.size(), result.limit.maxRequests);
                }

                result.allowed = false;
                result.reason = "Rate limit exceeded";

                if (window->violationCount < config_.maxViolationsBeforeBlock)
                {
                    return result;
                }

                const auto duration = calculateBlockDuration(cumulative);
                const auto blockedUntil = blockList_->blockIP(ip, duration, "Too many requests on " + endpoint, cumulative);
                noteBlock(ip, blockedUntil);
                result.blockedUntil = blockedUntil;
                result.retryAfter = secondsUntil(blockedUntil, now);
                result.reason = "IP blocked after repeated violations";

                window->retired = true;
                lock.unlock();
                evictWindow(key, window);
                return result;
            }
        }

        RateLimiter::Status RateLimiter::getStatus(const std::string &ip, const std::string &endpoint,
                                                   const std::string &userAgent, const std::string &token)
        {
            Status status;
            const auto now = clock_->now();
            const EndpointLimit limit = config_.limitForPath(endpoint);
            status.maxRequests = limit.maxRequests;
            status.timeWindow = limit.timeWindow;

            if (isBlacklisted(ip))
            {
                status.allowed = false;
                status.blacklisted = true;
                status.message = "IP is permanently blacklisted";
                return status;
            }

            if (isWhitelisted(ip))
            {
                status.whitelisted = true;
                status.remainingRequests = limit.maxRequests;
                status.resetTime = now;
                status.message = "IP is whitelisted";
                return status;
            }

            if (blockList_->isBlocked(ip))
            {
                auto info = blockList_->getBlockInfo(ip);
                status.allowed = false;
                status.blocked = true;
                if (info)
                {
                    status.blockedUntil = info->blockedUntil;
                    status.blockReason = info->reason;
                    status.resetTime = info->blockedUntil;
                    status.message = "IP blocked until " + format_utc(info->blockedUntil);
                }
                else
                {
                    status.message = "IP blocked";
                }
                return status;
            }

            const std::string key = generateIdentifier(ip, userAgent, token) + "|" + limit.path;
            std::shared_ptr<ClientWindow> window;
            {
                std::shared_lock<std::shared_mutex> lock(clientsMutex_);
                auto it = clients_.find(key);
                if (it != clients_.end())
                {
                    window = it->second;
                }
            }

            if (!window)
            {
                status.remainingRequests = limit.maxRequests;
                status.resetTime = now + limit.timeWindow;
                status.message = "No recent requests";
                return status;
            }

            std::lock_guard<std::mutex> lock(window->lock);
            const auto cutoff = now - limit.timeWindow;
            size_t recent = static_cast<size_t>(std::count_if(window->requests.begin(), window->requests.end(),
                                                              [&](const Clock::time_point &t) { return t > cutoff; }));
            status.currentRequests = recent;
            status.allowed = recent < limit.maxRequests;
            status.remainingRequests = recent < limit.maxRequests ? limit.maxRequests - recent : 0;
            status.resetTime = window->requests.empty() ? now : window->requests.front() + limit.timeWindow;
            status.message = std::to_string(recent) + "/" + std::to_string(limit.maxRequests) + " requests used";
            return status;
        }

        std::string RateLimiter::generateIdentifier(const std::string &ip, const std::string &userAgent,
                                                    const std::string &token)
        {
            std::vector<std::string> parts{ip};

            if (!trim(userAgent).empty())
            {
                parts.push_back(std::to_string(std::hash<std::string>{}(userAgent)));
            }

            if (!trim(token).empty())
            {
                parts.push_back(token.substr(0, std::min<size_t>(10, token.size())));
            }

            return join(parts, "_");
        }

        std::chrono::seconds RateLimiter::calculateBlockDuration(int violationCount) const
        {
            using namespace std::chrono;
            const minutes base(config_.blockDurationMinutes);

            if (violationCount <= 3)
                return duration_cast<seconds>(base);
            if (violationCount <= 5)
                return duration_cast<seconds>(base * 2);
            if (violationCount <= 10)
                return hours(1);
            if (violationCount <= 20)
                return hours(6);
            return hours(24);
        }

        void RateLimiter::addToWhitelist(const std::string &ip)
        {
            const std::string cleaned = trim(ip);
            if (cleaned.empty())
            {
                return;
            }
            {
                std::lock_guard<std::mutex> lock(listsMutex_);
                config_.whitelist.insert(cleaned);
            }
            blockList_->unblockIP(cleaned, "Added to whitelist");
            if (securityLogger_)
            {
                securityLogger_->logWhitelistAction(cleaned, "ADDED");
            }
        }

        void RateLimiter::removeFromWhitelist(const std::string &ip)
        {
            {
                std::lock_guard<std::mutex> lock(listsMutex_);
                config_.whitelist.erase(trim(ip));
            }
            if (securityLogger_)
            {
                securityLogger_->logWhitelistAction(ip, "REMOVED");
            }
        }

        void RateLimiter::addToBlacklist(const std::string &ip)
        {
            const std::string cleaned = trim(ip);
            if (cleaned.empty())
            {
                return;
            }
            {
                std::lock_guard<std::mutex> lock(listsMutex_);
                config_.blacklist.insert(cleaned);
            }
            blockList_->blockIP(cleaned, kBlacklistDuration, "Permanent blacklist", kBlacklistViolationCount);
            if (securityLogger_)
            {
                securityLogger_->logBlacklistAction(cleaned, "ADDED");
            }
        }

        void RateLimiter::removeFromBlacklist(const std::string &ip)
        {
            const std::string cleaned = trim(ip);
            {
                std::lock_guard<std::mutex> lock(listsMutex_);
                config_.blacklist.erase(cleaned);
            }
            blockList_->unblockIP(cleaned, "Removed from blacklist");
            if (securityLogger_)
            {
                securityLogger_->logBlacklistAction(cleaned, "REMOVED");
            }
        }

        bool RateLimiter::isWhitelisted(const std::string &ip) const
        {
            std::lock_guard<std::mutex> lock(listsMutex_);
            return config_.whitelist.count(ip) > 0;
        }

        bool RateLimiter::isBlacklisted(const std::string &ip) const
        {
            std::lock_guard<std::mutex> lock(listsMutex_);
            return config_.blacklist.count(ip) > 0;
        }

        bool RateLimiter::unblockIP(const std::string &ip)
        {
            bool removed = blockList_->unblockIP(ip, "Unblocked manually");
            if (removed)
            {
                ServerLogger::logInfo("IP unblocked manually: %s", ip.c_str());
            }
            return removed;
        }

        std::vector<BlockedIPInfo> RateLimiter::getBlockedIPs() const
        {
            return blockList_->getAllBlockedIPs();
        }

        nlohmann::json RateLimiter::getStatistics() const
        {
            auto blocked = blockList_->getAllBlockedIPs();

            nlohmann::json list = nlohmann::json::array();
            for (const auto &info : blocked)
            {
                list.push_back({{"ip", info.ip},
                                {"blockedAt", format_utc(info.blockedAt)},
                                {"blockedUntil", format_utc(info.blockedUntil)},
                                {"reason", info.reason},
                                {"violationCount", info.violationCount}});
            }

            size_t whitelisted = 0;
            size_t blacklisted = 0;
            {
                std::lock_guard<std::mutex> lock(listsMutex_);
                whitelisted = config_.whitelist.size();
                blacklisted = config_.blacklist.size();
            }

            return {
                {"activeClients", activeClientCount()},
                {"blockedIPs", blocked.size()},
                {"whitelistedIPs", whitelisted},
                {"blacklistedIPs", blacklisted},
                {"configuredEndpoints", config_.endpointLimits.size()},
                {"blockedIPsList", list}};
        }

        size_t RateLimiter::activeClientCount() const
        {
            std::shared_lock<std::shared_mutex> lock(clientsMutex_);
            return clients_.size();
        }

        void RateLimiter::sweep()
        {
            blockList_->clearExpiredBlocks();

            const auto now = clock_->now();
            const auto inactiveCutoff = now - config_.inactiveClientTimeout;

            std::vector<std::pair<std::string, std::shared_ptr<ClientWindow>>> candidates;
            {
                std::shared_lock<std::shared_mutex> lock(clientsMutex_);
                candidates.assign(clients_.begin(), clients_.end());
            }

            size_t evicted = 0;
            for (auto &candidate : candidates)
            {
                {
                    std::lock_guard<std::mutex> lock(candidate.second->lock);
                    if (candidate.second->retired || candidate.second->lastRequestTime > inactiveCutoff)
                    {
                        continue;
                    }
                    candidate.second->retired = true;
                }
                evictWindow(candidate.first, candidate.second);
                ++evicted;
            }

            {
                std::lock_guard<std::mutex> lock(violationsMutex_);
                for (auto it = violations_.begin(); it != violations_.end();)
                {
                    if (it->second.lastActivity <= inactiveCutoff)
                    {
                        it = violations_.erase(it);
                    }
                    else
                    {
                        ++it;
                    }
                }
            }

            if (evicted > 0)
            {
                ServerLogger::logInfo("Rate limiter sweep removed %zu inactive clients", evicted);
            }
        }

        void RateLimiter::startSweeper()
        {
            std::lock_guard<std::mutex> lock(sweeperMutex_);
            if (sweeper_.joinable())
            {
                return;
            }
            sweeperStop_ = false;

            sweeper_ = std::thread([this]()
                                   {
                                       std::unique_lock<std::mutex> lock(sweeperMutex_);
                                       while (!sweeperStop_)
                                       {
                                           if (sweeperCv_.wait_for(lock, config_.sweepInterval,
                                                                   [this]() { return sweeperStop_; }))
                                           {
                                               break;
                                           }
                                           lock.unlock();
                                           try
                                           {
                                               sweep();
                                           }
                                           catch (const std::exception &ex)
                                           {
                                               ServerLogger::logError("Rate limiter sweep failed: %s", ex.what());
                                           }
                                           lock.lock();
                                       } });

            ServerLogger::logDebug("Rate limiter sweeper started (interval %lld seconds)",
                                   static_cast<long long>(config_.sweepInterval.count()));
        }

        void RateLimiter::stopSweeper()
        {
            {
                std::lock_guard<std::mutex> lock(sweeperMutex_);
                if (!sweeper_.joinable())
                {
                    return;
                }
                sweeperStop_ = true;
            }
            sweeperCv_.notify_all();
            sweeper_.join();
        }

        RateLimitConfig RateLimiter::getConfig() const
        {
            std::lock_guard<std::mutex> lock(listsMutex_);
            return config_;
        }

        std::shared_ptr<RateLimiter::ClientWindow> RateLimiter::windowFor(const std::string &key, const std::string &ip)
        {
            {
                std::shared_lock<std::shared_mutex> lock(clientsMutex_);
                auto it = clients_.find(key);
                if (it != clients_.end())
                {
                    return it->second;
                }
            }

            std::unique_lock<std::shared_mutex> lock(clientsMutex_);
            auto &slot = clients_[key];
            if (!slot)
            {
                slot = std::make_shared<ClientWindow>();
                slot->ip = ip;
                slot->lastRequestTime = clock_->now();
            }
            return slot;
        }

        void RateLimiter::evictWindow(const std::string &key, const std::shared_ptr<ClientWindow> &window)
        {
            std::unique_lock<std::shared_mutex> lock(clientsMutex_);
            auto it = clients_.find(key);
            if (it != clients_.end() && it->second == window)
            {
                clients_.erase(it);
            }
        }

        int RateLimiter::recordViolation(const std::string &ip, Clock::time_point now)
        {
            std::lock_guard<std::mutex> lock(violationsMutex_);
            auto &history = violations_[ip];
            history.count++;
            history.lastActivity = std::max(history.lastActivity, now);
            return history.count;
        }

        void RateLimiter::noteBlock(const std::string &ip, Clock::time_point blockedUntil)
        {
            std::lock_guard<std::mutex> lock(violationsMutex_);
            auto &history = violations_[ip];
            history.lastActivity = std::max(history.lastActivity, blockedUntil);
        }

    } // namespace auth
} // namespace restgate
