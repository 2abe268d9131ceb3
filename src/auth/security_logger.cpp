#include "restgate/auth/security_logger.hpp"
#include "restgate/logger.hpp"
#include "restgate/utils.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace restgate
{
    namespace auth
    {

        SecurityLogger::SecurityLogger(const Config &config, std::shared_ptr<const Clock> clock)
            : config_(config), clock_(std::move(clock))
        {
            if (!config_.enabled)
            {
                return;
            }

            std::error_code ec;
            fs::create_directories(config_.directory, ec);
            if (ec)
            {
                ServerLogger::logError("Failed to create security log directory %s: %s",
                                       config_.directory.c_str(), ec.message().c_str());
            }
        }

        nlohmann::json SecurityLogger::entry(const char *type, const char *severity) const
        {
            return nlohmann::json{
                {"timestamp", format_utc(clock_->now())},
                {"type", type},
                {"severity", severity}};
        }

        void SecurityLogger::logRateLimitViolation(const std::string &identifier, const std::string &endpoint,
                                                   const std::string &ip, size_t currentCount, size_t maxAllowed)
        {
            auto e = entry("RATE_LIMIT_VIOLATION", "WARNING");
            e["identifier"] = identifier;
            e["endpoint"] = endpoint;
            e["ip"] = ip;
            e["currentCount"] = currentCount;
            e["maxAllowed"] = maxAllowed;

            ServerLogger::logWarning("Rate limit exceeded for %s on %s (%zu/%zu)",
                                     ip.c_str(), endpoint.c_str(), currentCount, maxAllowed);

            write(RATE_LIMIT_LOG_FILE, e);
            write(SECURITY_LOG_FILE, e);
        }

        void SecurityLogger::logIPBlocked(const std::string &ip, const std::string &reason,
                                          Clock::time_point blockedUntil, int violationCount)
        {
            auto e = entry("IP_BLOCKED", "HIGH");
            e["ip"] = ip;
            e["reason"] = reason;
            e["blockedUntil"] = format_utc(blockedUntil);
            e["violationCount"] = violationCount;

            ServerLogger::logWarning("[SECURITY ALERT] IP blocked: %s until %s (%s)",
                                     ip.c_str(), format_utc(blockedUntil).c_str(), reason.c_str());

            write(BLOCKED_IPS_LOG_FILE, e);
            write(SECURITY_LOG_FILE, e);
        }

        void SecurityLogger::logIPUnblocked(const std::string &ip, const std::string &reason)
        {
            auto e = entry("IP_UNBLOCKED", "INFO");
            e["ip"] = ip;
            e["reason"] = reason;

            ServerLogger::logInfo("IP unblocked: %s (%s)", ip.c_str(), reason.c_str());

            write(BLOCKED_IPS_LOG_FILE, e);
            write(SECURITY_LOG_FILE, e);
        }

        void SecurityLogger::logSuspiciousActivity(const std::string &activity, const std::string &ip,
                                                   const std::string &endpoint, const std::string &details)
        {
            auto e = entry("SUSPICIOUS_ACTIVITY", "WARNING");
            e["activity"] = activity;
            e["ip"] = ip;
            e["endpoint"] = endpoint;
            e["details"] = details.empty() ? nlohmann::json(nullptr) : nlohmann::json(details);

            ServerLogger::logWarning("Suspicious activity from %s on %s: %s",
                                     ip.c_str(), endpoint.c_str(), activity.c_str());

            write(SECURITY_LOG_FILE, e);
        }

        void SecurityLogger::logWhitelistAction(const std::string &ip, const std::string &action,
                                                const std::string &performedBy)
        {
            auto e = entry("WHITELIST_ACTION", "INFO");
            e["ip"] = ip;
            e["action"] = action;
            e["performedBy"] = performedBy;

            ServerLogger::logInfo("Whitelist %s: %s", action.c_str(), ip.c_str());

            write(SECURITY_LOG_FILE, e);
        }

        void SecurityLogger::logBlacklistAction(const std::string &ip, const std::string &action,
                                                const std::string &performedBy)
        {
            auto e = entry("BLACKLIST_ACTION", "HIGH");
            e["ip"] = ip;
            e["action"] = action;
            e["performedBy"] = performedBy;

            ServerLogger::logWarning("[SECURITY] Blacklist %s: %s", action.c_str(), ip.c_str());

            write(SECURITY_LOG_FILE, e);
        }

        void SecurityLogger::write(const char *fileName, const nlohmann::json &entry)
        {
            if (!config_.enabled)
            {
                return;
            }

            const std::string line = entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            const fs::path path = fs::path(config_.directory) / fileName;

            std::lock_guard<std::mutex> lock(fileMutex_);
            std::ofstream out(path, std::ios::app);
            if (!out.is_open())
            {
                ServerLogger::logError("Failed to open security log %s", path.string().c_str());
                return;
            }
            out << line << '\n';
        }

        void SecurityLogger::rotateLogs(int maxFileSizeMB)
        {
            const std::uintmax_t maxBytes = static_cast<std::uintmax_t>(maxFileSizeMB) * 1024 * 1024;
            const char *files[] = {SECURITY_LOG_FILE, RATE_LIMIT_LOG_FILE, BLOCKED_IPS_LOG_FILE};

            std::lock_guard<std::mutex> lock(fileMutex_);
            for (const char *name : files)
            {
                fs::path path = fs::path(config_.directory) / name;
                std::error_code ec;
                if (!fs::exists(path, ec) || fs::file_size(path, ec) <= maxBytes || ec)
                {
                    continue;
                }

                fs::path backup = fs::path(config_.directory) /
                                  (path.stem().string() + "_" + format_utc(clock_->now(), "%Y%m%d_%H%M%S") + ".log");
                fs::rename(path, backup, ec);
                if (ec)
                {
                    ServerLogger::logError("Failed to rotate %s: %s", name, ec.message().c_str());
                }
                else
                {
                    ServerLogger::logInfo("Rotated security log %s -> %s", name, backup.filename().string().c_str());
                }
            }
        }

        size_t SecurityLogger::pruneOldLogs(int daysToKeep)
        {
            std::error_code ec;
            if (!fs::is_directory(config_.directory, ec))
            {
                return 0;
            }

            const auto cutoff = fs::file_time_type::clock::now() - std::chrono::hours(24 * daysToKeep);
            std::vector<fs::path> stale;

            for (const auto &item : fs::directory_iterator(config_.directory, ec))
            {
                if (item.path().extension() != ".log")
                {
                    continue;
                }
                std::error_code timeError;
                auto written = fs::last_write_time(item.path(), timeError);
                if (!timeError && written < cutoff)
                {
                    stale.push_back(item.path());
                }
            }

            size_t removed = 0;
            std::lock_guard<std::mutex> lock(fileMutex_);
            for (const auto &path : stale)
            {
                std::error_code removeError;
                if (fs::remove(path, removeError))
                {
                    ++removed;
                    ServerLogger::logInfo("Removed old security log %s", path.filename().string().c_str());
                }
                else if (removeError)
                {
                    ServerLogger::logError("Failed to remove %s: %s", path.string().c_str(),
                                           removeError.message().c_str());
                }
            }
            return removed;
        }

    } // namespace auth
} // namespace restgate
