#include "restgate/controllers/security_controller.hpp"
#include "restgate/http/http_request.hpp"
#include "restgate/logger.hpp"
#include "restgate/utils.hpp"

#include <chrono>
#include <vector>

namespace restgate
{
    namespace controllers
    {

        using routing::ParamSpec;

        namespace
        {
            // Validated address argument, empty when it is not a literal IP
            std::string addressArgument(const routing::Arguments &args)
            {
                const std::string ip = args.getOr<std::string>("ip", "");
                return http::is_valid_ip(ip) ? ip : std::string();
            }

            http::ActionResult invalidAddress()
            {
                return http::ActionResult::badRequest({{"error", "A valid IPv4 or IPv6 address is required"}});
            }

            std::string performer(const routing::RequestContext &context)
            {
                return context.user() ? context.user()->name : std::string("unknown");
            }
        } // namespace

        SecurityController::SecurityController(std::shared_ptr<auth::RateLimiter> rateLimiter)
            : rateLimiter_(std::move(rateLimiter))
        {
        }

        routing::ControllerDescriptor SecurityController::describe() const
        {
            auto self = shared_from_this();

            routing::ControllerBuilder builder("SecurityController");
            builder.route("api/[controller]").authorize("Admin");

            builder.get("statistics").handle(routing::bindAction(self, &SecurityController::statistics));
            builder.get("blocked").handle(routing::bindAction(self, &SecurityController::blocked));
            builder.get("status/{ip}")
                .param(ParamSpec::route("ip"))
                .param(ParamSpec::query("endpoint").withDefault("/"))
                .handle(routing::bindAction(self, &SecurityController::status));
            builder.post("whitelist/{ip}")
                .param(ParamSpec::route("ip"))
                .handle(routing::bindAction(self, &SecurityController::whitelistAdd));
            builder.del("whitelist/{ip}")
                .param(ParamSpec::route("ip"))
                .handle(routing::bindAction(self, &SecurityController::whitelistRemove));
            builder.post("blacklist/{ip}")
                .param(ParamSpec::route("ip"))
                .handle(routing::bindAction(self, &SecurityController::blacklistAdd));
            builder.del("blacklist/{ip}")
                .param(ParamSpec::route("ip"))
                .handle(routing::bindAction(self, &SecurityController::blacklistRemove));
            builder.del("blocked/{ip}")
                .param(ParamSpec::route("ip"))
                .handle(routing::bindAction(self, &SecurityController::unblock));
            builder.get("logs")
                .param(ParamSpec::query("limit", routing::ParamType::Int).withDefault(100))
                .handle(routing::bindAction(self, &SecurityController::logs));

            return builder.build();
        }

        http::ActionResult SecurityController::statistics(routing::RequestContext &, const routing::Arguments &) const
        {
            return http::ActionResult::ok(rateLimiter_->getStatistics());
        }

        http::ActionResult SecurityController::blocked(routing::RequestContext &, const routing::Arguments &) const
        {
            nlohmann::json list = nlohmann::json::array();
            for (const auto &info : rateLimiter_->getBlockedIPs())
            {
                list.push_back(nlohmann::json(info));
            }
            return http::ActionResult::ok({{"count", list.size()}, {"blockedIPs", list}});
        }

        http::ActionResult SecurityController::status(routing::RequestContext &, const routing::Arguments &args) const
        {
            const std::string ip = addressArgument(args);
            if (ip.empty())
            {
                return invalidAddress();
            }
            auth::RateLimiter::Status standing = rateLimiter_->getStatus(ip, args.getOr<std::string>("endpoint", "/"));
            return http::ActionResult::ok(standing.toJson());
        }

        http::ActionResult SecurityController::whitelistAdd(routing::RequestContext &context,
                                                            const routing::Arguments &args) const
        {
            const std::string ip = addressArgument(args);
            if (ip.empty())
            {
                return invalidAddress();
            }
            rateLimiter_->addToWhitelist(ip);
            ServerLogger::logInfo("IP %s whitelisted by %s", ip.c_str(), performer(context).c_str());
            return http::ActionResult::ok({{"ip", ip}, {"whitelisted", true}});
        }

        http::ActionResult SecurityController::whitelistRemove(routing::RequestContext &context,
                                                               const routing::Arguments &args) const
        {
            const std::string ip = addressArgument(args);
            if (ip.empty())
            {
                return invalidAddress();
            }
            if (!rateLimiter_->isWhitelisted(ip))
            {
                return http::ActionResult::notFound({{"error", "IP is not whitelisted"}, {"ip", ip}});
            }
            rateLimiter_->removeFromWhitelist(ip);
            ServerLogger::logInfo("IP %s removed from whitelist by %s", ip.c_str(), performer(context).c_str());
            return http::ActionResult::ok({{"ip", ip}, {"whitelisted", false}});
        }

        http::ActionResult SecurityController::blacklistAdd(routing::RequestContext &context,
                                                            const routing::Arguments &args) const
        {
            const std::string ip = addressArgument(args);
            if (ip.empty())
            {
                return invalidAddress();
            }
            rateLimiter_->addToBlacklist(ip);
            ServerLogger::logWarning("IP %s blacklisted by %s", ip.c_str(), performer(context).c_str());
            return http::ActionResult::ok({{"ip", ip}, {"blacklisted", true}});
        }

        http::ActionResult SecurityController::blacklistRemove(routing::RequestContext &context,
                                                               const routing::Arguments &args) const
        {
            const std::string ip = addressArgument(args);
            if (ip.empty())
            {
                return invalidAddress();
            }
            if (!rateLimiter_->isBlacklisted(ip))
            {
                return http::ActionResult::notFound({{"error", "IP is not blacklisted"}, {"ip", ip}});
            }
            rateLimiter_->removeFromBlacklist(ip);
            ServerLogger::logInfo("IP %s removed from blacklist by %s", ip.c_str(), performer(context).c_str());
            return http::ActionResult::ok({{"ip", ip}, {"blacklisted", false}});
        }

        http::ActionResult SecurityController::unblock(routing::RequestContext &context,
                                                       const routing::Arguments &args) const
        {
            const std::string ip = addressArgument(args);
            if (ip.empty())
            {
                return invalidAddress();
            }
            if (!rateLimiter_->unblockIP(ip))
            {
                return http::ActionResult::notFound({{"error", "IP is not blocked"}, {"ip", ip}});
            }
            ServerLogger::logInfo("IP %s unblocked by %s", ip.c_str(), performer(context).c_str());
            return http::ActionResult::ok({{"ip", ip}, {"unblocked", true}});
        }

        http::ActionResult SecurityController::logs(routing::RequestContext &, const routing::Arguments &args) const
        {
            const int limit = args.get<int>("limit");
            if (limit <= 0)
            {
                return http::ActionResult::badRequest({{"error", "limit must be positive"}});
            }

            std::vector<LogEntry> entries = ServerLogger::instance().getLogs();
            const size_t first = entries.size() > static_cast<size_t>(limit) ? entries.size() - limit : 0;

            nlohmann::json list = nlohmann::json::array();
            for (size_t i = first; i < entries.size(); ++i)
            {
                list.push_back({{"level", ServerLogger::levelToString(entries[i].level)},
                                {"timestamp", entries[i].timestamp},
                                {"message", entries[i].message}});
            }

            return http::ActionResult::ok({{"logs", list},
                                           {"totalCount", list.size()},
                                           {"retrievedAt", to_iso8601(std::chrono::system_clock::now())}});
        }

    } // namespace controllers
} // namespace restgate
