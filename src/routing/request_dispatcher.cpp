#include "restgate/routing/request_dispatcher.hpp"
#include "restgate/http/errors.hpp"
#include "restgate/logger.hpp"
#include "restgate/utils.hpp"

#include <chrono>
#include <cstdio>
#include <exception>

namespace restgate
{
    namespace routing
    {

        namespace
        {
            http::ActionResult errorResult(int status, const std::string &message)
            {
                return http::ActionResult::statusCode(status, nlohmann::json{{"error", message}});
            }
        } // namespace

        RequestDispatcher::RequestDispatcher(std::shared_ptr<const RouteRegistry> registry,
                                             std::shared_ptr<const auth::AuthMiddleware> authMiddleware,
                                             std::shared_ptr<const http::ResponseWriter> writer,
                                             RequestDispatcherOptions options)
            : registry_(std::move(registry)), auth_(std::move(authMiddleware)), writer_(std::move(writer)),
              options_(options)
        {
        }

        void RequestDispatcher::dispatch(http::HttpRequest &request, http::IByteSink &sink) const noexcept
        {
            const auto start = std::chrono::steady_clock::now();
            int status = 500;

            try
            {
                ServerLogger::logInfo("Dispatching %s %s from %s [%s]", request.method.c_str(),
                                      request.target.c_str(), request.clientIP.c_str(), thread_tag().c_str());

                std::optional<http::ActionResult> rejection = admit(request);
                if (rejection)
                {
                    status = rejection->status;
                    writer_->write(sink, request, *rejection);
                }
                else if (request.method == "OPTIONS")
                {
                    status = 204;
                    writer_->writePreflight(sink, request);
                }
                else
                {
                    http::ActionResult result = execute(request);
                    status = result.status;
                    writer_->write(sink, request, result);
                }
            }
            catch (const std::exception &ex)
            {
                ServerLogger::logError("Request pipeline failed for %s %s: %s", request.method.c_str(),
                                       request.path.c_str(), ex.what());
                status = 500;
                writer_->writeJson(sink, request, 500, nlohmann::json{{"error", "Internal server error"}});
            }

            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            ServerLogger::logInfo("Completed request %s %s -> %d in %lld ms", request.method.c_str(),
                                  request.path.c_str(), status, static_cast<long long>(elapsed.count()));
        }

        void RequestDispatcher::reject(const http::HttpRequest &request, http::IByteSink &sink, int status,
                                       const std::string &message) const noexcept
        {
            ServerLogger::logWarning("Rejected request from %s: %s", request.clientIP.c_str(), message.c_str());
            writer_->writeJson(sink, request, status, nlohmann::json{{"error", message}});
        }

        std::optional<http::ActionResult> RequestDispatcher::admit(http::HttpRequest &request) const
        {
            if (auth_)
            {
                auth::RateLimiter::RateLimitResult rate = auth_->checkRateLimit(request);
                if (!rate.allowed)
                {
                    return tooManyRequests(request, rate);
                }
            }

            std::optional<size_t> declared;
            try
            {
                declared = request.contentLength();
            }
            catch (const http::ClientInputError &ex)
            {
                return errorResult(ex.statusCode(), ex.what());
            }

            if (declared && *declared > maxBodyBytes())
            {
                ServerLogger::logWarning("Rejected %s %s from %s: declared body of %zu bytes exceeds %zu MB",
                                         request.method.c_str(), request.path.c_str(), request.clientIP.c_str(),
                                         *declared, options_.maxBodySizeMB);
                return entityTooLarge(*declared);
            }

            return std::nullopt;
        }

        http::ActionResult RequestDispatcher::execute(http::HttpRequest &request) const
        {
            std::optional<RouteMatch> route = registry_->findController(request.path);
            if (!route)
            {
                ServerLogger::logWarning("No controller for path %s", request.path.c_str());
                return http::ActionResult::notFound(nlohmann::json{
                    {"error", "Controller not found"},
                    {"requestedPath", to_lower(trim(request.path, "/"))},
                    {"availableRoutes", registry_->registeredRoutes()}});
            }

            std::optional<MethodMatch> method = RouteRegistry::matchMethod(*route->controller, request.method, route->subPath);
            if (!method)
            {
                ServerLogger::logWarning("No %s action for %s in %s", request.method.c_str(), route->subPath.c_str(),
                                         route->controller->typeName.c_str());
                return http::ActionResult::notFound(nlohmann::json{
                    {"error", "Route not found"},
                    {"subPath", route->subPath},
                    {"method", request.method}});
            }

            const ActionDescriptor &action = *method->action;
            RequestContext context(request);
            context.setRouteParams(method->routeParams);

            if (auth_)
            {
                auth::AuthMiddleware::AuthResult authResult =
                    auth_->authorize(route->controller->effectiveRequirement(action), request);
                if (!authResult.authorized)
                {
                    return errorResult(authResult.statusCode, authResult.errorMessage);
                }
                if (authResult.identity)
                {
                    context.setUser(std::move(*authResult.identity));
                }
            }

            try
            {
                request.loadBody(maxBodyBytes());
                Arguments arguments = resolver_.resolve(action, context, method->routeParams);

                ServerLogger::logDebug("Invoking %s.%s", route->controller->typeName.c_str(), action.name.c_str());
                return action.handler(context, arguments);
            }
            catch (const http::PayloadTooLargeError &ex)
            {
                ServerLogger::logWarning("Body of %s %s from %s exceeded %zu MB", request.method.c_str(),
                                         request.path.c_str(), request.clientIP.c_str(), options_.maxBodySizeMB);
                return entityTooLarge(ex.receivedBytes());
            }
            catch (const http::ClientInputError &ex)
            {
                return errorResult(ex.statusCode(), ex.what());
            }
            catch (const std::exception &ex)
            {
                ServerLogger::logError("Unhandled error in %s.%s: %s", route->controller->typeName.c_str(),
                                       action.name.c_str(), ex.what());
                return errorResult(500, "Internal server error");
            }
            catch (...)
            {
                ServerLogger::logError("Unhandled non-standard exception in %s.%s",
                                       route->controller->typeName.c_str(), action.name.c_str());
                return errorResult(500, "Internal server error");
            }
        }

        http::ActionResult RequestDispatcher::tooManyRequests(const http::HttpRequest &request,
                                                              const auth::RateLimiter::RateLimitResult &rate) const
        {
            std::string message = rate.reason;
            if (auth::RateLimiter *limiter = auth_->getRateLimiter())
            {
                auth::RateLimiter::Status status =
                    limiter->getStatus(request.clientIP, request.path, request.header("User-Agent"),
                                       auth::AuthMiddleware::extractBearerToken(request));
                if (!status.message.empty())
                {
                    message = status.message;
                }
            }

            char window[32];
            std::snprintf(window, sizeof(window), "%g minutes", rate.limit.timeWindow.count() / 60.0);

            nlohmann::json body = {
                {"error", "Too many requests"},
                {"message", message},
                {"retryAfter", rate.blockedUntil ? nlohmann::json(format_utc(*rate.blockedUntil)) : nlohmann::json(nullptr)},
                {"limit", rate.limit.maxRequests},
                {"window", window}};

            http::ActionResult result = http::ActionResult::statusCode(429, std::move(body));
            if (rate.blockedUntil)
            {
                result.headers["Retry-After"] = std::to_string(rate.retryAfter.count());
            }
            return result;
        }

        http::ActionResult RequestDispatcher::entityTooLarge(size_t receivedBytes) const
        {
            return http::ActionResult::statusCode(413, nlohmann::json{
                {"error", "Request entity too large"},
                {"maxAllowedSizeMB", options_.maxBodySizeMB},
                {"receivedSizeMB", static_cast<double>(receivedBytes) / (1024.0 * 1024.0)},
                {"suggestion", "Split your request into smaller chunks or contact support"}});
        }

    } // namespace routing
} // namespace restgate
