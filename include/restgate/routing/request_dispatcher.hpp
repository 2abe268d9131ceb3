#pragma once

#include "../export.hpp"
#include "../auth/auth_middleware.hpp"
#include "../http/action_result.hpp"
#include "../http/byte_sink.hpp"
#include "../http/http_request.hpp"
#include "../http/response_writer.hpp"
#include "parameter_resolver.hpp"
#include "route_registry.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace restgate
{
    namespace routing
    {

        struct RESTGATE_SERVER_API RequestDispatcherOptions
        {
            size_t maxBodySizeMB = 10;
        };

        /**
         * @brief Runs one request through the pipeline and writes the response
         *
         * Rate limit, declared size, CORS preflight, controller lookup, action
         * lookup, authorization, body read, parameter binding, handler, response.
         * Each stage can end the request early with its own status.
         */
        class RESTGATE_SERVER_API RequestDispatcher
        {
        public:
            RequestDispatcher(std::shared_ptr<const RouteRegistry> registry,
                              std::shared_ptr<const auth::AuthMiddleware> authMiddleware,
                              std::shared_ptr<const http::ResponseWriter> writer,
                              RequestDispatcherOptions options = RequestDispatcherOptions());

            /**
             * @brief Handle the request and write exactly one response to the sink
             */
            void dispatch(http::HttpRequest &request, http::IByteSink &sink) const noexcept;

            /**
             * @brief Rate-limit and declared-size checks
             * @return The rejection to send, or std::nullopt to continue
             */
            std::optional<http::ActionResult> admit(http::HttpRequest &request) const;

            /**
             * @brief Route, authorize, bind and invoke; never throws for request errors
             */
            http::ActionResult execute(http::HttpRequest &request) const;

            /**
             * @brief Answer a request that never reached the pipeline (malformed head, oversized headers)
             */
            void reject(const http::HttpRequest &request, http::IByteSink &sink, int status,
                        const std::string &message) const noexcept;

            size_t maxBodyBytes() const { return options_.maxBodySizeMB * 1024 * 1024; }

        private:
            http::ActionResult tooManyRequests(const http::HttpRequest &request,
                                               const auth::RateLimiter::RateLimitResult &rate) const;
            http::ActionResult entityTooLarge(size_t receivedBytes) const;

#pragma warning(push)
#pragma warning(disable: 4251)
            std::shared_ptr<const RouteRegistry> registry_;
            std::shared_ptr<const auth::AuthMiddleware> auth_;
            std::shared_ptr<const http::ResponseWriter> writer_;
#pragma warning(pop)
            ParameterResolver resolver_;
            RequestDispatcherOptions options_;
        };

    } // namespace routing
} // namespace restgate
