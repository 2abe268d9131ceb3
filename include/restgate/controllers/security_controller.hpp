#pragma once

#include "../export.hpp"
#include "../auth/rate_limiter.hpp"
#include "../routing/controller.hpp"

#include <memory>

namespace restgate
{
    namespace controllers
    {

        /**
         * @brief Admin-only view and control of the rate limiter under api/security
         */
        class RESTGATE_SERVER_API SecurityController : public std::enable_shared_from_this<SecurityController>
        {
        public:
            explicit SecurityController(std::shared_ptr<auth::RateLimiter> rateLimiter);

            routing::ControllerDescriptor describe() const;

            http::ActionResult statistics(routing::RequestContext &context, const routing::Arguments &args) const;
            http::ActionResult blocked(routing::RequestContext &context, const routing::Arguments &args) const;
            http::ActionResult status(routing::RequestContext &context, const routing::Arguments &args) const;
            http::ActionResult whitelistAdd(routing::RequestContext &context, const routing::Arguments &args) const;
            http::ActionResult whitelistRemove(routing::RequestContext &context, const routing::Arguments &args) const;
            http::ActionResult blacklistAdd(routing::RequestContext &context, const routing::Arguments &args) const;
            http::ActionResult blacklistRemove(routing::RequestContext &context, const routing::Arguments &args) const;
            http::ActionResult unblock(routing::RequestContext &context, const routing::Arguments &args) const;
            http::ActionResult logs(routing::RequestContext &context, const routing::Arguments &args) const;

        private:
#pragma warning(push)
#pragma warning(disable: 4251)
            std::shared_ptr<auth::RateLimiter> rateLimiter_;
#pragma warning(pop)
        };

    } // namespace controllers
} // namespace restgate
