#pragma once

#include "../export.hpp"
#include "../routing/controller.hpp"
#include "login_directory.hpp"

#include <memory>

namespace restgate
{
    namespace controllers
    {

        /**
         * @brief Sample anonymous controller under api/user
         *
         * Exercises route captures, body shapes, query binding and the OPTIONS and
         * HEAD verbs. GET security is the one action guarded by the Admin role.
         */
        class RESTGATE_SERVER_API UserController : public std::enable_shared_from_this<UserController>
        {
        public:
            explicit UserController(std::shared_ptr<const LoginDirectory> logins);

            routing::ControllerDescriptor describe() const;

            http::ActionResult list(routing::RequestContext &context, const routing::Arguments &args) const;
            http::ActionResult info(routing::RequestContext &context, const routing::Arguments &args) const;
            http::ActionResult security(routing::RequestContext &context, const routing::Arguments &args) const;
            http::ActionResult login(routing::RequestContext &context, const routing::Arguments &args) const;
            http::ActionResult update(routing::RequestContext &context, const routing::Arguments &args) const;
            http::ActionResult patch(routing::RequestContext &context, const routing::Arguments &args) const;
            http::ActionResult search(routing::RequestContext &context, const routing::Arguments &args) const;
            http::ActionResult options(routing::RequestContext &context, const routing::Arguments &args) const;
            http::ActionResult headCheck(routing::RequestContext &context, const routing::Arguments &args) const;

        private:
#pragma warning(push)
#pragma warning(disable: 4251)
            std::shared_ptr<const LoginDirectory> logins_;
#pragma warning(pop)
        };

    } // namespace controllers
} // namespace restgate
