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
         * @brief Sample controller under api/admin, Admin role required except for login
         */
        class RESTGATE_SERVER_API AdminController : public std::enable_shared_from_this<AdminController>
        {
        public:
            explicit AdminController(std::shared_ptr<const LoginDirectory> logins);

            routing::ControllerDescriptor describe() const;

            http::ActionResult get(routing::RequestContext &context, const routing::Arguments &args) const;
            http::ActionResult info(routing::RequestContext &context, const routing::Arguments &args) const;
            http::ActionResult login(routing::RequestContext &context, const routing::Arguments &args) const;

        private:
#pragma warning(push)
#pragma warning(disable: 4251)
            std::shared_ptr<const LoginDirectory> logins_;
#pragma warning(pop)
        };

    } // namespace controllers
} // namespace restgate
