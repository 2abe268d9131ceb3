#include "restgate/controllers/admin_controller.hpp"
#include "restgate/logger.hpp"

namespace restgate
{
    namespace controllers
    {

        using routing::ParamSpec;
        using routing::ParamType;
        using routing::ShapeField;

        AdminController::AdminController(std::shared_ptr<const LoginDirectory> logins)
            : logins_(std::move(logins))
        {
        }

        routing::ControllerDescriptor AdminController::describe() const
        {
            auto self = shared_from_this();

            routing::ControllerBuilder builder("AdminController");
            builder.route("api/[controller]").authorize("Admin");

            builder.get().handle(routing::bindAction(self, &AdminController::get));
            builder.get("info").handle(routing::bindAction(self, &AdminController::info));
            builder.post("login")
                .allowAnonymous()
                .param(ParamSpec::body("request").withShape({ShapeField("username", ParamType::String),
                                                             ShapeField("password", ParamType::String)}))
                .handle(routing::bindAction(self, &AdminController::login));

            return builder.build();
        }

        http::ActionResult AdminController::get(routing::RequestContext &, const routing::Arguments &) const
        {
            return http::ActionResult::ok({{"message", "Welcome to the AdminController!"}});
        }

        http::ActionResult AdminController::info(routing::RequestContext &context, const routing::Arguments &) const
        {
            return http::ActionResult::ok({{"message", "Hello from the server"},
                                           {"clientIp", context.clientIP()},
                                           {"user", context.user() ? context.user()->name : ""}});
        }

        http::ActionResult AdminController::login(routing::RequestContext &context, const routing::Arguments &args) const
        {
            const nlohmann::json &request = args.json("request");
            auto field = [&request](const char *key)
            {
                if (!request.is_object())
                    return std::string();
                auto it = request.find(key);
                return (it != request.end() && it->is_string()) ? it->get<std::string>() : std::string();
            };
            const std::string username = field("username");
            const std::string password = field("password");

            std::optional<LoginDirectory::Account> account =
                logins_ ? logins_->login(username, password) : std::nullopt;

            // Only accounts that hold the Admin role may sign in here
            if (!account || !account->hasRole("Admin"))
            {
                ServerLogger::logWarning("Failed admin login for '%s' from %s", username.c_str(),
                                         context.clientIP().c_str());
                return http::ActionResult::unauthorized({{"error", "Invalid credentials"}});
            }

            return http::ActionResult::ok({{"token", account->token},
                                           {"user", {{"name", account->name}, {"roles", account->roles}}}});
        }

    } // namespace controllers
} // namespace restgate
