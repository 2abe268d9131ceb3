#include "restgate/controllers/user_controller.hpp"
#include "restgate/logger.hpp"

namespace restgate
{
    namespace controllers
    {

        using routing::ParamSpec;
        using routing::ParamType;
        using routing::ShapeField;

        namespace
        {
            std::string stringField(const nlohmann::json &object, const char *key)
            {
                if (!object.is_object())
                {
                    return "";
                }
                auto it = object.find(key);
                return (it != object.end() && it->is_string()) ? it->get<std::string>() : std::string();
            }
        } // namespace

        UserController::UserController(std::shared_ptr<const LoginDirectory> logins)
            : logins_(std::move(logins))
        {
        }

        routing::ControllerDescriptor UserController::describe() const
        {
            auto self = shared_from_this();

            routing::ControllerBuilder builder("UserController");
            builder.route("api/[controller]").allowAnonymous();

            builder.get().handle(routing::bindAction(self, &UserController::list));
            builder.get("info").handle(routing::bindAction(self, &UserController::info));
            builder.get("security")
                .authorize("Admin")
                .handle(routing::bindAction(self, &UserController::security));
            builder.post("login")
                .allowAnonymous()
                .param(ParamSpec::body("request").withShape({ShapeField("username", ParamType::String),
                                                             ShapeField("password", ParamType::String)}))
                .handle(routing::bindAction(self, &UserController::login));
            builder.put("{user_id}")
                .param(ParamSpec::route("user_id"))
                .param(ParamSpec::body("json"))
                .handle(routing::bindAction(self, &UserController::update));
            builder.patch("{userId}")
                .param(ParamSpec::route("userId"))
                .param(ParamSpec::body("data"))
                .handle(routing::bindAction(self, &UserController::patch));
            builder.get("search")
                .param(ParamSpec::query("page", ParamType::Int).withDefault(1))
                .param(ParamSpec::query("size", ParamType::Int).withDefault(10))
                .param(ParamSpec::query("active", ParamType::Bool).asNullable())
                .param(ParamSpec::query("name").asNullable())
                .handle(routing::bindAction(self, &UserController::search));
            builder.options().handle(routing::bindAction(self, &UserController::options));
            builder.head("{id}")
                .param(ParamSpec::route("id"))
                .handle(routing::bindAction(self, &UserController::headCheck));

            return builder.build();
        }

        http::ActionResult UserController::list(routing::RequestContext &, const routing::Arguments &) const
        {
            return http::ActionResult::ok({{"message", "Welcome to the UserController!"}});
        }

        http::ActionResult UserController::info(routing::RequestContext &context, const routing::Arguments &) const
        {
            return http::ActionResult::ok({{"message", "Hello from the server"}, {"clientIp", context.clientIP()}});
        }

        http::ActionResult UserController::security(routing::RequestContext &context, const routing::Arguments &) const
        {
            return http::ActionResult::ok({{"username", context.user() ? context.user()->name : ""},
                                           {"message", "This is a secure endpoint."}});
        }

        http::ActionResult UserController::login(routing::RequestContext &context, const routing::Arguments &args) const
        {
            const nlohmann::json &request = args.json("request");
            const std::string username = stringField(request, "username");

            std::optional<LoginDirectory::Account> account =
                logins_ ? logins_->login(username, stringField(request, "password")) : std::nullopt;
            if (!account)
            {
                ServerLogger::logWarning("Failed login for '%s' from %s", username.c_str(), context.clientIP().c_str());
                return http::ActionResult::unauthorized({{"error", "Invalid credentials"}});
            }

            return http::ActionResult::ok({{"token", account->token},
                                           {"user", {{"name", account->name}, {"roles", account->roles}}}});
        }

        http::ActionResult UserController::update(routing::RequestContext &, const routing::Arguments &args) const
        {
            const std::string userId = args.getOr<std::string>("user_id", "");
            const std::string name = stringField(args.json("json"), "name");
            return http::ActionResult::ok({{"message", "User " + userId + " as " + name}});
        }

        http::ActionResult UserController::patch(routing::RequestContext &, const routing::Arguments &args) const
        {
            nlohmann::json fields = nlohmann::json::array();
            const nlohmann::json &data = args.json("data");
            if (data.is_object())
            {
                for (auto it = data.begin(); it != data.end(); ++it)
                {
                    fields.push_back(it.key());
                }
            }
            return http::ActionResult::ok({{"userId", args.getOr<std::string>("userId", "")},
                                           {"updatedFields", fields}});
        }

        http::ActionResult UserController::search(routing::RequestContext &, const routing::Arguments &args) const
        {
            return http::ActionResult::ok({{"page", args.get<int>("page")},
                                           {"size", args.get<int>("size")},
                                           {"active", args.json("active")},
                                           {"name", args.json("name")},
                                           {"results", nlohmann::json::array()}});
        }

        http::ActionResult UserController::options(routing::RequestContext &, const routing::Arguments &) const
        {
            http::ActionResult result = http::ActionResult::ok({{"message", "all good"}});
            result.headers["Allow"] = "GET,POST,PUT,DELETE,PATCH";
            return result;
        }

        http::ActionResult UserController::headCheck(routing::RequestContext &, const routing::Arguments &) const
        {
            return http::ActionResult::ok();
        }

    } // namespace controllers
} // namespace restgate
