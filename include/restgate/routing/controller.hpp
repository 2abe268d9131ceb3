#pragma once

#include "../export.hpp"
#include "../auth/token_verifier.hpp"
#include "../http/action_result.hpp"
#include "arguments.hpp"
#include "parameter_spec.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace restgate
{
    namespace routing
    {

        using ActionHandler = std::function<http::ActionResult(RequestContext &, const Arguments &)>;

        /**
         * @brief Handler that calls a const member action on a shared controller instance
         */
        template <typename Controller>
        ActionHandler bindAction(std::shared_ptr<const Controller> controller,
                                 http::ActionResult (Controller::*method)(RequestContext &, const Arguments &) const)
        {
            return [controller, method](RequestContext &context, const Arguments &args)
            {
                return ((*controller).*method)(context, args);
            };
        }

        /**
         * @brief One routable action: verb, path template, parameters and handler
         */
        struct RESTGATE_SERVER_API ActionDescriptor
        {
#pragma warning(push)
#pragma warning(disable: 4251)
            std::string verb;                  // Upper-case HTTP method
            std::string pathTemplate;          // e.g. "users/{id}"; empty matches the bare prefix
            std::vector<std::string> segments; // pathTemplate split on '/'
            std::vector<ParamSpec> params;
            ActionHandler handler;
            bool allowAnonymous = false;
            std::optional<auth::AuthRequirement> authorize;
            std::string name;
#pragma warning(pop)

            bool hasParamFrom(ParamSource source) const;
        };

        /**
         * @brief A controller: route prefix template, controller-level auth and its actions
         */
        struct RESTGATE_SERVER_API ControllerDescriptor
        {
#pragma warning(push)
#pragma warning(disable: 4251)
            std::string typeName;
            std::string routeTemplate = "api/[controller]";
            std::optional<auth::AuthRequirement> authorize;
            bool allowAnonymous = false;
            std::vector<ActionDescriptor> actions;
#pragma warning(pop)

            // Type name lowercased, without a trailing "controller"
            std::string derivedName() const;

            /**
             * @brief Requirement that applies to the action; std::nullopt means anonymous
             *
             * Action-level anonymous wins; an action requirement overrides the
             * controller's; otherwise the controller decides.
             */
            std::optional<auth::AuthRequirement> effectiveRequirement(const ActionDescriptor &action) const;
        };

        class ControllerBuilder;

        /**
         * @brief Fluent configuration of one action inside a ControllerBuilder
         */
        class RESTGATE_SERVER_API ActionBuilder
        {
        public:
            ActionBuilder(ControllerDescriptor &owner, size_t index) : owner_(owner), index_(index) {}

            ActionBuilder &param(ParamSpec spec);
            ActionBuilder &authorize(const std::string &roles = "", const std::string &scheme = "Bearer");
            ActionBuilder &allowAnonymous();
            ActionBuilder &named(const std::string &name);
            ActionBuilder &handle(ActionHandler handler);

        private:
            ActionDescriptor &action() { return owner_.actions.at(index_); }

            ControllerDescriptor &owner_;
            size_t index_;
        };

        /**
         * @brief Explicit registration table for one controller
         *
         *   ControllerBuilder users("UserController");
         *   users.route("api/user");
         *   users.get("{id}").param(ParamSpec::route("id", ParamType::Int)).handle(...);
         *   registry.registerController(users.build());
         */
        class RESTGATE_SERVER_API ControllerBuilder
        {
        public:
            explicit ControllerBuilder(const std::string &typeName);

            ControllerBuilder &route(const std::string &routeTemplate);
            ControllerBuilder &authorize(const std::string &roles = "", const std::string &scheme = "Bearer");
            ControllerBuilder &allowAnonymous();

            ActionBuilder action(const std::string &verb, const std::string &pathTemplate = "");
            ActionBuilder get(const std::string &pathTemplate = "") { return action("GET", pathTemplate); }
            ActionBuilder post(const std::string &pathTemplate = "") { return action("POST", pathTemplate); }
            ActionBuilder put(const std::string &pathTemplate = "") { return action("PUT", pathTemplate); }
            ActionBuilder patch(const std::string &pathTemplate = "") { return action("PATCH", pathTemplate); }
            ActionBuilder del(const std::string &pathTemplate = "") { return action("DELETE", pathTemplate); }
            ActionBuilder head(const std::string &pathTemplate = "") { return action("HEAD", pathTemplate); }
            ActionBuilder options(const std::string &pathTemplate = "") { return action("OPTIONS", pathTemplate); }

            /**
             * @brief Finished descriptor
             * @throws std::invalid_argument when an action has no handler
             */
            ControllerDescriptor build() const;

        private:
#pragma warning(push)
#pragma warning(disable: 4251)
            ControllerDescriptor descriptor_;
#pragma warning(pop)
        };

    } // namespace routing
} // namespace restgate
