#include "restgate/routing/controller.hpp"
#include "restgate/utils.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace restgate
{
    namespace routing
    {

        bool ActionDescriptor::hasParamFrom(ParamSource source) const
        {
            return std::any_of(params.begin(), params.end(),
                               [source](const ParamSpec &p)
                               { return p.source == source; });
        }

        std::string ControllerDescriptor::derivedName() const
        {
            std::string name = to_lower(typeName);
            const std::string suffix = "controller";
            if (name.size() > suffix.size() &&
                name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0)
            {
                name.erase(name.size() - suffix.size());
            }
            return name;
        }

        std::optional<auth::AuthRequirement> ControllerDescriptor::effectiveRequirement(const ActionDescriptor &action) const
        {
            if (action.allowAnonymous)
            {
                return std::nullopt;
            }
            if (action.authorize)
            {
                return action.authorize;
            }
            if (allowAnonymous)
            {
                return std::nullopt;
            }
            return authorize;
        }

        ActionBuilder &ActionBuilder::param(ParamSpec spec)
        {
            action().params.push_back(std::move(spec));
            return *this;
        }

        ActionBuilder &ActionBuilder::authorize(const std::string &roles, const std::string &scheme)
        {
            auth::AuthRequirement requirement = auth::AuthRequirement::fromRoles(roles);
            requirement.scheme = scheme;
            action().authorize = requirement;
            return *this;
        }

        ActionBuilder &ActionBuilder::allowAnonymous()
        {
            action().allowAnonymous = true;
            return *this;
        }

        ActionBuilder &ActionBuilder::named(const std::string &name)
        {
            action().name = name;
            return *this;
        }

        ActionBuilder &ActionBuilder::handle(ActionHandler handler)
        {
            action().handler = std::move(handler);
            return *this;
        }

        ControllerBuilder::ControllerBuilder(const std::string &typeName)
        {
            descriptor_.typeName = typeName;
        }

        ControllerBuilder &ControllerBuilder::route(const std::string &routeTemplate)
        {
            descriptor_.routeTemplate = routeTemplate;
            return *this;
        }

        ControllerBuilder &ControllerBuilder::authorize(const std::string &roles, const std::string &scheme)
        {
            auth::AuthRequirement requirement = auth::AuthRequirement::fromRoles(roles);
            requirement.scheme = scheme;
            descriptor_.authorize = requirement;
            return *this;
        }

        ControllerBuilder &ControllerBuilder::allowAnonymous()
        {
            descriptor_.allowAnonymous = true;
            return *this;
        }

        ActionBuilder ControllerBuilder::action(const std::string &verb, const std::string &pathTemplate)
        {
            ActionDescriptor action;
            action.verb = verb;
            std::transform(action.verb.begin(), action.verb.end(), action.verb.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::toupper(c)); });
            action.pathTemplate = trim(pathTemplate, "/");
            action.segments = split(action.pathTemplate, '/', true);
            action.name = action.verb + " " + (action.pathTemplate.empty() ? "/" : action.pathTemplate);

            descriptor_.actions.push_back(std::move(action));
            return ActionBuilder(descriptor_, descriptor_.actions.size() - 1);
        }

        ControllerDescriptor ControllerBuilder::build() const
        {
            for (const auto &action : descriptor_.actions)
            {
                if (!action.handler)
                {
                    throw std::invalid_argument("Action '" + action.name + "' of " + descriptor_.typeName +
                                                " has no handler");
                }
            }
            return descriptor_;
        }

    } // namespace routing
} // namespace restgate
