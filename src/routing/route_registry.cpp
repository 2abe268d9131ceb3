#include "restgate/routing/route_registry.hpp"
#include "restgate/logger.hpp"
#include "restgate/utils.hpp"

#include <algorithm>
#include <stdexcept>

namespace restgate
{
    namespace routing
    {

        std::string RouteRegistry::normalizePrefix(const std::string &path)
        {
            return to_lower(trim(path, "/ "));
        }

        void RouteRegistry::registerController(ControllerDescriptor descriptor)
        {
            std::string prefix = normalizePrefix(descriptor.routeTemplate);

            const std::string placeholder = "[controller]";
            size_t pos = prefix.find(placeholder);
            if (pos != std::string::npos)
            {
                prefix.replace(pos, placeholder.size(), descriptor.derivedName());
            }

            for (const auto &entry : entries_)
            {
                if (entry.prefix == prefix)
                {
                    throw std::invalid_argument("Duplicate route prefix '" + prefix + "' for " + descriptor.typeName +
                                                " (already used by " + entry.descriptor->typeName + ")");
                }
            }

            Entry entry;
            entry.prefix = prefix;
            entry.segments = split(prefix, '/', true);
            entry.descriptor = std::make_shared<const ControllerDescriptor>(std::move(descriptor));

            ServerLogger::logInfo("Registered controller %s at /%s (%zu actions)",
                                  entry.descriptor->typeName.c_str(), prefix.c_str(),
                                  entry.descriptor->actions.size());

            entries_.push_back(std::move(entry));
            std::stable_sort(entries_.begin(), entries_.end(),
                             [](const Entry &a, const Entry &b)
                             {
                                 if (a.segments.size() != b.segments.size())
                                 {
                                     return a.segments.size() > b.segments.size();
                                 }
                                 return a.prefix.size() > b.prefix.size();
                             });
        }

        std::optional<RouteMatch> RouteRegistry::findController(const std::string &path) const
        {
            std::vector<std::string> requestSegments = split(trim(path, "/"), '/', true);

            for (const auto &entry : entries_)
            {
                if (entry.segments.size() > requestSegments.size())
                {
                    continue;
                }

                bool matches = true;
                for (size_t i = 0; i < entry.segments.size(); ++i)
                {
                    if (!iequals(entry.segments[i], requestSegments[i]))
                    {
                        matches = false;
                        break;
                    }
                }
                if (!matches)
                {
                    continue;
                }

                std::vector<std::string> rest(requestSegments.begin() + static_cast<std::ptrdiff_t>(entry.segments.size()),
                                              requestSegments.end());
                RouteMatch match;
                match.controller = entry.descriptor;
                match.prefix = entry.prefix;
                match.subPath = "/" + join(rest, "/");
                return match;
            }

            return std::nullopt;
        }

        std::vector<std::string> RouteRegistry::registeredRoutes() const
        {
            std::vector<std::string> routes;
            routes.reserve(entries_.size());
            for (const auto &entry : entries_)
            {
                routes.push_back(entry.prefix);
            }
            return routes;
        }

        std::optional<MethodMatch> RouteRegistry::matchMethod(const ControllerDescriptor &controller,
                                                              const std::string &verb,
                                                              const std::string &subPath)
        {
            std::vector<std::string> parts = split(trim(subPath, "/"), '/', true);

            for (const auto &action : controller.actions)
            {
                if (!iequals(action.verb, verb) || action.segments.size() != parts.size())
                {
                    continue;
                }

                std::map<std::string, std::string> captures;
                bool matches = true;
                for (size_t i = 0; i < parts.size(); ++i)
                {
                    const std::string &segment = action.segments[i];
                    if (segment.size() >= 2 && segment.front() == '{' && segment.back() == '}')
                    {
                        captures[to_lower(segment.substr(1, segment.size() - 2))] = parts[i];
                    }
                    else if (!iequals(segment, parts[i]))
                    {
                        matches = false;
                        break;
                    }
                }

                if (matches)
                {
                    MethodMatch match;
                    match.action = &action;
                    match.routeParams = std::move(captures);
                    return match;
                }
            }

            return std::nullopt;
        }

    } // namespace routing
} // namespace restgate
