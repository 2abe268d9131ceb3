#pragma once

#include "../export.hpp"
#include "controller.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace restgate
{
    namespace routing
    {

        /**
         * @brief Controller found for a request path
         */
        struct RESTGATE_SERVER_API RouteMatch
        {
#pragma warning(push)
#pragma warning(disable: 4251)
            std::shared_ptr<const ControllerDescriptor> controller;
            std::string prefix;  // Registered prefix, e.g. "api/user"
            std::string subPath; // Unmatched tail with a leading '/', "/" when empty
#pragma warning(pop)
        };

        /**
         * @brief Action selected inside a controller
         */
        struct RESTGATE_SERVER_API MethodMatch
        {
#pragma warning(push)
#pragma warning(disable: 4251)
            const ActionDescriptor *action = nullptr;
            std::map<std::string, std::string> routeParams; // Lowercased placeholder name -> segment text
#pragma warning(pop)
        };

        /**
         * @brief Prefix table mapping request paths to controllers
         *
         * Filled once at startup and read-only afterwards, so lookups need no locking.
         */
        class RESTGATE_SERVER_API RouteRegistry
        {
        public:
            /**
             * @brief Register a controller under its normalized route prefix
             *
             * "[controller]" in the route template is replaced with the derived name.
             * @throws std::invalid_argument when the prefix is already taken
             */
            void registerController(ControllerDescriptor descriptor);

            /**
             * @brief Longest-prefix lookup; more segments first, then longer literal text
             *
             * Prefix segments compare case-insensitively; the sub-path keeps the
             * request's original text.
             */
            std::optional<RouteMatch> findController(const std::string &path) const;

            std::vector<std::string> registeredRoutes() const;
            size_t size() const { return entries_.size(); }

            /**
             * @brief First action, in registration order, whose verb and template fit the sub-path
             *
             * Segment counts must match; "{name}" captures any segment, literals
             * compare case-insensitively.
             */
            static std::optional<MethodMatch> matchMethod(const ControllerDescriptor &controller,
                                                          const std::string &verb,
                                                          const std::string &subPath);

            // "/API/User/" -> "api/user"
            static std::string normalizePrefix(const std::string &path);

        private:
            struct Entry
            {
                std::string prefix;
                std::vector<std::string> segments;
                std::shared_ptr<const ControllerDescriptor> descriptor;
            };

#pragma warning(push)
#pragma warning(disable: 4251)
            std::vector<Entry> entries_; // Sorted by segment count, then prefix length, descending
#pragma warning(pop)
        };

    } // namespace routing
} // namespace restgate
