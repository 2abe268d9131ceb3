#pragma once

#include "../export.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace restgate
{
    namespace auth
    {

        /**
         * @brief Authenticated caller attached to the request context
         */
        struct RESTGATE_SERVER_API Identity
        {
#pragma warning(push)
#pragma warning(disable: 4251)
            std::string name;
            std::vector<std::string> roles;
            std::map<std::string, std::string> claims;
#pragma warning(pop)

            // Case-sensitive role membership
            bool hasRole(const std::string &role) const;
        };

        /**
         * @brief Authorization demanded by a controller or action
         */
        struct RESTGATE_SERVER_API AuthRequirement
        {
#pragma warning(push)
#pragma warning(disable: 4251)
            std::string scheme = "Bearer";
            std::vector<std::string> roles; // Any one suffices; empty means any authenticated caller
#pragma warning(pop)

            AuthRequirement() = default;
            explicit AuthRequirement(std::vector<std::string> requiredRoles, std::string authScheme = "Bearer")
                : scheme(std::move(authScheme)), roles(std::move(requiredRoles)) {}

            /**
             * @brief Requirement from a comma-separated role list, e.g. "Admin, Auditor"
             */
            static AuthRequirement fromRoles(const std::string &roleList);
        };

        /**
         * @brief Token verification capability; issuing tokens is out of scope
         */
        class RESTGATE_SERVER_API ITokenVerifier
        {
        public:
            virtual ~ITokenVerifier() = default;

            // Identity for a valid token, std::nullopt otherwise
            virtual std::optional<Identity> verify(const std::string &token) const = 0;
        };

        /**
         * @brief Fixed token table, loaded from configuration
         */
        class RESTGATE_SERVER_API StaticTokenVerifier : public ITokenVerifier
        {
        public:
            StaticTokenVerifier() = default;

            void addToken(const std::string &token, const Identity &identity);
            void removeToken(const std::string &token);
            size_t size() const;

            std::optional<Identity> verify(const std::string &token) const override;

        private:
            /**
             * @brief Constant-time comparison helper to mitigate timing attacks.
             */
            static bool constantTimeEqual(const std::string &a, const std::string &b);

#pragma warning(push)
#pragma warning(disable: 4251)
            mutable std::mutex mutex_;
            std::vector<std::pair<std::string, Identity>> tokens_;
#pragma warning(pop)
        };

    } // namespace auth
} // namespace restgate
