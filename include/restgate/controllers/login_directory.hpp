#pragma once

#include "../export.hpp"
#include "../server_config.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace restgate
{
    namespace controllers
    {

        /**
         * @brief Name/password table backing the sample login actions
         *
         * Logging in hands back a token that the configured verifier already
         * accepts; nothing is issued here.
         */
        class RESTGATE_SERVER_API LoginDirectory
        {
        public:
            struct Account
            {
                std::string name;
                std::string token;
                std::vector<std::string> roles;

                bool hasRole(const std::string &role) const;
            };

            LoginDirectory() = default;

            // Accounts from token entries that carry a password
            static std::shared_ptr<LoginDirectory> fromTokens(const std::vector<TokenConfig> &tokens);

            void addAccount(const std::string &name, const std::string &password, const std::string &token,
                            std::vector<std::string> roles = {});

            std::optional<Account> login(const std::string &name, const std::string &password) const;

            size_t size() const { return accounts_.size(); }

        private:
#pragma warning(push)
#pragma warning(disable: 4251)
            std::map<std::string, std::pair<std::string, Account>> accounts_;
#pragma warning(pop)
        };

    } // namespace controllers
} // namespace restgate
