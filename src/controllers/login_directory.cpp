#include "restgate/controllers/login_directory.hpp"

#include <algorithm>

namespace restgate
{
    namespace controllers
    {

        bool LoginDirectory::Account::hasRole(const std::string &role) const
        {
            return std::find(roles.begin(), roles.end(), role) != roles.end();
        }

        std::shared_ptr<LoginDirectory> LoginDirectory::fromTokens(const std::vector<TokenConfig> &tokens)
        {
            auto directory = std::make_shared<LoginDirectory>();
            for (const auto &token : tokens)
            {
                if (!token.password.empty() && !token.name.empty())
                {
                    directory->addAccount(token.name, token.password, token.token, token.roles);
                }
            }
            return directory;
        }

        void LoginDirectory::addAccount(const std::string &name, const std::string &password, const std::string &token,
                                        std::vector<std::string> roles)
        {
            Account account;
            account.name = name;
            account.token = token;
            account.roles = std::move(roles);
            accounts_[name] = std::make_pair(password, std::move(account));
        }

        std::optional<LoginDirectory::Account> LoginDirectory::login(const std::string &name,
                                                                     const std::string &password) const
        {
            auto it = accounts_.find(name);
            if (it == accounts_.end() || password.empty() || it->second.first != password)
            {
                return std::nullopt;
            }
            return it->second.second;
        }

    } // namespace controllers
} // namespace restgate
