#include "restgate/auth/token_verifier.hpp"
#include "restgate/logger.hpp"
#include "restgate/utils.hpp"

#include <algorithm>

namespace restgate
{
    namespace auth
    {

        bool Identity::hasRole(const std::string &role) const
        {
            return std::find(roles.begin(), roles.end(), role) != roles.end();
        }

        AuthRequirement AuthRequirement::fromRoles(const std::string &roleList)
        {
            AuthRequirement requirement;
            for (const auto &role : split(roleList, ',', true))
            {
                std::string trimmed = trim(role);
                if (!trimmed.empty())
                {
                    requirement.roles.push_back(trimmed);
                }
            }
            return requirement;
        }

        void StaticTokenVerifier::addToken(const std::string &token, const Identity &identity)
        {
            if (token.empty())
            {
                return;
            }

            std::lock_guard<std::mutex> lock(mutex_);
            for (auto &entry : tokens_)
            {
                if (entry.first == token)
                {
                    entry.second = identity;
                    return;
                }
            }
            tokens_.emplace_back(token, identity);
            ServerLogger::logDebug("Token registered for %s (total: %zu)", identity.name.c_str(), tokens_.size());
        }

        void StaticTokenVerifier::removeToken(const std::string &token)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tokens_.erase(std::remove_if(tokens_.begin(), tokens_.end(),
                                         [&](const std::pair<std::string, Identity> &entry)
                                         { return entry.first == token; }),
                          tokens_.end());
        }

        size_t StaticTokenVerifier::size() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return tokens_.size();
        }

        std::optional<Identity> StaticTokenVerifier::verify(const std::string &token) const
        {
            if (token.empty())
            {
                return std::nullopt;
            }

            std::lock_guard<std::mutex> lock(mutex_);
            std::optional<Identity> match;
            // Scan every entry so timing does not reveal the position of a match
            for (const auto &entry : tokens_)
            {
                if (constantTimeEqual(entry.first, token) && !match)
                {
                    match = entry.second;
                }
            }
            return match;
        }

        bool StaticTokenVerifier::constantTimeEqual(const std::string &a, const std::string &b)
        {
            if (a.size() != b.size())
            {
                return false;
            }
            unsigned char diff = 0;
            for (size_t i = 0; i < a.size(); ++i)
            {
                diff |= static_cast<unsigned char>(a[i] ^ b[i]);
            }
            return diff == 0;
        }

    } // namespace auth
} // namespace restgate
