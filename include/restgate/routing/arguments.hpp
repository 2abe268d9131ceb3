#pragma once

#include "../export.hpp"
#include "../auth/token_verifier.hpp"
#include "../http/form_file.hpp"
#include "../http/http_request.hpp"
#include "../http/multipart_parser.hpp"

#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace restgate
{
    namespace routing
    {

        /**
         * @brief Request-scoped state handed to every action
         */
        class RESTGATE_SERVER_API RequestContext
        {
        public:
            explicit RequestContext(http::HttpRequest &request) : request_(request) {}

            http::HttpRequest &request() { return request_; }
            const http::HttpRequest &request() const { return request_; }
            const std::string &clientIP() const { return request_.clientIP; }

            const std::optional<auth::Identity> &user() const { return user_; }
            void setUser(auth::Identity identity) { user_ = std::move(identity); }
            bool isAuthenticated() const { return user_.has_value(); }
            bool isInRole(const std::string &role) const { return user_ && user_->hasRole(role); }

            // Lowercased placeholder name -> captured segment text
            const std::map<std::string, std::string> &routeParams() const { return routeParams_; }
            void setRouteParams(std::map<std::string, std::string> params) { routeParams_ = std::move(params); }

        private:
            http::HttpRequest &request_;
#pragma warning(push)
#pragma warning(disable: 4251)
            std::optional<auth::Identity> user_;
            std::map<std::string, std::string> routeParams_;
#pragma warning(pop)
        };

        // Raw uploaded bytes
        struct ByteArray
        {
            std::string data;
        };

        /**
         * @brief A resolved argument; std::monostate means absent
         */
        using BoundValue = std::variant<std::monostate, nlohmann::json, ByteArray,
                                        std::shared_ptr<http::IFormFile>, http::FormField, RequestContext *>;

        /**
         * @brief Ordered, named argument list produced by the parameter resolver
         */
        class RESTGATE_SERVER_API Arguments
        {
        public:
            void add(const std::string &name, BoundValue value);

            size_t size() const { return values_.size(); }
            const std::string &nameAt(size_t index) const { return values_.at(index).first; }
            const BoundValue &at(size_t index) const { return values_.at(index).second; }

            /**
             * @brief Bound value by parameter name
             * @throws std::out_of_range when no such parameter was declared
             */
            const BoundValue &value(const std::string &name) const;

            // Declared and not absent
            bool has(const std::string &name) const;

            // Structured value, or a null document when the argument is absent or not structured
            const nlohmann::json &json(const std::string &name) const;

            template <typename T>
            T get(const std::string &name) const
            {
                const nlohmann::json &v = json(name);
                if (v.is_null())
                {
                    throw std::out_of_range("Argument '" + name + "' has no value");
                }
                return v.get<T>();
            }

            template <typename T>
            T getOr(const std::string &name, T fallback) const
            {
                const nlohmann::json &v = json(name);
                return v.is_null() ? fallback : v.get<T>();
            }

            std::shared_ptr<http::IFormFile> file(const std::string &name) const;
            const http::FormField *field(const std::string &name) const;
            const std::string *bytes(const std::string &name) const;
            RequestContext *context(const std::string &name) const;

        private:
            const BoundValue *find(const std::string &name) const;

#pragma warning(push)
#pragma warning(disable: 4251)
            std::vector<std::pair<std::string, BoundValue>> values_;
#pragma warning(pop)
        };

    } // namespace routing
} // namespace restgate
