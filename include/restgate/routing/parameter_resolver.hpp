#pragma once

#include "../export.hpp"
#include "../http/http_request.hpp"
#include "../http/multipart_parser.hpp"
#include "arguments.hpp"
#include "controller.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace restgate
{
    namespace routing
    {

        /**
         * @brief Body decoded once per request and shared by every parameter
         */
        struct RESTGATE_SERVER_API RequestSnapshot
        {
#pragma warning(push)
#pragma warning(disable: 4251)
            std::string body;
            std::string contentType;
            bool isJsonRequest = false;
            std::optional<nlohmann::json> document;
            std::optional<CaseInsensitiveMap> formFields;
            std::optional<http::FormFieldMap> multipartFields;
#pragma warning(pop)

            /**
             * @brief Decode the already loaded body according to its content type
             *
             * JSON is parsed when the content type says so or the action has a body
             * parameter. Form data is decoded only for actions with form or file
             * parameters.
             * @throws ClientInputError on malformed JSON or multipart data
             */
            static RequestSnapshot build(const http::HttpRequest &request, const ActionDescriptor &action);
        };

        /**
         * @brief Binds declared action parameters to request data
         *
         * Per parameter: file part, form field, JSON body, header, query string,
         * request context, route parameter, then the declared default, the type's
         * zero value, or absent.
         */
        class RESTGATE_SERVER_API ParameterResolver
        {
        public:
            /**
             * @throws ClientInputError when a value is missing or does not convert
             */
            Arguments resolve(const ActionDescriptor &action, RequestContext &context,
                              const std::map<std::string, std::string> &routeParams) const;

            BoundValue resolveParameter(const ParamSpec &spec, RequestContext &context,
                                        const std::map<std::string, std::string> &routeParams,
                                        const RequestSnapshot &snapshot) const;

        private:
            BoundValue resolveFile(const ParamSpec &spec, const http::FormFieldMap &multipart) const;
            BoundValue resolveForm(const ParamSpec &spec, const RequestSnapshot &snapshot) const;
            BoundValue resolveBody(const ParamSpec &spec, const RequestSnapshot &snapshot) const;
            BoundValue resolveHeader(const ParamSpec &spec, const http::HttpRequest &request) const;
            BoundValue resolveQuery(const ParamSpec &spec, const http::HttpRequest &request) const;

            static BoundValue fileShape(const ParamSpec &spec, const http::FormField &field);
            static BoundValue formShape(const ParamSpec &spec, const RequestSnapshot &snapshot);

            // Declared default, else zero value for value-like types, else absent
            static BoundValue fallback(const ParamSpec &spec);

            static BoundValue fromText(const std::string &raw, const ParamSpec &spec, const std::string &label);

            // name, name with '_' as '-', name with '-' as '_', without duplicates
            static std::vector<std::string> nameVariants(const std::string &name);
        };

    } // namespace routing
} // namespace restgate
