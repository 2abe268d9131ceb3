#include "restgate/routing/parameter_resolver.hpp"
#include "restgate/http/errors.hpp"
#include "restgate/http/file_validator.hpp"
#include "restgate/http/form_file.hpp"
#include "restgate/logger.hpp"
#include "restgate/routing/value_converter.hpp"
#include "restgate/utils.hpp"

#include <algorithm>
#include <cstdint>
#include <initializer_list>

namespace restgate
{
    namespace routing
    {

        namespace
        {
            BoundValue document(nlohmann::json value)
            {
                return BoundValue(std::in_place_type<nlohmann::json>, std::move(value));
            }
        } // namespace

        RequestSnapshot RequestSnapshot::build(const http::HttpRequest &request, const ActionDescriptor &action)
        {
            RequestSnapshot snapshot;
            snapshot.body = request.body();
            snapshot.contentType = request.contentType();
            snapshot.isJsonRequest = icontains(snapshot.contentType, "application/json") ||
                                     action.hasParamFrom(ParamSource::Body);

            if (trim(snapshot.body).empty())
            {
                return snapshot;
            }

            if (snapshot.isJsonRequest)
            {
                try
                {
                    snapshot.document = nlohmann::json::parse(snapshot.body);
                }
                catch (const nlohmann::json::parse_error &ex)
                {
                    ServerLogger::logWarning("Error parsing JSON body for %s %s: %s",
                                             request.method.c_str(), request.path.c_str(), ex.what());
                    throw http::ClientInputError(std::string("Invalid JSON format: ") + ex.what());
                }
                return snapshot;
            }

            if (!action.hasParamFrom(ParamSource::Form) && !action.hasParamFrom(ParamSource::File))
            {
                return snapshot;
            }

            if (icontains(snapshot.contentType, "multipart/form-data"))
            {
                snapshot.multipartFields = http::MultipartParser::parse(snapshot.body, snapshot.contentType);

                CaseInsensitiveMap fields;
                for (const auto &entry : *snapshot.multipartFields)
                {
                    if (!entry.second.isFile())
                    {
                        fields[entry.second.name] = entry.second.value;
                    }
                }
                snapshot.formFields = std::move(fields);
            }
            else if (icontains(snapshot.contentType, "application/x-www-form-urlencoded"))
            {
                snapshot.formFields = http::parse_urlencoded(snapshot.body);
            }

            return snapshot;
        }

        Arguments ParameterResolver::resolve(const ActionDescriptor &action, RequestContext &context,
                                             const std::map<std::string, std::string> &routeParams) const
        {
            RequestSnapshot snapshot = RequestSnapshot::build(context.request(), action);

            Arguments arguments;
            for (const auto &spec : action.params)
            {
                try
                {
                    arguments.add(spec.name, resolveParameter(spec, context, routeParams, snapshot));
                }
                catch (const http::ClientInputError &ex)
                {
                    ServerLogger::logWarning("Error resolving parameter '%s': %s", spec.name.c_str(), ex.what());
                    throw;
                }
            }
            return arguments;
        }

        BoundValue ParameterResolver::resolveParameter(const ParamSpec &spec, RequestContext &context,
                                                       const std::map<std::string, std::string> &routeParams,
                                                       const RequestSnapshot &snapshot) const
        {
            if (spec.source == ParamSource::File && snapshot.multipartFields)
            {
                return resolveFile(spec, *snapshot.multipartFields);
            }

            if (spec.source == ParamSource::Form && !snapshot.isJsonRequest &&
                (snapshot.formFields || snapshot.multipartFields))
            {
                return resolveForm(spec, snapshot);
            }

            switch (spec.source)
            {
            case ParamSource::Body:
                return resolveBody(spec, snapshot);
            case ParamSource::Header:
                return resolveHeader(spec, context.request());
            case ParamSource::Query:
                return resolveQuery(spec, context.request());
            default:
                break;
            }

            if (spec.source == ParamSource::RawContext || spec.type == ParamType::Context)
            {
                return BoundValue(std::in_place_type<RequestContext *>, &context);
            }

            auto route = routeParams.find(to_lower(spec.targetName()));
            if (route != routeParams.end())
            {
                return fromText(route->second, spec, "route parameter");
            }

            return fallback(spec);
        }

        BoundValue ParameterResolver::resolveFile(const ParamSpec &spec, const http::FormFieldMap &multipart) const
        {
            const std::string &fieldName = spec.targetName();

            auto it = multipart.find(fieldName);
            if (it == multipart.end() || !it->second.isFile())
            {
                return fallback(spec);
            }

            const http::FormField &field = it->second;
            std::shared_ptr<http::FormFile> file = http::FormFile::fromField(field);

            if (spec.fileValidation)
            {
                http::FileValidator validator(*spec.fileValidation);
                http::FileValidationResult result = validator.validate(*file);

                for (const auto &warning : result.warnings)
                {
                    ServerLogger::logWarning("Upload '%s' (%s): %s", fieldName.c_str(), file->fileName().c_str(),
                                             warning.c_str());
                }
                if (!result.isValid())
                {
                    throw http::ClientInputError("File validation failed for '" + fieldName + "': " +
                                                 join(result.errors, "; "));
                }
            }

            switch (spec.type)
            {
            case ParamType::FormFile:
                return BoundValue(std::in_place_type<std::shared_ptr<http::IFormFile>>, file);
            case ParamType::Bytes:
                return BoundValue(std::in_place_type<ByteArray>, ByteArray{field.data});
            case ParamType::String:
                return document(field.fileName.value_or(""));
            case ParamType::Shape:
            case ParamType::Json:
                return fileShape(spec, field);
            default:
                return BoundValue(std::in_place_type<http::FormField>, field);
            }
        }

        BoundValue ParameterResolver::resolveForm(const ParamSpec &spec, const RequestSnapshot &snapshot) const
        {
            const std::string &fieldName = spec.targetName();

            if (snapshot.formFields)
            {
                auto it = snapshot.formFields->find(fieldName);
                if (it != snapshot.formFields->end())
                {
                    return fromText(it->second, spec, "form field");
                }
            }

            if (snapshot.multipartFields)
            {
                auto it = snapshot.multipartFields->find(fieldName);
                if (it != snapshot.multipartFields->end() && !it->second.isFile())
                {
                    return fromText(it->second.value, spec, "form field");
                }
            }

            if (spec.type == ParamType::Shape)
            {
                return formShape(spec, snapshot);
            }

            return fallback(spec);
        }

        BoundValue ParameterResolver::resolveBody(const ParamSpec &spec, const RequestSnapshot &snapshot) const
        {
            if (!snapshot.document || snapshot.document->is_null())
            {
                if (!snapshot.document && !trim(snapshot.body).empty())
                {
                    throw http::ClientInputError("FromBody parameter '" + spec.name + "' requires valid JSON content");
                }
                if (spec.defaultValue)
                {
                    return document(*spec.defaultValue);
                }
                if (spec.nullable)
                {
                    return document(nullptr);
                }
                throw http::ClientInputError("FromBody parameter '" + spec.name + "' is required");
            }

            if (spec.type == ParamType::Json)
            {
                return document(*snapshot.document);
            }
            return document(ValueConverter::fromDocument(*snapshot.document, spec));
        }

        BoundValue ParameterResolver::resolveHeader(const ParamSpec &spec, const http::HttpRequest &request) const
        {
            std::vector<std::string> names = nameVariants(spec.targetName());

            for (const auto &name : names)
            {
                std::string value = request.header(name);
                if (!value.empty())
                {
                    return fromText(value, spec, "header");
                }
            }

            if (spec.defaultValue)
            {
                return document(*spec.defaultValue);
            }
            throw http::ClientInputError("Missing required header. Tried: " + join(names, ", "));
        }

        BoundValue ParameterResolver::resolveQuery(const ParamSpec &spec, const http::HttpRequest &request) const
        {
            for (const auto &name : nameVariants(spec.targetName()))
            {
                std::optional<std::string> value = request.queryValue(name);
                if (value && !value->empty())
                {
                    return fromText(*value, spec, "query parameter");
                }
            }

            return fallback(spec);
        }

        BoundValue ParameterResolver::fileShape(const ParamSpec &spec, const http::FormField &field)
        {
            const nlohmann::json contentType = field.contentType ? nlohmann::json(*field.contentType) : nlohmann::json(nullptr);
            const int64_t size = static_cast<int64_t>(field.data.size());

            nlohmann::json shaped = nlohmann::json::object();
            if (spec.shape.empty())
            {
                shaped["fileName"] = field.fileName.value_or("");
                shaped["contentType"] = contentType;
                shaped["data"] = field.data;
                shaped["length"] = size;
                return document(std::move(shaped));
            }

            for (const auto &member : spec.shape)
            {
                const std::string key = to_lower(member.name);
                if (key == "filename")
                {
                    shaped[member.name] = field.fileName.value_or("");
                }
                else if (key == "contenttype")
                {
                    shaped[member.name] = contentType;
                }
                else if ((key == "data" || key == "content" || key == "filedata") &&
                         (member.type == ParamType::Bytes || member.type == ParamType::String))
                {
                    shaped[member.name] = field.data;
                }
                else if ((key == "size" || key == "length") &&
                         (member.type == ParamType::Int || member.type == ParamType::Long))
                {
                    shaped[member.name] = size;
                }
                else
                {
                    shaped[member.name] = ValueConverter::zeroValue(member.type, member.enumValues);
                }
            }
            return document(std::move(shaped));
        }

        BoundValue ParameterResolver::formShape(const ParamSpec &spec, const RequestSnapshot &snapshot)
        {
            nlohmann::json shaped = nlohmann::json::object();

            for (const auto &member : spec.shape)
            {
                const std::string key = spec.sourceName.empty() ? member.name : spec.sourceName + "." + member.name;

                std::optional<std::string> raw;
                if (snapshot.formFields)
                {
                    auto it = snapshot.formFields->find(key);
                    if (it != snapshot.formFields->end())
                    {
                        raw = it->second;
                    }
                }
                if (!raw && snapshot.multipartFields)
                {
                    auto it = snapshot.multipartFields->find(key);
                    if (it != snapshot.multipartFields->end() && !it->second.isFile())
                    {
                        raw = it->second.value;
                    }
                }

                nlohmann::json value = member.nullable ? nlohmann::json(nullptr)
                                                       : ValueConverter::zeroValue(member.type, member.enumValues);
                if (raw)
                {
                    nlohmann::json converted;
                    if (ValueConverter::tryParse(*raw, member.type, member.enumValues, converted))
                    {
                        value = std::move(converted);
                    }
                    else
                    {
                        ServerLogger::logWarning("Error converting form field '%s': value '%s' is not a valid %s",
                                                 key.c_str(), raw->c_str(),
                                                 ValueConverter::typeName(member.type).c_str());
                    }
                }
                shaped[member.name] = std::move(value);
            }

            return document(std::move(shaped));
        }

        BoundValue ParameterResolver::fallback(const ParamSpec &spec)
        {
            if (spec.defaultValue)
            {
                return document(*spec.defaultValue);
            }
            if (!spec.nullable && ValueConverter::isValueLike(spec.type))
            {
                return document(ValueConverter::zeroValue(spec.type, spec.enumValues));
            }
            return BoundValue();
        }

        BoundValue ParameterResolver::fromText(const std::string &raw, const ParamSpec &spec, const std::string &label)
        {
            if (spec.type == ParamType::Bytes)
            {
                return BoundValue(std::in_place_type<ByteArray>, ByteArray{raw});
            }
            return document(ValueConverter::convert(raw, spec, label));
        }

        std::vector<std::string> ParameterResolver::nameVariants(const std::string &name)
        {
            std::vector<std::string> names{name};

            std::string dashed = name;
            std::replace(dashed.begin(), dashed.end(), '_', '-');
            std::string underscored = name;
            std::replace(underscored.begin(), underscored.end(), '-', '_');

            for (const auto &candidate : {dashed, underscored})
            {
                if (std::find(names.begin(), names.end(), candidate) == names.end())
                {
                    names.push_back(candidate);
                }
            }
            return names;
        }

    } // namespace routing
} // namespace restgate
