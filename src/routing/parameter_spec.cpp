#include "restgate/routing/parameter_spec.hpp"

namespace restgate
{
    namespace routing
    {

        namespace
        {
            ParamSpec make(const std::string &name, ParamSource source, ParamType type, const std::string &sourceName)
            {
                ParamSpec spec;
                spec.name = name;
                spec.source = source;
                spec.type = type;
                spec.sourceName = sourceName;
                return spec;
            }
        } // namespace

        ParamSpec ParamSpec::body(const std::string &name, ParamType type)
        {
            return make(name, ParamSource::Body, type, "");
        }

        ParamSpec ParamSpec::header(const std::string &name, ParamType type, const std::string &headerName)
        {
            return make(name, ParamSource::Header, type, headerName);
        }

        ParamSpec ParamSpec::query(const std::string &name, ParamType type, const std::string &queryName)
        {
            return make(name, ParamSource::Query, type, queryName);
        }

        ParamSpec ParamSpec::form(const std::string &name, ParamType type, const std::string &fieldName)
        {
            return make(name, ParamSource::Form, type, fieldName);
        }

        ParamSpec ParamSpec::file(const std::string &name, ParamType type, const std::string &fieldName)
        {
            return make(name, ParamSource::File, type, fieldName);
        }

        ParamSpec ParamSpec::route(const std::string &name, ParamType type)
        {
            return make(name, ParamSource::RouteParam, type, "");
        }

        ParamSpec ParamSpec::context(const std::string &name)
        {
            return make(name, ParamSource::RawContext, ParamType::Context, "");
        }

        ParamSpec &ParamSpec::withDefault(nlohmann::json value)
        {
            defaultValue = std::move(value);
            return *this;
        }

        ParamSpec &ParamSpec::asNullable()
        {
            nullable = true;
            return *this;
        }

        ParamSpec &ParamSpec::withEnum(std::vector<std::string> values)
        {
            type = ParamType::Enum;
            enumValues = std::move(values);
            return *this;
        }

        ParamSpec &ParamSpec::withShape(std::vector<ShapeField> fields)
        {
            type = ParamType::Shape;
            shape = std::move(fields);
            return *this;
        }

        ParamSpec &ParamSpec::validatedBy(http::FileValidationOptions options)
        {
            fileValidation = std::move(options);
            return *this;
        }

    } // namespace routing
} // namespace restgate
