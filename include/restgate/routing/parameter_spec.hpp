#pragma once

#include "../export.hpp"
#include "../http/file_validator.hpp"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace restgate
{
    namespace routing
    {

        // Where a declared parameter takes its value from
        enum class ParamSource
        {
            None, // Route parameter by name, then defaults
            Body,
            Header,
            Query,
            Form,
            File,
            RouteParam,
            RawContext
        };

        // Target type of a declared parameter
        enum class ParamType
        {
            String,
            Int,
            Long,
            Double,
            Bool,
            Uuid,
            Enum,
            Json,      // Any structured document
            Shape,     // Object with declared fields
            Bytes,     // Raw uploaded bytes
            FormFile,  // IFormFile handle
            FormField, // Decoded multipart part
            Context    // The request context itself
        };

        /**
         * @brief One field of a structured shape, bound case-insensitively
         */
        struct RESTGATE_SERVER_API ShapeField
        {
#pragma warning(push)
#pragma warning(disable: 4251)
            std::string name; // Canonical (camelCase) name
            ParamType type = ParamType::String;
            bool nullable = false;
            std::vector<std::string> enumValues;
#pragma warning(pop)

            ShapeField() = default;
            ShapeField(std::string fieldName, ParamType fieldType, bool isNullable = false)
                : name(std::move(fieldName)), type(fieldType), nullable(isNullable) {}
        };

        /**
         * @brief Declaration of one action parameter: name, source tag, target type and defaults
         *
         * Built with the fluent factories, e.g.
         * ParamSpec::query("page", ParamType::Int).withDefault(1).
         */
        struct RESTGATE_SERVER_API ParamSpec
        {
#pragma warning(push)
#pragma warning(disable: 4251)
            std::string name;
            ParamSource source = ParamSource::None;
            std::string sourceName; // Header/query/form/file name when it differs from name
            ParamType type = ParamType::String;
            bool nullable = false;
            std::optional<nlohmann::json> defaultValue;
            std::vector<std::string> enumValues;
            std::vector<ShapeField> shape;
            std::optional<http::FileValidationOptions> fileValidation;
#pragma warning(pop)

            static ParamSpec body(const std::string &name, ParamType type = ParamType::Json);
            static ParamSpec header(const std::string &name, ParamType type = ParamType::String,
                                    const std::string &headerName = "");
            static ParamSpec query(const std::string &name, ParamType type = ParamType::String,
                                   const std::string &queryName = "");
            static ParamSpec form(const std::string &name, ParamType type = ParamType::String,
                                  const std::string &fieldName = "");
            static ParamSpec file(const std::string &name, ParamType type = ParamType::FormFile,
                                  const std::string &fieldName = "");
            static ParamSpec route(const std::string &name, ParamType type = ParamType::String);
            static ParamSpec context(const std::string &name = "context");

            ParamSpec &withDefault(nlohmann::json value);
            ParamSpec &asNullable();
            ParamSpec &withEnum(std::vector<std::string> values);
            ParamSpec &withShape(std::vector<ShapeField> fields);
            ParamSpec &validatedBy(http::FileValidationOptions options);

            // sourceName when set, otherwise the parameter name
            const std::string &targetName() const { return sourceName.empty() ? name : sourceName; }
        };

    } // namespace routing
} // namespace restgate
