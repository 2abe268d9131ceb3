#pragma once

#include "../export.hpp"
#include "parameter_spec.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace restgate
{
    namespace routing
    {

        /**
         * @brief Text and document conversion into declared parameter types
         *
         * Converted values are carried as nlohmann::json: integers and doubles as
         * numbers, UUIDs as normalized lowercase strings, enumerations as their
         * canonical names.
         */
        class RESTGATE_SERVER_API ValueConverter
        {
        public:
            /**
             * @brief Convert raw request text (header, query, form or route value)
             * @param label What the value is, e.g. "query parameter", used in error messages
             * @throws ClientInputError naming parameter, value and target type
             */
            static nlohmann::json convert(const std::string &raw, const ParamSpec &spec, const std::string &label);

            /**
             * @brief Convert an already parsed document to the declared type
             * @throws ClientInputError when the document does not fit
             */
            static nlohmann::json fromDocument(const nlohmann::json &document, const ParamSpec &spec);

            /**
             * @brief Bind an object field by field, case-insensitively, onto camelCase names
             *
             * Missing fields take their zero value (or null when nullable).
             * @throws ClientInputError for a non-object source or a field of the wrong type
             */
            static nlohmann::json bindShape(const nlohmann::json &source, const std::vector<ShapeField> &shape,
                                            const std::string &paramName);

            // Parse text as one of the scalar types; false when it does not convert
            static bool tryParse(const std::string &raw, ParamType type, const std::vector<std::string> &enumValues,
                                 nlohmann::json &out);

            // Enumerations default to their first canonical name
            static nlohmann::json zeroValue(ParamType type, const std::vector<std::string> &enumValues = {});

            // Value-like types have a zero value instead of being absent
            static bool isValueLike(ParamType type);

            static std::string typeName(ParamType type);

            // "{...}" or "[...]" after trimming
            static bool looksLikeDocument(const std::string &raw);

        private:
            static bool coerce(const nlohmann::json &value, ParamType type, const std::vector<std::string> &enumValues,
                               nlohmann::json &out);
        };

    } // namespace routing
} // namespace restgate
