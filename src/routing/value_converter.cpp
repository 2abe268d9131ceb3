#include "restgate/routing/value_converter.hpp"
#include "restgate/http/errors.hpp"
#include "restgate/utils.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>

namespace restgate
{
    namespace routing
    {

        namespace
        {
            bool parseInteger(const std::string &text, int64_t minValue, int64_t maxValue, int64_t &out)
            {
                std::string value = trim(text);
                if (value.empty())
                {
                    return false;
                }

                errno = 0;
                char *end = nullptr;
                long long parsed = std::strtoll(value.c_str(), &end, 10);
                if (errno == ERANGE || end != value.c_str() + value.size())
                {
                    return false;
                }
                if (parsed < minValue || parsed > maxValue)
                {
                    return false;
                }
                out = static_cast<int64_t>(parsed);
                return true;
            }

            bool parseDouble(const std::string &text, double &out)
            {
                std::string value = trim(text);
                if (value.empty())
                {
                    return false;
                }

                errno = 0;
                char *end = nullptr;
                double parsed = std::strtod(value.c_str(), &end);
                if (errno == ERANGE || end != value.c_str() + value.size() || !std::isfinite(parsed))
                {
                    return false;
                }
                out = parsed;
                return true;
            }

            // 8-4-4-4-12 hex, optionally braced, or 32 bare hex digits
            bool parseUuid(const std::string &text, std::string &out)
            {
                std::string value = trim(text);
                if (value.size() >= 2 && value.front() == '{' && value.back() == '}')
                {
                    value = value.substr(1, value.size() - 2);
                }

                std::string digits;
                if (value.size() == 36)
                {
                    for (size_t i = 0; i < value.size(); ++i)
                    {
                        const bool dash = (i == 8 || i == 13 || i == 18 || i == 23);
                        if (dash)
                        {
                            if (value[i] != '-')
                            {
                                return false;
                            }
                            continue;
                        }
                        digits += value[i];
                    }
                }
                else if (value.size() == 32)
                {
                    digits = value;
                }
                else
                {
                    return false;
                }

                for (char c : digits)
                {
                    if (!std::isxdigit(static_cast<unsigned char>(c)))
                    {
                        return false;
                    }
                }

                digits = to_lower(digits);
                out = digits.substr(0, 8) + "-" + digits.substr(8, 4) + "-" + digits.substr(12, 4) + "-" +
                      digits.substr(16, 4) + "-" + digits.substr(20, 12);
                return true;
            }

            bool parseEnum(const std::string &text, const std::vector<std::string> &enumValues, std::string &out)
            {
                std::string value = trim(text);
                for (const auto &candidate : enumValues)
                {
                    if (iequals(candidate, value))
                    {
                        out = candidate;
                        return true;
                    }
                }

                int64_t index = 0;
                if (!enumValues.empty() &&
                    parseInteger(value, 0, static_cast<int64_t>(enumValues.size()) - 1, index))
                {
                    out = enumValues[static_cast<size_t>(index)];
                    return true;
                }
                return false;
            }

            bool integerInRange(const nlohmann::json &value, int64_t minValue, int64_t maxValue, int64_t &out)
            {
                if (value.is_number_unsigned())
                {
                    uint64_t u = value.get<uint64_t>();
                    if (u > static_cast<uint64_t>(maxValue))
                    {
                        return false;
                    }
                    out = static_cast<int64_t>(u);
                    return true;
                }
                if (value.is_number_integer())
                {
                    int64_t v = value.get<int64_t>();
                    if (v < minValue || v > maxValue)
                    {
                        return false;
                    }
                    out = v;
                    return true;
                }
                return false;
            }

            const nlohmann::json *findField(const nlohmann::json &object, const std::string &name)
            {
                auto exact = object.find(name);
                if (exact != object.end())
                {
                    return &exact.value();
                }
                for (auto it = object.begin(); it != object.end(); ++it)
                {
                    if (iequals(it.key(), name))
                    {
                        return &it.value();
                    }
                }
                return nullptr;
            }
        } // namespace

        bool ValueConverter::tryParse(const std::string &raw, ParamType type, const std::vector<std::string> &enumValues,
                                      nlohmann::json &out)
        {
            switch (type)
            {
            case ParamType::String:
                out = raw;
                return true;
            case ParamType::Int:
            {
                int64_t v = 0;
                if (!parseInteger(raw, std::numeric_limits<int32_t>::min(), std::numeric_limits<int32_t>::max(), v))
                {
                    return false;
                }
                out = v;
                return true;
            }
            case ParamType::Long:
            {
                int64_t v = 0;
                if (!parseInteger(raw, std::numeric_limits<int64_t>::min(), std::numeric_limits<int64_t>::max(), v))
                {
                    return false;
                }
                out = v;
                return true;
            }
            case ParamType::Double:
            {
                double v = 0.0;
                if (!parseDouble(raw, v))
                {
                    return false;
                }
                out = v;
                return true;
            }
            case ParamType::Bool:
            {
                std::string value = trim(raw);
                if (iequals(value, "true") || value == "1")
                {
                    out = true;
                    return true;
                }
                if (iequals(value, "false") || value == "0")
                {
                    out = false;
                    return true;
                }
                return false;
            }
            case ParamType::Uuid:
            {
                std::string normalized;
                if (!parseUuid(raw, normalized))
                {
                    return false;
                }
                out = normalized;
                return true;
            }
            case ParamType::Enum:
            {
                std::string canonical;
                if (!parseEnum(raw, enumValues, canonical))
                {
                    return false;
                }
                out = canonical;
                return true;
            }
            case ParamType::Json:
            {
                nlohmann::json parsed = nlohmann::json::parse(raw, nullptr, false);
                out = parsed.is_discarded() ? nlohmann::json(raw) : parsed;
                return true;
            }
            default:
                return false;
            }
        }

        bool ValueConverter::coerce(const nlohmann::json &value, ParamType type, const std::vector<std::string> &enumValues,
                                    nlohmann::json &out)
        {
            switch (type)
            {
            case ParamType::String:
                if (!value.is_string())
                {
                    return false;
                }
                out = value;
                return true;
            case ParamType::Int:
            {
                int64_t v = 0;
                if (!integerInRange(value, std::numeric_limits<int32_t>::min(), std::numeric_limits<int32_t>::max(), v))
                {
                    return false;
                }
                out = v;
                return true;
            }
            case ParamType::Long:
            {
                int64_t v = 0;
                if (!integerInRange(value, std::numeric_limits<int64_t>::min(), std::numeric_limits<int64_t>::max(), v))
                {
                    return false;
                }
                out = v;
                return true;
            }
            case ParamType::Double:
                if (!value.is_number())
                {
                    return false;
                }
                out = value.get<double>();
                return true;
            case ParamType::Bool:
                if (!value.is_boolean())
                {
                    return false;
                }
                out = value;
                return true;
            case ParamType::Uuid:
                return value.is_string() && tryParse(value.get<std::string>(), ParamType::Uuid, enumValues, out);
            case ParamType::Enum:
                if (value.is_string())
                {
                    return tryParse(value.get<std::string>(), ParamType::Enum, enumValues, out);
                }
                if (value.is_number_integer())
                {
                    return tryParse(value.dump(), ParamType::Enum, enumValues, out);
                }
                return false;
            case ParamType::Json:
            case ParamType::Shape:
                out = value;
                return true;
            default:
                return false;
            }
        }

        nlohmann::json ValueConverter::convert(const std::string &raw, const ParamSpec &spec, const std::string &label)
        {
            const std::string failure = "Cannot convert " + label + " '" + spec.targetName() + "' value '" + raw +
                                        "' to type '" + typeName(spec.type) + "'";

            switch (spec.type)
            {
            case ParamType::Bytes:
            case ParamType::FormFile:
            case ParamType::FormField:
            case ParamType::Context:
                throw http::ClientInputError(failure);
            default:
                break;
            }

            if (spec.type == ParamType::String)
            {
                if (raw.empty() && spec.nullable)
                {
                    return nullptr;
                }
                return raw;
            }

            if (trim(raw).empty())
            {
                if (spec.nullable || !isValueLike(spec.type))
                {
                    return nullptr;
                }
                return zeroValue(spec.type, spec.enumValues);
            }

            if (spec.type == ParamType::Shape)
            {
                nlohmann::json parsed = nlohmann::json::parse(raw, nullptr, false);
                if (parsed.is_discarded())
                {
                    throw http::ClientInputError(failure);
                }
                return bindShape(parsed, spec.shape, spec.name);
            }

            nlohmann::json out;

            // Structured text is tried as a document first, then as plain text
            if (looksLikeDocument(raw))
            {
                nlohmann::json parsed = nlohmann::json::parse(raw, nullptr, false);
                if (!parsed.is_discarded() && coerce(parsed, spec.type, spec.enumValues, out))
                {
                    return out;
                }
            }

            if (!tryParse(raw, spec.type, spec.enumValues, out))
            {
                throw http::ClientInputError(failure);
            }
            return out;
        }

        nlohmann::json ValueConverter::fromDocument(const nlohmann::json &document, const ParamSpec &spec)
        {
            if (spec.type == ParamType::Shape)
            {
                return bindShape(document, spec.shape, spec.name);
            }

            nlohmann::json out;
            if (!coerce(document, spec.type, spec.enumValues, out))
            {
                throw http::ClientInputError("Invalid JSON format for parameter '" + spec.name + "': expected " +
                                             typeName(spec.type));
            }
            return out;
        }

        nlohmann::json ValueConverter::bindShape(const nlohmann::json &source, const std::vector<ShapeField> &shape,
                                                 const std::string &paramName)
        {
            if (!source.is_object())
            {
                throw http::ClientInputError("Invalid JSON format for parameter '" + paramName +
                                             "': expected an object");
            }
            if (shape.empty())
            {
                return source;
            }

            nlohmann::json bound = nlohmann::json::object();
            for (const auto &field : shape)
            {
                const nlohmann::json *value = findField(source, field.name);

                if (!value)
                {
                    bound[field.name] = field.nullable ? nlohmann::json(nullptr) : zeroValue(field.type, field.enumValues);
                    continue;
                }

                if (value->is_null())
                {
                    if (!field.nullable && isValueLike(field.type))
                    {
                        throw http::ClientInputError("Invalid JSON format for parameter '" + paramName + "': field '" +
                                                     field.name + "' cannot be null");
                    }
                    bound[field.name] = nullptr;
                    continue;
                }

                nlohmann::json converted;
                if (!coerce(*value, field.type, field.enumValues, converted))
                {
                    throw http::ClientInputError("Invalid JSON format for parameter '" + paramName + "': field '" +
                                                 field.name + "' expects " + typeName(field.type));
                }
                bound[field.name] = std::move(converted);
            }
            return bound;
        }

        nlohmann::json ValueConverter::zeroValue(ParamType type, const std::vector<std::string> &enumValues)
        {
            switch (type)
            {
            case ParamType::Int:
            case ParamType::Long:
                return 0;
            case ParamType::Double:
                return 0.0;
            case ParamType::Bool:
                return false;
            case ParamType::Uuid:
                return "00000000-0000-0000-0000-000000000000";
            case ParamType::Enum:
                return enumValues.empty() ? nlohmann::json(nullptr) : nlohmann::json(enumValues.front());
            default:
                return nullptr;
            }
        }

        bool ValueConverter::isValueLike(ParamType type)
        {
            switch (type)
            {
            case ParamType::Int:
            case ParamType::Long:
            case ParamType::Double:
            case ParamType::Bool:
            case ParamType::Uuid:
            case ParamType::Enum:
                return true;
            default:
                return false;
            }
        }

        std::string ValueConverter::typeName(ParamType type)
        {
            switch (type)
            {
            case ParamType::String:
                return "string";
            case ParamType::Int:
                return "int";
            case ParamType::Long:
                return "long";
            case ParamType::Double:
                return "double";
            case ParamType::Bool:
                return "bool";
            case ParamType::Uuid:
                return "uuid";
            case ParamType::Enum:
                return "enum";
            case ParamType::Json:
                return "json";
            case ParamType::Shape:
                return "object";
            case ParamType::Bytes:
                return "bytes";
            case ParamType::FormFile:
                return "file";
            case ParamType::FormField:
                return "form field";
            case ParamType::Context:
                return "context";
            }
            return "unknown";
        }

        bool ValueConverter::looksLikeDocument(const std::string &raw)
        {
            std::string value = trim(raw);
            if (value.size() < 2)
            {
                return false;
            }
            return (value.front() == '{' && value.back() == '}') || (value.front() == '[' && value.back() == ']');
        }

    } // namespace routing
} // namespace restgate
