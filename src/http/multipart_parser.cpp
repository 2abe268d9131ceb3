#include "restgate/http/multipart_parser.hpp"
#include "restgate/http/errors.hpp"
#include "restgate/logger.hpp"

#include <vector>

namespace restgate
{
    namespace http
    {

        std::string MultipartParser::extractBoundary(const std::string &contentType)
        {
            std::string lower = to_lower(contentType);
            size_t pos = lower.find("boundary=");
            if (pos == std::string::npos)
            {
                throw ClientInputError("No boundary found in Content-Type");
            }

            std::string rest = contentType.substr(pos + 9);
            std::string boundary;
            if (!rest.empty() && rest.front() == '"')
            {
                size_t close = rest.find('"', 1);
                boundary = rest.substr(1, close == std::string::npos ? std::string::npos : close - 1);
            }
            else
            {
                size_t end = rest.find_first_of("; \t");
                boundary = rest.substr(0, end);
            }

            boundary = trim(boundary, " \t\"");
            if (boundary.empty())
            {
                throw ClientInputError("No boundary found in Content-Type");
            }
            return boundary;
        }

        FormFieldMap MultipartParser::parse(const std::string &body, const std::string &contentType)
        {
            const std::string delimiter = "--" + extractBoundary(contentType);
            FormFieldMap fields;

            size_t pos = body.find(delimiter);
            if (pos == std::string::npos)
            {
                ServerLogger::logDebug("Multipart body contains no boundary delimiter");
                return fields;
            }

            while (true)
            {
                pos += delimiter.size();

                // Terminal marker
                if (body.compare(pos, 2, "--") == 0)
                {
                    break;
                }

                // Skip transport padding and the line break after the delimiter
                while (pos < body.size() && (body[pos] == ' ' || body[pos] == '\t'))
                {
                    ++pos;
                }
                if (body.compare(pos, 2, "\r\n") == 0)
                {
                    pos += 2;
                }
                else if (pos < body.size() && body[pos] == '\n')
                {
                    pos += 1;
                }

                size_t next = body.find(delimiter, pos);
                if (next == std::string::npos)
                {
                    ServerLogger::logWarning("Multipart body ended without a closing boundary");
                    break;
                }

                auto field = parsePart(body.substr(pos, next - pos));
                if (field && !field->name.empty())
                {
                    std::string name = field->name;
                    fields[name] = std::move(*field);
                }

                pos = next;
            }

            return fields;
        }

        std::optional<FormField> MultipartParser::parsePart(const std::string &part)
        {
            size_t crlf = part.find("\r\n\r\n");
            size_t lf = part.find("\n\n");

            size_t headerEnd = std::string::npos;
            size_t separatorLength = 0;
            if (crlf != std::string::npos && (lf == std::string::npos || crlf <= lf))
            {
                headerEnd = crlf;
                separatorLength = 4;
            }
            else if (lf != std::string::npos)
            {
                headerEnd = lf;
                separatorLength = 2;
            }

            if (headerEnd == std::string::npos)
            {
                return std::nullopt;
            }

            FormField field;
            for (auto line : split(part.substr(0, headerEnd), '\n'))
            {
                line = trim(line, "\r");
                size_t colon = line.find(':');
                if (colon == std::string::npos)
                {
                    continue;
                }

                std::string name = trim(line.substr(0, colon));
                std::string value = trim(line.substr(colon + 1));

                if (iequals(name, "Content-Disposition"))
                {
                    auto params = parseDispositionParams(value);
                    auto nameIt = params.find("name");
                    if (nameIt != params.end())
                    {
                        field.name = nameIt->second;
                    }
                    auto fileIt = params.find("filename");
                    if (fileIt != params.end())
                    {
                        field.fileName = fileIt->second;
                    }
                }
                else if (iequals(name, "Content-Type"))
                {
                    field.contentType = value;
                }
            }

            std::string payload = part.substr(headerEnd + separatorLength);

            // The line break before the next delimiter belongs to the delimiter
            if (payload.size() >= 2 && payload.compare(payload.size() - 2, 2, "\r\n") == 0)
            {
                payload.erase(payload.size() - 2);
            }
            else if (!payload.empty() && payload.back() == '\n')
            {
                payload.pop_back();
            }

            if (field.isFile())
            {
                field.data = std::move(payload);
            }
            else
            {
                field.value = std::move(payload);
            }
            return field;
        }

        std::map<std::string, std::string> MultipartParser::parseDispositionParams(const std::string &value)
        {
            std::map<std::string, std::string> params;
            size_t pos = value.find(';');
            while (pos != std::string::npos && pos < value.size())
            {
                ++pos;
                size_t eq = value.find('=', pos);
                if (eq == std::string::npos)
                {
                    break;
                }

                std::string key = to_lower(trim(value.substr(pos, eq - pos)));
                size_t valueStart = eq + 1;
                while (valueStart < value.size() && (value[valueStart] == ' ' || value[valueStart] == '\t'))
                {
                    ++valueStart;
                }

                std::string paramValue;
                if (valueStart < value.size() && value[valueStart] == '"')
                {
                    size_t close = value.find('"', valueStart + 1);
                    paramValue = value.substr(valueStart + 1,
                                              close == std::string::npos ? std::string::npos : close - valueStart - 1);
                    pos = close == std::string::npos ? std::string::npos : value.find(';', close);
                }
                else
                {
                    size_t end = value.find(';', valueStart);
                    paramValue = trim(value.substr(valueStart, end == std::string::npos ? std::string::npos : end - valueStart));
                    pos = end;
                }

                params[key] = paramValue;
            }
            return params;
        }

        CaseInsensitiveMap parse_urlencoded(const std::string &body)
        {
            CaseInsensitiveMap result;
            for (const auto &pair : split(body, '&'))
            {
                auto keyValue = split(pair, '=');
                if (keyValue.size() == 2)
                {
                    result[url_decode(keyValue[0])] = url_decode(keyValue[1]);
                }
            }
            return result;
        }

    } // namespace http
} // namespace restgate
