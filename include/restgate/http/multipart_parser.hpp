#pragma once

#include "../export.hpp"
#include "../utils.hpp"

#include <map>
#include <optional>
#include <string>

namespace restgate
{
    namespace http
    {

        /**
         * @brief One named part of a form submission
         *
         * Text parts carry their value; file parts carry the raw bytes in data.
         */
        struct RESTGATE_SERVER_API FormField
        {
            std::string name;
            std::string value;
            std::optional<std::string> fileName;
            std::optional<std::string> contentType;
            std::string data;

            bool isFile() const { return fileName.has_value() && !fileName->empty(); }
        };

        using FormFieldMap = std::map<std::string, FormField, CaseInsensitiveLess>;

        /**
         * @brief Binary-safe multipart/form-data decoder
         */
        class RESTGATE_SERVER_API MultipartParser
        {
        public:
            /**
             * @brief Decode a multipart body into fields keyed by name (case-insensitive, last wins)
             * @param body Raw body bytes
             * @param contentType Content-Type header carrying the boundary parameter
             * @throws ClientInputError when the content type has no boundary
             */
            static FormFieldMap parse(const std::string &body, const std::string &contentType);

            /**
             * @brief Boundary token from a Content-Type value, quoted or bare
             * @throws ClientInputError when absent
             */
            static std::string extractBoundary(const std::string &contentType);

        private:
            static std::optional<FormField> parsePart(const std::string &part);
            static std::map<std::string, std::string> parseDispositionParams(const std::string &value);
        };

        /**
         * @brief Decode an application/x-www-form-urlencoded body
         *
         * Pairs that do not split into exactly one key and one value are ignored.
         */
        RESTGATE_SERVER_API CaseInsensitiveMap parse_urlencoded(const std::string &body);

    } // namespace http
} // namespace restgate
