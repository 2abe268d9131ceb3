#pragma once

#include "../export.hpp"
#include "form_file.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace restgate
{
    namespace http
    {

        struct RESTGATE_SERVER_API FileValidationOptions
        {
#pragma warning(push)
#pragma warning(disable: 4251)
            int64_t maxFileSize = 10 * 1024 * 1024;
            std::vector<std::string> allowedExtensions; // Lowercase, with leading dot; empty allows any
            std::vector<std::string> allowedMimeTypes;  // Empty allows any
            std::vector<std::string> prohibitedExtensions = {".exe", ".bat", ".cmd", ".com", ".pif", ".scr", ".vbs", ".js"};
#pragma warning(pop)
            bool validateContent = true;

            /**
             * @brief Build options from comma-separated lists, e.g. ".pdf, .png"
             */
            static FileValidationOptions fromLists(int64_t maxFileSize,
                                                   const std::string &allowedExtensions,
                                                   const std::string &allowedMimeTypes,
                                                   bool validateContent = true);
        };

        struct RESTGATE_SERVER_API FileValidationResult
        {
#pragma warning(push)
#pragma warning(disable: 4251)
            std::vector<std::string> errors;
            std::vector<std::string> warnings;
#pragma warning(pop)

            bool isValid() const { return errors.empty(); }
        };

        /**
         * @brief Size, extension, MIME type and content-signature checks for uploads
         */
        class RESTGATE_SERVER_API FileValidator
        {
        public:
            explicit FileValidator(FileValidationOptions options) : options_(std::move(options)) {}

            FileValidationResult validate(const IFormFile &file) const;

            // Lowercased extension including the dot, or empty
            static std::string extensionOf(const std::string &fileName);

        private:
            static bool isExecutable(const std::string &head);
            static bool matchesSignature(const std::string &extension, const std::string &head);

#pragma warning(push)
#pragma warning(disable: 4251)
            FileValidationOptions options_;
#pragma warning(pop)
        };

    } // namespace http
} // namespace restgate
