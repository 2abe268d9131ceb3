#include "restgate/http/file_validator.hpp"
#include "restgate/utils.hpp"

#include <algorithm>
#include <cstdio>
#include <initializer_list>

namespace restgate
{
    namespace http
    {

        namespace
        {
            bool contains(const std::vector<std::string> &items, const std::string &value)
            {
                return std::find(items.begin(), items.end(), value) != items.end();
            }

            std::string megabytes(int64_t bytes)
            {
                char buffer[32];
                std::snprintf(buffer, sizeof(buffer), "%.2f", static_cast<double>(bytes) / 1024.0 / 1024.0);
                return buffer;
            }

            bool startsWith(const std::string &head, std::initializer_list<unsigned char> signature)
            {
                if (head.size() < signature.size())
                {
                    return false;
                }
                size_t i = 0;
                for (unsigned char byte : signature)
                {
                    if (static_cast<unsigned char>(head[i++]) != byte)
                    {
                        return false;
                    }
                }
                return true;
            }
        } // namespace

        FileValidationOptions FileValidationOptions::fromLists(int64_t maxFileSize,
                                                               const std::string &allowedExtensions,
                                                               const std::string &allowedMimeTypes,
                                                               bool validateContent)
        {
            FileValidationOptions options;
            options.maxFileSize = maxFileSize;
            options.validateContent = validateContent;
            for (const auto &ext : split(allowedExtensions, ',', true))
            {
                std::string cleaned = to_lower(trim(ext));
                if (!cleaned.empty())
                {
                    options.allowedExtensions.push_back(cleaned);
                }
            }
            for (const auto &mime : split(allowedMimeTypes, ',', true))
            {
                std::string cleaned = trim(mime);
                if (!cleaned.empty())
                {
                    options.allowedMimeTypes.push_back(cleaned);
                }
            }
            return options;
        }

        FileValidationResult FileValidator::validate(const IFormFile &file) const
        {
            FileValidationResult result;

            if (file.length() > options_.maxFileSize)
            {
                result.errors.push_back("File size (" + megabytes(file.length()) +
                                        "MB) exceeds maximum allowed size (" +
                                        megabytes(options_.maxFileSize) + "MB)");
            }

            std::string extension = extensionOf(file.fileName());

            if (contains(options_.prohibitedExtensions, extension))
            {
                result.errors.push_back("File extension '" + extension + "' is not allowed for security reasons");
            }

            if (!options_.allowedExtensions.empty() && !contains(options_.allowedExtensions, extension))
            {
                result.errors.push_back("File extension '" + extension + "' is not allowed. Allowed extensions: " +
                                        join(options_.allowedExtensions, ", "));
            }

            if (!options_.allowedMimeTypes.empty() && !contains(options_.allowedMimeTypes, file.contentType()))
            {
                result.errors.push_back("File type '" + file.contentType() + "' is not allowed. Allowed types: " +
                                        join(options_.allowedMimeTypes, ", "));
            }

            if (options_.validateContent)
            {
                const std::string head = file.bytes().substr(0, 512);

                if (isExecutable(head))
                {
                    result.errors.push_back("File appears to be an executable and is not allowed");
                }

                if (!matchesSignature(extension, head))
                {
                    result.warnings.push_back("File content may not match the declared file type");
                }
            }

            return result;
        }

        std::string FileValidator::extensionOf(const std::string &fileName)
        {
            size_t slash = fileName.find_last_of("/\\");
            size_t dot = fileName.find_last_of('.');
            if (dot == std::string::npos || (slash != std::string::npos && dot < slash))
            {
                return "";
            }
            return to_lower(fileName.substr(dot));
        }

        bool FileValidator::isExecutable(const std::string &head)
        {
            if (head.size() < 4)
            {
                return false;
            }

            // PE (MZ) and ELF headers
            return startsWith(head, {0x4D, 0x5A}) || startsWith(head, {0x7F, 0x45, 0x4C, 0x46});
        }

        bool FileValidator::matchesSignature(const std::string &extension, const std::string &head)
        {
            if (extension == ".pdf")
                return startsWith(head, {0x25, 0x50, 0x44, 0x46});
            if (extension == ".jpg" || extension == ".jpeg")
                return startsWith(head, {0xFF, 0xD8});
            if (extension == ".png")
                return startsWith(head, {0x89, 0x50, 0x4E, 0x47});
            if (extension == ".gif")
                return startsWith(head, {0x47, 0x49, 0x46});
            if (extension == ".zip" || extension == ".docx" || extension == ".xlsx")
                return startsWith(head, {0x50, 0x4B});
            return true;
        }

    } // namespace http
} // namespace restgate
