#pragma once

#include "../export.hpp"
#include "byte_sink.hpp"

#include <cstdint>
#include <istream>
#include <memory>
#include <string>

namespace restgate
{
    namespace http
    {

        struct FormField;

        /**
         * @brief Uploaded file handed to controller actions
         */
        class RESTGATE_SERVER_API IFormFile
        {
        public:
            virtual ~IFormFile() = default;

            virtual const std::string &name() const = 0;
            virtual const std::string &fileName() const = 0;
            virtual const std::string &contentType() const = 0;
            virtual int64_t length() const = 0;

            virtual const std::string &bytes() const = 0;

            // Fresh stream positioned at the first byte
            virtual std::unique_ptr<std::istream> openReadStream() const = 0;

            virtual void copyTo(IByteSink &target) const = 0;

            /**
             * @brief Write the file to disk
             * @throws std::runtime_error when the destination cannot be written
             */
            virtual void saveAs(const std::string &path) const = 0;
        };

        /**
         * @brief In-memory IFormFile backed by a decoded multipart part
         */
        class RESTGATE_SERVER_API FormFile : public IFormFile
        {
        public:
            FormFile(std::string name, std::string fileName, std::string contentType, std::string data);

            static std::shared_ptr<FormFile> fromField(const FormField &field);

            const std::string &name() const override { return name_; }
            const std::string &fileName() const override { return fileName_; }
            const std::string &contentType() const override { return contentType_; }
            int64_t length() const override { return static_cast<int64_t>(data_.size()); }
            const std::string &bytes() const override { return data_; }

            std::unique_ptr<std::istream> openReadStream() const override;
            void copyTo(IByteSink &target) const override;
            void saveAs(const std::string &path) const override;

        private:
#pragma warning(push)
#pragma warning(disable: 4251)
            std::string name_;
            std::string fileName_;
            std::string contentType_;
            std::string data_;
#pragma warning(pop)
        };

    } // namespace http
} // namespace restgate
