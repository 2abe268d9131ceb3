#include "restgate/http/form_file.hpp"
#include "restgate/http/multipart_parser.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace restgate
{
    namespace http
    {

        FormFile::FormFile(std::string name, std::string fileName, std::string contentType, std::string data)
            : name_(std::move(name)), fileName_(std::move(fileName)),
              contentType_(std::move(contentType)), data_(std::move(data))
        {
        }

        std::shared_ptr<FormFile> FormFile::fromField(const FormField &field)
        {
            return std::make_shared<FormFile>(field.name,
                                              field.fileName.value_or(""),
                                              field.contentType.value_or("application/octet-stream"),
                                              field.data);
        }

        std::unique_ptr<std::istream> FormFile::openReadStream() const
        {
            return std::make_unique<std::istringstream>(data_, std::ios::in | std::ios::binary);
        }

        void FormFile::copyTo(IByteSink &target) const
        {
            if (!target.write(data_))
            {
                throw std::runtime_error("Failed to copy uploaded file '" + fileName_ + "'");
            }
        }

        void FormFile::saveAs(const std::string &path) const
        {
            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw std::runtime_error("Cannot open '" + path + "' for writing");
            }
            out.write(data_.data(), static_cast<std::streamsize>(data_.size()));
            if (!out)
            {
                throw std::runtime_error("Failed to write uploaded file to '" + path + "'");
            }
        }

    } // namespace http
} // namespace restgate
