#pragma once

#include "../export.hpp"
#include "../routing/controller.hpp"

#include <memory>
#include <string>

namespace restgate
{
    namespace controllers
    {

        /**
         * @brief Sample multipart upload and file download controller under api/fileupload
         *
         * Uploaded files are stored under the upload directory by their base name;
         * GET download streams them back.
         */
        class RESTGATE_SERVER_API FileUploadController : public std::enable_shared_from_this<FileUploadController>
        {
        public:
            explicit FileUploadController(std::string uploadDirectory = "uploads");

            routing::ControllerDescriptor describe() const;

            http::ActionResult upload(routing::RequestContext &context, const routing::Arguments &args) const;
            http::ActionResult uploadWithForm(routing::RequestContext &context, const routing::Arguments &args) const;
            http::ActionResult download(routing::RequestContext &context, const routing::Arguments &args) const;

            const std::string &uploadDirectory() const { return uploadDirectory_; }

        private:
            // Stored path for an uploaded name, empty when the name is unusable
            std::string storagePath(const std::string &fileName) const;

#pragma warning(push)
#pragma warning(disable: 4251)
            std::string uploadDirectory_;
#pragma warning(pop)
        };

    } // namespace controllers
} // namespace restgate
