#include "restgate/controllers/file_upload_controller.hpp"
#include "restgate/logger.hpp"
#include "restgate/utils.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>

namespace restgate
{
    namespace controllers
    {

        using routing::ParamSpec;
        using routing::ParamType;

        namespace
        {
            const int64_t kMaxUploadBytes = 10 * 1024 * 1024;

            std::string guessContentType(const std::string &fileName)
            {
                const std::string ext = to_lower(std::filesystem::path(fileName).extension().string());
                if (ext == ".txt")
                    return "text/plain";
                if (ext == ".json")
                    return "application/json";
                if (ext == ".pdf")
                    return "application/pdf";
                if (ext == ".png")
                    return "image/png";
                if (ext == ".jpg" || ext == ".jpeg")
                    return "image/jpeg";
                if (ext == ".gif")
                    return "image/gif";
                return "application/octet-stream";
            }
        } // namespace

        FileUploadController::FileUploadController(std::string uploadDirectory)
            : uploadDirectory_(std::move(uploadDirectory))
        {
        }

        routing::ControllerDescriptor FileUploadController::describe() const
        {
            auto self = shared_from_this();

            http::FileValidationOptions validation;
            validation.maxFileSize = kMaxUploadBytes;

            routing::ControllerBuilder builder("FileUploadController");
            builder.route("api/[controller]");

            builder.post("upload")
                .param(ParamSpec::file("file").validatedBy(validation))
                .handle(routing::bindAction(self, &FileUploadController::upload));
            builder.post("upload2")
                .param(ParamSpec::file("file").validatedBy(validation))
                .param(ParamSpec::form("description"))
                .param(ParamSpec::form("categoryId", ParamType::Int))
                .handle(routing::bindAction(self, &FileUploadController::uploadWithForm));
            builder.get("download")
                .param(ParamSpec::query("fileName"))
                .handle(routing::bindAction(self, &FileUploadController::download));

            return builder.build();
        }

        std::string FileUploadController::storagePath(const std::string &fileName) const
        {
            const std::filesystem::path base = std::filesystem::path(fileName).filename();
            const std::string name = base.string();
            if (name.empty() || name == "." || name == ".." || name.find('\\') != std::string::npos)
            {
                return "";
            }
            return (std::filesystem::path(uploadDirectory_) / base).string();
        }

        http::ActionResult FileUploadController::upload(routing::RequestContext &context,
                                                        const routing::Arguments &args) const
        {
            std::shared_ptr<http::IFormFile> file = args.file("file");
            if (!file || file->length() == 0)
            {
                return http::ActionResult::badRequest({{"error", "No file uploaded or empty file"}});
            }

            const std::string path = storagePath(file->fileName());
            if (path.empty())
            {
                return http::ActionResult::badRequest({{"error", "Invalid file name"}});
            }

            std::filesystem::create_directories(uploadDirectory_);
            file->saveAs(path);

            ServerLogger::logInfo("File received from %s: %s (%s, %lld bytes)", context.clientIP().c_str(),
                                  file->fileName().c_str(), file->contentType().c_str(),
                                  static_cast<long long>(file->length()));

            return http::ActionResult::ok({{"status", "File received"},
                                           {"fileName", file->fileName()},
                                           {"size", file->length()}});
        }

        http::ActionResult FileUploadController::uploadWithForm(routing::RequestContext &context,
                                                                const routing::Arguments &args) const
        {
            std::shared_ptr<http::IFormFile> file = args.file("file");
            if (!file || file->length() == 0)
            {
                return http::ActionResult::badRequest({{"error", "No file uploaded or empty file"}});
            }

            const std::string description = args.getOr<std::string>("description", "");
            if (trim(description).empty())
            {
                return http::ActionResult::badRequest({{"error", "Description is required"}});
            }

            const int categoryId = args.getOr<int>("categoryId", 0);
            if (categoryId <= 0)
            {
                return http::ActionResult::badRequest({{"error", "Invalid category ID"}});
            }

            const std::string path = storagePath(file->fileName());
            if (path.empty())
            {
                return http::ActionResult::badRequest({{"error", "Invalid file name"}});
            }

            std::filesystem::create_directories(uploadDirectory_);
            file->saveAs(path);

            ServerLogger::logInfo("File with form data received from %s: %s, category %d", context.clientIP().c_str(),
                                  file->fileName().c_str(), categoryId);

            return http::ActionResult::ok({{"status", "File and form data received successfully"},
                                           {"fileName", file->fileName()},
                                           {"fileSize", file->length()},
                                           {"description", description},
                                           {"categoryId", categoryId},
                                           {"receivedAt", to_iso8601(std::chrono::system_clock::now())}});
        }

        http::ActionResult FileUploadController::download(routing::RequestContext &, const routing::Arguments &args) const
        {
            const std::string fileName = args.getOr<std::string>("fileName", "");
            if (fileName.empty())
            {
                return http::ActionResult::badRequest({{"error", "fileName query parameter is required"}});
            }

            const std::string path = storagePath(fileName);
            if (path.empty())
            {
                return http::ActionResult::badRequest({{"error", "Invalid file name"}});
            }

            std::error_code ec;
            if (!std::filesystem::is_regular_file(path, ec))
            {
                return http::ActionResult::notFound({{"error", "File not found"}, {"fileName", fileName}});
            }

            auto stream = std::make_shared<std::ifstream>(path, std::ios::binary);
            if (!stream->is_open())
            {
                ServerLogger::logError("Could not open stored file %s", path.c_str());
                return http::ActionResult::statusCode(500, {{"error", "Internal server error"}});
            }

            const std::string storedName = std::filesystem::path(path).filename().string();
            return http::ActionResult::streamFile(stream, guessContentType(storedName), storedName);
        }

    } // namespace controllers
} // namespace restgate
