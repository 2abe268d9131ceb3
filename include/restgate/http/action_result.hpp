#pragma once

#include "../export.hpp"
#include "../utils.hpp"

#include <istream>
#include <memory>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace restgate
{
    namespace http
    {

        // Raw content written verbatim with its type and charset
        struct ContentBody
        {
            std::string content;
            std::string contentType = "text/plain";
            std::string charset = "utf-8";
        };

        // In-memory file sent as an attachment
        struct FileBody
        {
            std::string data;
            std::string contentType = "application/octet-stream";
            std::string fileName;
        };

        // File streamed in bounded chunks; inline when attachment is false
        struct StreamFileBody
        {
            std::shared_ptr<std::istream> stream;
            std::string contentType = "application/octet-stream";
            std::string fileName;
            bool attachment = true;
        };

        // Arbitrary byte stream sent as application/octet-stream
        struct StreamBody
        {
            std::shared_ptr<std::istream> stream;
        };

        struct TextBody
        {
            std::string text;
        };

        using ResultPayload = std::variant<std::monostate, nlohmann::json, ContentBody, FileBody,
                                           StreamFileBody, StreamBody, TextBody>;

        /**
         * @brief Outcome of a controller action
         *
         * A status code, optional extra response headers and exactly one payload
         * kind. std::monostate means status only (empty body).
         */
        struct RESTGATE_SERVER_API ActionResult
        {
            int status = 200;
#pragma warning(push)
#pragma warning(disable: 4251)
            CaseInsensitiveMap headers;
            ResultPayload payload;
#pragma warning(pop)

            ActionResult() = default;
            ActionResult(int statusCode, ResultPayload body = std::monostate{})
                : status(statusCode), payload(std::move(body)) {}

            bool hasBody() const { return !std::holds_alternative<std::monostate>(payload); }

            static ActionResult ok(nlohmann::json value = nullptr);
            static ActionResult created(nlohmann::json value = nullptr);
            static ActionResult badRequest(nlohmann::json value = nullptr);
            static ActionResult unauthorized(nlohmann::json value = nullptr);
            static ActionResult notFound(nlohmann::json value = nullptr);
            static ActionResult statusCode(int status, nlohmann::json value = nullptr);
            static ActionResult noContent();

            static ActionResult content(std::string content, std::string contentType, std::string charset = "utf-8");
            static ActionResult text(std::string text);
            static ActionResult file(std::string data, std::string contentType, std::string fileName);
            static ActionResult streamFile(std::shared_ptr<std::istream> stream, std::string contentType,
                                           std::string fileName = "", bool attachment = true);
            static ActionResult stream(std::shared_ptr<std::istream> stream);
        };

    } // namespace http
} // namespace restgate
