#include "restgate/http/action_result.hpp"

namespace restgate
{
    namespace http
    {

        namespace
        {
            ActionResult jsonResult(int status, nlohmann::json value)
            {
                if (value.is_null())
                {
                    return ActionResult(status);
                }
                return ActionResult(status, ResultPayload(std::in_place_type<nlohmann::json>, std::move(value)));
            }
        } // namespace

        ActionResult ActionResult::ok(nlohmann::json value)
        {
            return jsonResult(200, std::move(value));
        }

        ActionResult ActionResult::created(nlohmann::json value)
        {
            return jsonResult(201, std::move(value));
        }

        ActionResult ActionResult::badRequest(nlohmann::json value)
        {
            return jsonResult(400, std::move(value));
        }

        ActionResult ActionResult::unauthorized(nlohmann::json value)
        {
            return jsonResult(401, std::move(value));
        }

        ActionResult ActionResult::notFound(nlohmann::json value)
        {
            return jsonResult(404, std::move(value));
        }

        ActionResult ActionResult::statusCode(int status, nlohmann::json value)
        {
            return jsonResult(status, std::move(value));
        }

        ActionResult ActionResult::noContent()
        {
            return ActionResult(204);
        }

        ActionResult ActionResult::content(std::string content, std::string contentType, std::string charset)
        {
            return ActionResult(200, ContentBody{std::move(content), std::move(contentType), std::move(charset)});
        }

        ActionResult ActionResult::text(std::string text)
        {
            return ActionResult(200, TextBody{std::move(text)});
        }

        ActionResult ActionResult::file(std::string data, std::string contentType, std::string fileName)
        {
            return ActionResult(200, FileBody{std::move(data), std::move(contentType), std::move(fileName)});
        }

        ActionResult ActionResult::streamFile(std::shared_ptr<std::istream> stream, std::string contentType,
                                              std::string fileName, bool attachment)
        {
            return ActionResult(200, StreamFileBody{std::move(stream), std::move(contentType),
                                                    std::move(fileName), attachment});
        }

        ActionResult ActionResult::stream(std::shared_ptr<std::istream> stream)
        {
            return ActionResult(200, StreamBody{std::move(stream)});
        }

    } // namespace http
} // namespace restgate
