#include "test_common.h"
#include "restgate/http/errors.hpp"
#include "restgate/routing/parameter_resolver.hpp"
#include "restgate/routing/value_converter.hpp"

using namespace restgate;
using namespace restgate::routing;

namespace {

ActionDescriptor action_with(std::vector<ParamSpec> params) {
    ActionDescriptor action;
    action.verb = "POST";
    action.params = std::move(params);
    return action;
}

Arguments resolve(http::HttpRequest &request, const ActionDescriptor &action) {
    request.loadBody(1024 * 1024);
    RequestContext context(request);
    return ParameterResolver().resolve(action, context, {});
}

std::string resolve_error(http::HttpRequest &request, const ActionDescriptor &action) {
    try {
        resolve(request, action);
    } catch (const http::ClientInputError &ex) {
        return ex.what();
    }
    return "";
}

} // namespace

int main() {
    quiet_logs();

    // Headers: underscores and dashes are interchangeable, lookup ignores case
    {
        ActionDescriptor action = action_with({ParamSpec::header("x_api_key"),
                                               ParamSpec::header("x_trace", ParamType::String).withDefault("none")});
        http::HttpRequest request = make_request("GET", "/api/items");
        request.setHeader("X-API-KEY", "k-123");
        Arguments args = resolve(request, action);
        if (args.get<std::string>("x_api_key") != "k-123") { std::cerr << "[TEST] header variant lookup\n"; return 65; }
        if (args.get<std::string>("x_trace") != "none") { std::cerr << "[TEST] header default\n"; return 66; }

        http::HttpRequest bare = make_request("GET", "/api/items");
        std::string error = resolve_error(bare, action);
        if (error != "Missing required header. Tried: x_api_key, x-api-key") { std::cerr << "[TEST] missing header: " << error << "\n"; return 67; }
        std::cout << "[TEST] OK headers\n";
    }

    // Query: declared defaults, zero values and absent nullables
    {
        ActionDescriptor action = action_with({ParamSpec::query("page", ParamType::Int).withDefault(1),
                                               ParamSpec::query("size", ParamType::Int),
                                               ParamSpec::query("active", ParamType::Bool).asNullable(),
                                               ParamSpec::query("sort_by")});
        http::HttpRequest request = make_request("GET", "/api/user/search?size=25&sort-by=name");
        Arguments args = resolve(request, action);
        if (args.get<int>("page") != 1 || args.get<int>("size") != 25) { std::cerr << "[TEST] query ints\n"; return 68; }
        if (args.has("active")) { std::cerr << "[TEST] absent nullable reported present\n"; return 69; }
        if (args.get<std::string>("sort_by") != "name") { std::cerr << "[TEST] dashed query variant\n"; return 70; }

        http::HttpRequest none = make_request("GET", "/api/user/search");
        Arguments empty = resolve(none, action);
        if (empty.get<int>("size") != 0) { std::cerr << "[TEST] missing int not zero\n"; return 71; }

        http::HttpRequest bad = make_request("GET", "/api/user/search?page=two");
        if (resolve_error(bad, action) != "Cannot convert query parameter 'page' value 'two' to type 'int'") { std::cerr << "[TEST] bad query value\n"; return 72; }
        std::cout << "[TEST] OK query\n";
    }

    // Body: JSON documents, shapes and required bodies
    {
        ActionDescriptor action = action_with({ParamSpec::body("request").withShape(
            {ShapeField("username", ParamType::String), ShapeField("password", ParamType::String)})});

        http::HttpRequest request = make_request("POST", "/api/user/login", R"({"UserName":"alice","PASSWORD":"pw"})");
        Arguments args = resolve(request, action);
        const nlohmann::json &login = args.json("request");
        if (login["username"] != "alice" || login["password"] != "pw") { std::cerr << "[TEST] body shape: " << login.dump() << "\n"; return 73; }

        http::HttpRequest empty = make_request("POST", "/api/user/login");
        if (resolve_error(empty, action) != "FromBody parameter 'request' is required") { std::cerr << "[TEST] required body\n"; return 74; }

        http::HttpRequest broken = make_request("POST", "/api/user/login", "{\"username\": ");
        if (resolve_error(broken, action).rfind("Invalid JSON format", 0) != 0) { std::cerr << "[TEST] malformed JSON accepted\n"; return 75; }

        ActionDescriptor optional = action_with({ParamSpec::body("data").asNullable()});
        http::HttpRequest nothing = make_request("PATCH", "/api/user/1");
        Arguments none = resolve(nothing, optional);
        if (!none.json("data").is_null()) { std::cerr << "[TEST] nullable body not null\n"; return 76; }
        std::cout << "[TEST] OK body\n";
    }

    // Every combination of primitive fields survives serialize, send and resolve
    {
        ShapeField color("color", ParamType::Enum);
        color.enumValues = {"Red", "Green", "Blue"};
        const std::vector<ShapeField> fields = {
            ShapeField("name", ParamType::String), ShapeField("count", ParamType::Int),
            ShapeField("total", ParamType::Long), ShapeField("ratio", ParamType::Double),
            ShapeField("active", ParamType::Bool), ShapeField("id", ParamType::Uuid),
            color, ShapeField("score", ParamType::Int, true)};
        const nlohmann::json sample = {{"name", "Zoë"},
                                       {"count", -2147483647 - 1},
                                       {"total", 9007199254740993LL},
                                       {"ratio", 0.1},
                                       {"active", true},
                                       {"id", "0f8fad5b-d9cb-469f-a165-70867728950e"},
                                       {"color", "Green"},
                                       {"score", nullptr}};
        ActionDescriptor action = action_with({ParamSpec::body("item").withShape(fields)});

        for (unsigned mask = 0; mask < (1u << fields.size()); ++mask) {
            nlohmann::json sent = nlohmann::json::object();
            for (size_t i = 0; i < fields.size(); ++i) {
                if (mask & (1u << i)) sent[fields[i].name] = sample[fields[i].name];
            }
            http::HttpRequest request = make_request("POST", "/api/items", sent.dump());
            const nlohmann::json bound = resolve(request, action).json("item");
            for (size_t i = 0; i < fields.size(); ++i) {
                const ShapeField &field = fields[i];
                nlohmann::json expected = (mask & (1u << i)) ? sample[field.name]
                                        : field.nullable ? nlohmann::json(nullptr)
                                                         : ValueConverter::zeroValue(field.type, field.enumValues);
                if (bound[field.name] != expected) {
                    std::cerr << "[TEST] shape field " << field.name << " with mask " << mask << ": " << bound.dump() << "\n";
                    return 85;
                }
            }
        }
        std::cout << "[TEST] OK shape round trip\n";
    }

    // Route parameters are matched by lowercased name
    {
        ActionDescriptor action = action_with({ParamSpec::route("userId", ParamType::Int), ParamSpec::context()});
        http::HttpRequest request = make_request("PATCH", "/api/user/42");
        request.loadBody(1024);
        RequestContext context(request);
        Arguments args = ParameterResolver().resolve(action, context, {{"userid", "42"}});
        if (args.get<int>("userId") != 42) { std::cerr << "[TEST] route parameter\n"; return 77; }
        if (!args.context("context") || args.context("context")->clientIP() != "10.0.0.1") { std::cerr << "[TEST] context parameter\n"; return 78; }
        std::cout << "[TEST] OK route parameters\n";
    }

    // URL-encoded and multipart forms
    {
        ActionDescriptor action = action_with({ParamSpec::form("description"),
                                               ParamSpec::form("categoryId", ParamType::Int)});
        http::HttpRequest request = make_request("POST", "/api/fileupload/upload2", "description=Annual+plan&categoryid=3",
                                                 "application/x-www-form-urlencoded");
        Arguments args = resolve(request, action);
        if (args.get<std::string>("description") != "Annual plan" || args.get<int>("categoryId") != 3) { std::cerr << "[TEST] urlencoded form\n"; return 79; }

        const std::string boundary = "XyZbOuNdArY";
        const std::string body =
            "--" + boundary + "\r\nContent-Disposition: form-data; name=\"description\"\r\n\r\nnotes\r\n"
            "--" + boundary + "\r\nContent-Disposition: form-data; name=\"file\"; filename=\"notes.txt\"\r\n"
            "Content-Type: text/plain\r\n\r\nhello\r\nworld\r\n"
            "--" + boundary + "--\r\n";

        ActionDescriptor upload = action_with({ParamSpec::file("file"), ParamSpec::file("raw", ParamType::Bytes, "file"),
                                               ParamSpec::form("description"), ParamSpec::file("missing")});
        http::HttpRequest multipart = make_request("POST", "/api/fileupload/upload2", body,
                                                   "multipart/form-data; boundary=" + boundary);
        Arguments uploaded = resolve(multipart, upload);
        std::shared_ptr<http::IFormFile> file = uploaded.file("file");
        if (!file || file->fileName() != "notes.txt" || file->bytes() != "hello\r\nworld") { std::cerr << "[TEST] multipart file\n"; return 80; }
        if (!uploaded.bytes("raw") || *uploaded.bytes("raw") != "hello\r\nworld") { std::cerr << "[TEST] multipart bytes\n"; return 81; }
        if (uploaded.get<std::string>("description") != "notes") { std::cerr << "[TEST] multipart text field\n"; return 82; }
        if (uploaded.has("missing") || uploaded.file("missing")) { std::cerr << "[TEST] missing file reported present\n"; return 83; }

        // Validation failures are client errors
        ActionDescriptor strict = action_with({ParamSpec::file("file").validatedBy(
            http::FileValidationOptions::fromLists(1024, ".png", "image/png"))});
        http::HttpRequest again = make_request("POST", "/api/fileupload/upload", body,
                                               "multipart/form-data; boundary=" + boundary);
        if (resolve_error(again, strict).rfind("File validation failed for 'file'", 0) != 0) { std::cerr << "[TEST] invalid upload accepted\n"; return 84; }
        std::cout << "[TEST] OK forms\n";
    }

    std::cout << "[TEST] OK parameter resolver\n";
    return 0;
}
