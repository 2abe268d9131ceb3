#include "test_common.h"
#include "restgate/http/byte_sink.hpp"
#include "restgate/http/response_writer.hpp"
#include <sstream>

using namespace restgate;
using namespace restgate::http;

namespace {

ParsedResponse render(const ResponseWriter &writer, const HttpRequest &request, const ActionResult &result,
                      bool *closed = nullptr) {
    StringSink sink;
    writer.write(sink, request, result);
    if (closed) *closed = sink.closed();
    return parse_response(sink.data());
}

} // namespace

int main() {
    quiet_logs();

    auto cors = std::make_shared<auth::CorsHandler>();
    ResponseWriter writer(cors);

    // JSON bodies: camelCase keys, CORS and security headers, Connection: close
    {
        HttpRequest request = make_request("GET", "/api/user/info");
        request.setHeader("Origin", "https://app.example");
        nlohmann::json body = {{"UserName", "alice"}, {"IDValue", 7}, {"Items", nlohmann::json::array({{{"FirstName", "x"}}})}};
        bool closed = false;
        ParsedResponse r = render(writer, request, ActionResult::ok(body), &closed);

        if (r.status != 200 || !closed) { std::cerr << "[TEST] status or sink not closed\n"; return 65; }
        if (r.json["userName"] != "alice" || r.json["idValue"] != 7 || r.json["items"][0]["firstName"] != "x") {
            std::cerr << "[TEST] camelCase keys: " << r.body << "\n"; return 66;
        }
        if (!r.hasHeader("Content-Type: application/json; charset=utf-8")) { std::cerr << "[TEST] json content type\n"; return 67; }
        if (!r.hasHeader("Access-Control-Allow-Origin: https://app.example")) { std::cerr << "[TEST] origin not echoed with credentials\n"; return 68; }
        if (!r.hasHeader("X-Content-Type-Options: nosniff") || !r.hasHeader("X-Frame-Options: DENY") ||
            !r.hasHeader("Content-Security-Policy: default-src 'self'")) { std::cerr << "[TEST] security headers\n"; return 69; }
        if (!r.hasHeader("Connection: close")) { std::cerr << "[TEST] Connection: close missing\n"; return 70; }
        if (!r.hasHeader("Content-Length: " + std::to_string(r.body.size()))) { std::cerr << "[TEST] content length\n"; return 71; }
        std::cout << "[TEST] OK json response\n";
    }

    // Headers set by the action win; docs pages get the relaxed policy
    {
        HttpRequest request = make_request("GET", "/swagger/index.html");
        ActionResult result = ActionResult::content("<html></html>", "text/html");
        result.headers["X-Frame-Options"] = "SAMEORIGIN";
        ParsedResponse r = render(writer, request, result);
        if (!r.hasHeader("X-Frame-Options: SAMEORIGIN") || r.hasHeader("X-Frame-Options: DENY")) { std::cerr << "[TEST] action header overridden\n"; return 72; }
        if (!r.hasHeader("'unsafe-inline'")) { std::cerr << "[TEST] docs CSP not relaxed\n"; return 73; }
        if (!r.hasHeader("Content-Type: text/html; charset=utf-8") || r.body != "<html></html>") { std::cerr << "[TEST] content body\n"; return 74; }
    }

    // HEAD keeps the head and drops the body
    {
        HttpRequest request = make_request("HEAD", "/api/user/1");
        ParsedResponse r = render(writer, request, ActionResult::ok({{"id", 1}}));
        if (r.status != 200 || !r.body.empty() || !r.hasHeader("Content-Length: 8")) { std::cerr << "[TEST] HEAD response\n"; return 75; }
    }

    // Preflight: 204 with Max-Age and no body
    {
        HttpRequest request = make_request("OPTIONS", "/api/user");
        StringSink sink;
        writer.writePreflight(sink, request);
        ParsedResponse r = parse_response(sink.data());
        if (r.status != 204 || !r.hasHeader("Access-Control-Max-Age: 86400") || !r.body.empty()) { std::cerr << "[TEST] preflight\n"; return 76; }
        if (r.hasHeader("Content-Length")) { std::cerr << "[TEST] 204 with Content-Length\n"; return 77; }
        if (!sink.closed()) { std::cerr << "[TEST] preflight sink left open\n"; return 78; }
    }

    // Streamed files carry a disposition and an exact length
    {
        const std::string payload(200000, 'z');
        auto stream = std::make_shared<std::istringstream>(payload);
        HttpRequest request = make_request("GET", "/api/fileupload/download?fileName=big.bin");
        ParsedResponse r = render(writer, request, ActionResult::streamFile(stream, "application/octet-stream", "big.bin"));
        if (r.body != payload || !r.hasHeader("Content-Length: 200000")) { std::cerr << "[TEST] streamed body\n"; return 79; }
        if (!r.hasHeader("Content-Disposition: attachment; filename=\"big.bin\"")) { std::cerr << "[TEST] disposition\n"; return 80; }

        ParsedResponse inlined = render(writer, request,
                                        ActionResult::streamFile(std::make_shared<std::istringstream>("hi"), "text/plain", "a.txt", false));
        if (!inlined.hasHeader("Content-Disposition: inline; filename=\"a.txt\"")) { std::cerr << "[TEST] inline disposition\n"; return 81; }
    }

    // A failure before the head is sent degrades to a generic 500
    {
        HttpRequest request = make_request("GET", "/api/fileupload/download");
        ParsedResponse r = render(writer, request, ActionResult::streamFile(nullptr, "text/plain", "x"));
        if (r.status != 500 || r.json["error"] != "Internal server error" || r.json.contains("details")) {
            std::cerr << "[TEST] fallback 500: " << r.body << "\n"; return 82;
        }
    }

    // Invalid UTF-8 in a value is replaced rather than failing the response
    {
        HttpRequest request = make_request("GET", "/api/user/search");
        ParsedResponse r = render(writer, request, ActionResult::badRequest({{"error", std::string("bad \xFF value")}}));
        if (r.status != 400 || r.json["error"] != "bad \xEF\xBF\xBD value") {
            std::cerr << "[TEST] invalid UTF-8 body: " << r.status << " " << r.body << "\n"; return 86;
        }
    }

    // Explicit origin list: unknown origins get the first configured origin
    {
        auth::CorsHandler::Config config;
        config.allowedOrigins = {"https://one.example", "https://two.example"};
        ResponseWriter strict(std::make_shared<auth::CorsHandler>(config));
        HttpRequest known = make_request("GET", "/api/user");
        known.setHeader("Origin", "https://two.example");
        if (!render(strict, known, ActionResult::ok()).hasHeader("Access-Control-Allow-Origin: https://two.example")) { std::cerr << "[TEST] listed origin\n"; return 83; }
        HttpRequest unknown = make_request("GET", "/api/user");
        unknown.setHeader("Origin", "https://evil.example");
        if (!render(strict, unknown, ActionResult::ok()).hasHeader("Access-Control-Allow-Origin: https://one.example")) { std::cerr << "[TEST] unlisted origin\n"; return 84; }
    }

    if (ResponseWriter::camelCase("URLPath") != "urlPath" || ResponseWriter::camelCase("already") != "already") {
        std::cerr << "[TEST] camelCase rule\n"; return 85;
    }

    std::cout << "[TEST] OK response writer\n";
    return 0;
}
