#include "test_common.h"
#include "restgate/auth/auth_middleware.hpp"
#include "restgate/auth/ip_block_list.hpp"
#include "restgate/auth/rate_limiter.hpp"
#include "restgate/controllers/admin_controller.hpp"
#include "restgate/controllers/file_upload_controller.hpp"
#include "restgate/controllers/login_directory.hpp"
#include "restgate/controllers/security_controller.hpp"
#include "restgate/controllers/user_controller.hpp"
#include "restgate/http/byte_sink.hpp"
#include "restgate/routing/request_dispatcher.hpp"

using namespace restgate;
using namespace restgate::routing;

namespace {

struct Pipeline {
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<auth::IPBlockList> blocks;
    std::shared_ptr<auth::RateLimiter> limiter;
    std::shared_ptr<RequestDispatcher> dispatcher;
};

Pipeline make_pipeline(size_t maxRequests, const std::string &uploadDir) {
    Pipeline p;

    auth::RateLimitConfig rate;
    rate.clearEndpointLimits();
    rate.defaultMaxRequests = maxRequests;
    rate.defaultTimeWindow = std::chrono::seconds(60);
    rate.blockFile = "";
    p.blocks = std::make_shared<auth::IPBlockList>("", p.clock, nullptr);
    p.limiter = std::make_shared<auth::RateLimiter>(rate, p.blocks, nullptr, p.clock);

    auto verifier = std::make_shared<auth::StaticTokenVerifier>();
    auth::Identity admin;
    admin.name = "root";
    admin.roles = {"Admin"};
    verifier->addToken("admin-token", admin);
    auth::Identity user;
    user.name = "alice";
    user.roles = {"User"};
    verifier->addToken("user-token", user);

    auto logins = std::make_shared<controllers::LoginDirectory>();
    logins->addAccount("alice", "secret", "user-token", {"User"});
    logins->addAccount("root", "toor", "admin-token", {"Admin"});

    auto registry = std::make_shared<RouteRegistry>();
    registry->registerController(std::make_shared<controllers::UserController>(logins)->describe());
    registry->registerController(std::make_shared<controllers::AdminController>(logins)->describe());
    registry->registerController(std::make_shared<controllers::FileUploadController>(uploadDir)->describe());
    registry->registerController(std::make_shared<controllers::SecurityController>(p.limiter)->describe());

    auto middleware = std::make_shared<auth::AuthMiddleware>(p.limiter, verifier);
    auto writer = std::make_shared<http::ResponseWriter>(std::make_shared<auth::CorsHandler>());
    RequestDispatcherOptions options;
    options.maxBodySizeMB = 1;
    p.dispatcher = std::make_shared<RequestDispatcher>(registry, middleware, writer, options);
    return p;
}

ParsedResponse send(const Pipeline &p, http::HttpRequest request, const std::string &token = "") {
    if (!token.empty()) request.setHeader("Authorization", "Bearer " + token);
    http::StringSink sink;
    p.dispatcher->dispatch(request, sink);
    return parse_response(sink.data());
}

} // namespace

int main() {
    quiet_logs();
    const std::string uploads = scratch_dir("dispatcher_uploads");
    Pipeline p = make_pipeline(1000, uploads);

    // Anonymous controller actions
    {
        ParsedResponse r = send(p, make_request("GET", "/api/user/info"));
        if (r.status != 200 || r.json["message"] != "Hello from the server" || r.json["clientIp"] != "10.0.0.1") {
            std::cerr << "[TEST] GET /api/user/info: " << r.body << "\n"; return 65;
        }
        if (send(p, make_request("GET", "/API/User")).status != 200) { std::cerr << "[TEST] case-insensitive controller route\n"; return 66; }
        std::cout << "[TEST] OK anonymous actions\n";
    }

    // Role-guarded actions
    {
        ParsedResponse none = send(p, make_request("GET", "/api/user/security"));
        if (none.status != 401 || none.json["error"] != "Unauthorized: Missing or invalid token") { std::cerr << "[TEST] no token: " << none.body << "\n"; return 67; }
        ParsedResponse wrong = send(p, make_request("GET", "/api/user/security"), "bogus");
        if (wrong.status != 401 || wrong.json["error"] != "Unauthorized: Invalid token") { std::cerr << "[TEST] bad token: " << wrong.body << "\n"; return 68; }
        if (send(p, make_request("GET", "/api/user/security"), "user-token").status != 403) { std::cerr << "[TEST] non-admin not forbidden\n"; return 69; }
        if (send(p, make_request("GET", "/api/user/security"), "admin-token").status != 200) { std::cerr << "[TEST] admin refused\n"; return 70; }

        // Controller-level requirement with an anonymous login action
        if (send(p, make_request("GET", "/api/admin")).status != 401) { std::cerr << "[TEST] admin controller open\n"; return 71; }
        ParsedResponse adminLogin = send(p, make_request("POST", "/api/admin/login", R"({"username":"root","password":"toor"})"));
        if (adminLogin.status != 200 || adminLogin.json["token"] != "admin-token") { std::cerr << "[TEST] admin login: " << adminLogin.body << "\n"; return 72; }
        ParsedResponse nonAdmin = send(p, make_request("POST", "/api/admin/login", R"({"username":"alice","password":"secret"})"));
        if (nonAdmin.status != 401) { std::cerr << "[TEST] non-admin admin login accepted\n"; return 73; }
        std::cout << "[TEST] OK authorization\n";
    }

    // Parameter binding through the whole pipeline
    {
        ParsedResponse login = send(p, make_request("POST", "/api/user/login", R"({"Username":"alice","Password":"secret"})"));
        if (login.status != 200 || login.json["token"] != "user-token" || login.json["user"]["name"] != "alice") {
            std::cerr << "[TEST] user login: " << login.body << "\n"; return 74;
        }
        ParsedResponse denied = send(p, make_request("POST", "/api/user/login", R"({"username":"alice","password":"nope"})"));
        if (denied.status != 401 || denied.json["error"] != "Invalid credentials") { std::cerr << "[TEST] bad password\n"; return 75; }

        ParsedResponse update = send(p, make_request("PUT", "/api/user/AbC-1", R"({"name":"Zed"})"));
        if (update.json["message"] != "User AbC-1 as Zed") { std::cerr << "[TEST] PUT binding: " << update.body << "\n"; return 76; }

        ParsedResponse patch = send(p, make_request("PATCH", "/api/user/7", R"({"email":"a@b.c","age":3})"));
        if (patch.json["userId"] != "7" || patch.json["updatedFields"].size() != 2) { std::cerr << "[TEST] PATCH binding: " << patch.body << "\n"; return 77; }

        ParsedResponse search = send(p, make_request("GET", "/api/user/search?page=3&active=true"));
        if (search.json["page"] != 3 || search.json["size"] != 10 || search.json["active"] != true || !search.json["name"].is_null()) {
            std::cerr << "[TEST] search binding: " << search.body << "\n"; return 78;
        }

        ParsedResponse badQuery = send(p, make_request("GET", "/api/user/search?page=x"));
        if (badQuery.status != 400 || badQuery.json["error"] != "Cannot convert query parameter 'page' value 'x' to type 'int'") {
            std::cerr << "[TEST] bad query: " << badQuery.body << "\n"; return 79;
        }

        // Bytes that are not UTF-8 stay a conversion error, and echoed values still serialize
        ParsedResponse rawByte = send(p, make_request("GET", "/api/user/search?page=%FF"));
        if (rawByte.status != 400 || rawByte.json["error"].get<std::string>().rfind("Cannot convert query parameter 'page'", 0) != 0) {
            std::cerr << "[TEST] non UTF-8 query value: " << rawByte.status << " " << rawByte.body << "\n"; return 102;
        }
        ParsedResponse rawName = send(p, make_request("GET", "/api/user/search?name=%FF"));
        if (rawName.status != 200 || rawName.json["name"] != "\xEF\xBF\xBD") {
            std::cerr << "[TEST] non UTF-8 echo: " << rawName.status << " " << rawName.body << "\n"; return 103;
        }

        ParsedResponse badJson = send(p, make_request("POST", "/api/user/login", "{bad"));
        if (badJson.status != 400 || badJson.json["error"].get<std::string>().rfind("Invalid JSON format", 0) != 0) {
            std::cerr << "[TEST] malformed JSON: " << badJson.body << "\n"; return 80;
        }

        ParsedResponse missingBody = send(p, make_request("POST", "/api/user/login"));
        if (missingBody.status != 400) { std::cerr << "[TEST] missing required body\n"; return 81; }
        std::cout << "[TEST] OK binding\n";
    }

    // Route misses
    {
        ParsedResponse noController = send(p, make_request("GET", "/API/Nothing/here"));
        if (noController.status != 404 || noController.json["error"] != "Controller not found" ||
            noController.json["requestedPath"] != "api/nothing/here" || !noController.json["availableRoutes"].is_array()) {
            std::cerr << "[TEST] controller miss: " << noController.body << "\n"; return 82;
        }
        ParsedResponse noAction = send(p, make_request("DELETE", "/api/user/info"));
        if (noAction.status != 404 || noAction.json["error"] != "Route not found" || noAction.json["method"] != "DELETE") {
            std::cerr << "[TEST] action miss: " << noAction.body << "\n"; return 83;
        }
        std::cout << "[TEST] OK route misses\n";
    }

    // Verbs without a body
    {
        ParsedResponse preflight = send(p, make_request("OPTIONS", "/api/user"));
        if (preflight.status != 204 || !preflight.hasHeader("Access-Control-Max-Age")) { std::cerr << "[TEST] preflight\n"; return 84; }
        ParsedResponse head = send(p, make_request("HEAD", "/api/user/5"));
        if (head.status != 200 || !head.body.empty()) { std::cerr << "[TEST] HEAD\n"; return 85; }
    }

    // Body size limits, declared and under-reported
    {
        const std::string big(2 * 1024 * 1024, 'a');
        ParsedResponse declared = send(p, make_request("POST", "/api/user/login", big));
        if (declared.status != 413 || declared.json["error"] != "Request entity too large" || declared.json["maxAllowedSizeMB"] != 1) {
            std::cerr << "[TEST] declared oversize: " << declared.body << "\n"; return 86;
        }

        http::HttpRequest sneaky = make_request("POST", "/api/user/login", big);
        sneaky.setHeader("Content-Length", "16");
        if (send(p, sneaky).status != 413) { std::cerr << "[TEST] under-reported oversize accepted\n"; return 87; }
        std::cout << "[TEST] OK size limits\n";
    }

    // Uploads and downloads
    {
        const std::string boundary = "UpLoAdBoUnDaRy";
        const std::string content = "line one\r\nline two\n";
        const std::string body = "--" + boundary + "\r\nContent-Disposition: form-data; name=\"file\"; filename=\"notes.txt\"\r\n"
                                 "Content-Type: text/plain\r\n\r\n" + content + "\r\n--" + boundary + "--\r\n";
        ParsedResponse upload = send(p, make_request("POST", "/api/fileupload/upload", body, "multipart/form-data; boundary=" + boundary));
        if (upload.status != 200 || upload.json["fileName"] != "notes.txt" || upload.json["size"] != content.size()) {
            std::cerr << "[TEST] upload: " << upload.body << "\n"; return 88;
        }

        ParsedResponse download = send(p, make_request("GET", "/api/fileupload/download?fileName=notes.txt"));
        if (download.status != 200 || download.body != content || !download.hasHeader("Content-Type: text/plain")) {
            std::cerr << "[TEST] download\n"; return 89;
        }
        if (send(p, make_request("GET", "/api/fileupload/download?fileName=missing.txt")).status != 404) { std::cerr << "[TEST] missing download\n"; return 90; }

        const std::string noDescription = "--" + boundary + "\r\nContent-Disposition: form-data; name=\"file\"; filename=\"a.txt\"\r\n\r\nx\r\n"
                                          "--" + boundary + "\r\nContent-Disposition: form-data; name=\"categoryId\"\r\n\r\n4\r\n--" + boundary + "--\r\n";
        ParsedResponse form = send(p, make_request("POST", "/api/fileupload/upload2", noDescription, "multipart/form-data; boundary=" + boundary));
        if (form.status != 400 || form.json["error"] != "Description is required") { std::cerr << "[TEST] upload2 validation: " << form.body << "\n"; return 91; }
        std::cout << "[TEST] OK uploads\n";
    }

    // Security administration
    {
        if (send(p, make_request("POST", "/api/security/blacklist/not-an-ip"), "admin-token").status != 400) { std::cerr << "[TEST] invalid IP accepted\n"; return 92; }
        if (send(p, make_request("DELETE", "/api/security/blocked/10.20.30.40"), "admin-token").status != 404) { std::cerr << "[TEST] unblock of unknown IP\n"; return 93; }
        if (send(p, make_request("POST", "/api/security/blacklist/10.9.9.9"), "admin-token").status != 200) { std::cerr << "[TEST] blacklist add\n"; return 94; }
        ParsedResponse refused = send(p, make_request("GET", "/api/user/info", "", "application/json", "10.9.9.9"));
        if (refused.status != 429) { std::cerr << "[TEST] blacklisted client served\n"; return 95; }
        if (send(p, make_request("DELETE", "/api/security/blacklist/10.9.9.9"), "admin-token").status != 200) { std::cerr << "[TEST] blacklist remove\n"; return 96; }
        if (send(p, make_request("GET", "/api/user/info", "", "application/json", "10.9.9.9")).status != 200) { std::cerr << "[TEST] removed blacklist entry still refused\n"; return 97; }

        ServerLogger::logError("marker for the logs endpoint");
        ParsedResponse logs = send(p, make_request("GET", "/api/security/logs?limit=1"), "admin-token");
        if (logs.status != 200 || logs.json["totalCount"] != 1 || logs.json["logs"][0]["level"] != "ERROR") {
            std::cerr << "[TEST] logs endpoint: " << logs.body << "\n"; return 100;
        }
        if (send(p, make_request("GET", "/api/security/logs?limit=0"), "admin-token").status != 400) { std::cerr << "[TEST] zero log limit accepted\n"; return 101; }
        std::cout << "[TEST] OK security administration\n";
    }

    // Rate limiting answers 429 with the limit and window
    {
        Pipeline limited = make_pipeline(2, uploads);
        send(limited, make_request("GET", "/api/user/info", "", "application/json", "10.5.5.5"));
        send(limited, make_request("GET", "/api/user/info", "", "application/json", "10.5.5.5"));
        ParsedResponse r = send(limited, make_request("GET", "/api/user/info", "", "application/json", "10.5.5.5"));
        if (r.status != 429 || r.json["error"] != "Too many requests" || r.json["limit"] != 2 || r.json["window"] != "1 minutes") {
            std::cerr << "[TEST] 429 body: " << r.body << "\n"; return 98;
        }
        limited.clock->advance(std::chrono::seconds(61));
        if (send(limited, make_request("GET", "/api/user/info", "", "application/json", "10.5.5.5")).status != 200) { std::cerr << "[TEST] window did not slide\n"; return 99; }

        // Retry-After follows the limiter's clock, not the wall clock
        limited.clock->advance(std::chrono::hours(24 * 30));
        limited.blocks->blockIP("10.6.6.6", std::chrono::minutes(10), "manual");
        ParsedResponse blocked = send(limited, make_request("GET", "/api/user/info", "", "application/json", "10.6.6.6"));
        if (blocked.status != 429 || !blocked.hasHeader("Retry-After: 600")) {
            std::cerr << "[TEST] Retry-After: " << blocked.head << "\n"; return 104;
        }
        std::cout << "[TEST] OK rate limiting\n";
    }

    std::cout << "[TEST] OK request dispatcher\n";
    return 0;
}
