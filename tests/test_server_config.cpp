#include "test_common.h"
#include "restgate/server_config.hpp"
#include <fstream>
#include <vector>

using namespace restgate;

namespace {

std::string write_file(const std::string &dir, const std::string &name, const std::string &content) {
    std::string path = dir + "/" + name;
    std::ofstream out(path);
    out << content;
    return path;
}

bool load_args(ServerConfig &config, std::vector<std::string> args) {
    args.insert(args.begin(), "restgate-server");
    std::vector<char *> argv;
    for (auto &arg : args) argv.push_back(&arg[0]);
    return config.loadFromArgs(static_cast<int>(argv.size()), argv.data());
}

const char *kConfig = R"(server:
  port: "9000"
  host: "127.0.0.1"
  max_body_size_mb: 4
  trust_proxy_headers: true
logging:
  level: "WARN"
  quiet_mode: true
cors:
  allow_credentials: false
  max_age: 600
  allowed_origins:
    - "https://app.example"
security:
  relaxed_csp_for_docs: false
  log_directory: "audit"
rate_limit:
  default_max_requests: 50
  default_window_seconds: 30
  block_duration_minutes: 5
  max_violations_before_block: 2
  block_file: "state/blocked.json"
  endpoints:
    - path: "/api/user/login"
      max_requests: 3
      window_seconds: 60
      description: "Login attempts"
  whitelist:
    - "127.0.0.1"
  blacklist:
    - "203.0.113.9"
tokens:
  - token: "t-admin"
    name: "root"
    roles: ["Admin", "User"]
    password: "toor"
  - token: "t-reader"
    name: "reader"
)";

} // namespace

int main() {
    quiet_logs();
    const std::string dir = scratch_dir("server_config");
    const std::string file = write_file(dir, "config.yaml", kConfig);

    // Every section of the file is applied
    {
        ServerConfig config;
        if (!config.loadFromFile(file)) { std::cerr << "[TEST] config file rejected\n"; return 65; }
        if (config.port != "9000" || config.host != "127.0.0.1" || config.maxBodySizeMB != 4 || !config.trustProxyHeaders) {
            std::cerr << "[TEST] server section\n"; return 66;
        }
        if (config.logLevel != "WARN" || !config.quietMode) { std::cerr << "[TEST] logging section\n"; return 67; }
        if (config.cors.allowCredentials || config.cors.maxAge != 600 || config.cors.allowedOrigins.size() != 1) { std::cerr << "[TEST] cors section\n"; return 68; }
        if (config.relaxedCspForDocs || config.securityLog.directory != "audit") { std::cerr << "[TEST] security section\n"; return 69; }
        if (config.rateLimit.defaultMaxRequests != 50 || config.rateLimit.defaultTimeWindow != std::chrono::seconds(30) ||
            config.rateLimit.blockDurationMinutes != 5 || config.rateLimit.maxViolationsBeforeBlock != 2 ||
            config.rateLimit.blockFile != "state/blocked.json") {
            std::cerr << "[TEST] rate limit section\n"; return 70;
        }
        if (config.rateLimit.limitForPath("/api/user/login").maxRequests != 3 ||
            config.rateLimit.limitForPath("/api/user/info").maxRequests != 50) { std::cerr << "[TEST] endpoint limits\n"; return 71; }
        if (!config.rateLimit.whitelist.count("127.0.0.1") || !config.rateLimit.blacklist.count("203.0.113.9")) { std::cerr << "[TEST] ip lists\n"; return 72; }
        if (config.tokens.size() != 2 || config.tokens[0].roles.size() != 2 || config.tokens[0].password != "toor" ||
            !config.tokens[1].password.empty()) {
            std::cerr << "[TEST] tokens section\n"; return 73;
        }
        if (config.currentConfigFilePath.empty() || !config.validate()) { std::cerr << "[TEST] loaded config invalid\n"; return 74; }
        std::cout << "[TEST] OK config file\n";
    }

    // Command line arguments override the file
    {
        ServerConfig config;
        if (!load_args(config, {"-c", file, "-p", "9100", "--log-level", "DEBUG", "--cors-origin", "https://a.example",
                                "--cors-origin", "https://b.example", "--cors-methods", "GET, POST", "--disable-rate-limit"})) {
            std::cerr << "[TEST] arguments rejected\n"; return 75;
        }
        if (config.port != "9100" || config.host != "127.0.0.1" || config.logLevel != "DEBUG") { std::cerr << "[TEST] overrides\n"; return 76; }
        if (config.cors.allowedOrigins != std::vector<std::string>{"https://a.example", "https://b.example"}) { std::cerr << "[TEST] cors origins from args\n"; return 77; }
        if (config.cors.allowedMethods != std::vector<std::string>{"GET", "POST"}) { std::cerr << "[TEST] cors methods from args\n"; return 78; }
        if (config.rateLimit.enabled) { std::cerr << "[TEST] rate limiting still enabled\n"; return 79; }

        ServerConfig help;
        if (!load_args(help, {"--version"}) || !help.helpOrVersionShown) { std::cerr << "[TEST] version flag\n"; return 80; }
        std::cout << "[TEST] OK arguments\n";
    }

    // Invalid settings are refused
    {
        ServerConfig badPort;
        if (load_args(badPort, {"-c", file, "-p", "70000"})) { std::cerr << "[TEST] port out of range accepted\n"; return 81; }
        ServerConfig badLevel;
        if (load_args(badLevel, {"-c", file, "--log-level", "LOUD"})) { std::cerr << "[TEST] bad log level accepted\n"; return 82; }
        ServerConfig unknown;
        if (load_args(unknown, {"-c", file, "--frobnicate"})) { std::cerr << "[TEST] unknown argument accepted\n"; return 83; }
        ServerConfig badNumber;
        if (load_args(badNumber, {"-c", file, "--rate-limit", "many"})) { std::cerr << "[TEST] non-numeric limit accepted\n"; return 84; }

        ServerConfig broken;
        if (broken.loadFromFile(write_file(dir, "broken.yaml", "server: [unclosed"))) { std::cerr << "[TEST] malformed YAML accepted\n"; return 85; }
        ServerConfig pathless;
        if (pathless.loadFromFile(write_file(dir, "pathless.yaml", "rate_limit:\n  endpoints:\n    - max_requests: 3\n"))) {
            std::cerr << "[TEST] endpoint without path accepted\n"; return 86;
        }
        ServerConfig missing;
        if (load_args(missing, {"-c", dir + "/does-not-exist.yaml"})) { std::cerr << "[TEST] missing config file accepted\n"; return 87; }

        ServerConfig emptyToken;
        emptyToken.tokens.push_back(TokenConfig());
        if (emptyToken.validate()) { std::cerr << "[TEST] empty token accepted\n"; return 88; }
        std::cout << "[TEST] OK validation\n";
    }

    std::cout << "[TEST] OK server config\n";
    return 0;
}
