#pragma once
#include "restgate/clock.hpp"
#include "restgate/http/body_reader.hpp"
#include "restgate/http/http_request.hpp"
#include "restgate/logger.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

// Clock the test moves by hand
class ManualClock : public restgate::Clock {
public:
    ManualClock() : now_(std::chrono::system_clock::now()) {}
    time_point now() const override { return now_; }
    void advance(std::chrono::seconds by) { now_ += by; }
private:
    time_point now_;
};

struct ParsedResponse {
    int status = 0;
    std::string head;
    std::string body;
    nlohmann::json json;

    bool hasHeader(const std::string &line) const { return head.find(line) != std::string::npos; }
};

inline ParsedResponse parse_response(const std::string &raw) {
    ParsedResponse r;
    size_t headEnd = raw.find("\r\n\r\n");
    r.head = raw.substr(0, headEnd);
    r.body = headEnd == std::string::npos ? "" : raw.substr(headEnd + 4);
    if (raw.size() > 12) r.status = std::atoi(raw.substr(9, 3).c_str());
    r.json = nlohmann::json::parse(r.body, nullptr, false);
    return r;
}

// Request with an in-memory body source, as the server would hand it over
inline restgate::http::HttpRequest make_request(const std::string &method, const std::string &target,
                                               const std::string &body = "",
                                               const std::string &contentType = "application/json",
                                               const std::string &ip = "10.0.0.1") {
    restgate::http::HttpRequest request(method, target);
    request.peerIP = ip;
    request.clientIP = ip;
    if (!body.empty()) {
        request.setHeader("Content-Type", contentType);
        request.setHeader("Content-Length", std::to_string(body.size()));
    }
    request.setBodySource(std::make_shared<restgate::http::StringByteSource>(body));
    return request;
}

// Fresh scratch directory under the system temp dir
inline std::string scratch_dir(const std::string &name) {
    std::filesystem::path dir = std::filesystem::temp_directory_path() / ("restgate_test_" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir.string();
}

inline void quiet_logs() {
    ServerLogger::instance().setConsoleOutput(false);
    ServerLogger::instance().setLevel(LogLevel::SERVER_ERROR);
}
