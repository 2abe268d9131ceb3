#include "test_common.h"
#include "restgate/auth/ip_block_list.hpp"
#include "restgate/auth/rate_limiter.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace restgate;
using namespace restgate::auth;

namespace {

RateLimitConfig small_config(size_t maxRequests, int windowSeconds) {
    RateLimitConfig config;
    config.clearEndpointLimits();
    config.defaultMaxRequests = maxRequests;
    config.defaultTimeWindow = std::chrono::seconds(windowSeconds);
    config.blockFile = "";
    return config;
}

} // namespace

int main() {
    quiet_logs();

    // Sliding window: 3 per 60 s, the 4th is refused, a request after the window passes
    {
        auto clock = std::make_shared<ManualClock>();
        auto blocks = std::make_shared<IPBlockList>("", clock, nullptr);
        RateLimitConfig config = small_config(3, 60);
        config.maxViolationsBeforeBlock = 5;
        RateLimiter limiter(config, blocks, nullptr, clock);

        for (int i = 0; i < 3; ++i) {
            if (!limiter.check("10.0.0.1", "/api/user").allowed) { std::cerr << "[TEST] request " << i + 1 << " refused\n"; return 65; }
            clock->advance(std::chrono::seconds(1));
        }
        RateLimiter::RateLimitResult fourth = limiter.check("10.0.0.1", "/api/user");
        if (fourth.allowed) { std::cerr << "[TEST] 4th request allowed\n"; return 66; }
        if (fourth.limit.maxRequests != 3 || fourth.blockedUntil) { std::cerr << "[TEST] unexpected limit or block on first violation\n"; return 67; }

        // Another client is counted separately
        if (!limiter.check("10.0.0.2", "/api/user").allowed) { std::cerr << "[TEST] second client refused\n"; return 68; }

        clock->advance(std::chrono::seconds(61));
        if (!limiter.check("10.0.0.1", "/api/user").allowed) { std::cerr << "[TEST] request after window refused\n"; return 69; }
        std::cout << "[TEST] OK sliding window\n";
    }

    // Escalation: blocked at the threshold, blocked longer the second time
    {
        auto clock = std::make_shared<ManualClock>();
        auto blocks = std::make_shared<IPBlockList>("", clock, nullptr);
        RateLimitConfig config = small_config(1, 60);
        config.maxViolationsBeforeBlock = 3;
        config.blockDurationMinutes = 15;
        RateLimiter limiter(config, blocks, nullptr, clock);

        auto run_until_block = [&]() -> std::optional<Clock::time_point> {
            limiter.check("10.0.0.9", "/api/user");
            for (int i = 0; i < 3; ++i) {
                RateLimiter::RateLimitResult r = limiter.check("10.0.0.9", "/api/user");
                if (r.blockedUntil) return r.blockedUntil;
            }
            return std::nullopt;
        };

        const auto start = clock->now();
        auto firstBlock = run_until_block();
        if (!firstBlock) { std::cerr << "[TEST] no block at threshold\n"; return 70; }
        if (*firstBlock - start != std::chrono::minutes(15)) { std::cerr << "[TEST] first block is not 15 minutes\n"; return 71; }
        if (!blocks->isBlocked("10.0.0.9")) { std::cerr << "[TEST] block list not updated\n"; return 72; }
        if (limiter.check("10.0.0.9", "/api/other").reason != "IP is temporarily blocked") { std::cerr << "[TEST] blocked IP not refused\n"; return 73; }

        if (!limiter.unblockIP("10.0.0.9")) { std::cerr << "[TEST] unblock failed\n"; return 74; }
        const auto restart = clock->now();
        auto secondBlock = run_until_block();
        if (!secondBlock) { std::cerr << "[TEST] no second block\n"; return 75; }
        if (*secondBlock - restart <= *firstBlock - start) { std::cerr << "[TEST] second block did not escalate\n"; return 76; }
        std::cout << "[TEST] OK escalation\n";
    }

    // Whitelisted addresses are never limited; blacklisted ones always are
    {
        auto clock = std::make_shared<ManualClock>();
        auto blocks = std::make_shared<IPBlockList>("", clock, nullptr);
        RateLimitConfig config = small_config(1, 60);
        config.whitelist.insert("192.168.1.5");
        RateLimiter limiter(config, blocks, nullptr, clock);

        for (int i = 0; i < 20; ++i) {
            if (!limiter.check("192.168.1.5", "/api/user").allowed) { std::cerr << "[TEST] whitelisted IP refused\n"; return 77; }
        }
        if (blocks->isBlocked("192.168.1.5")) { std::cerr << "[TEST] whitelisted IP blocked\n"; return 78; }

        limiter.addToBlacklist("172.16.0.1");
        if (limiter.check("172.16.0.1", "/api/user").allowed) { std::cerr << "[TEST] blacklisted IP allowed\n"; return 79; }
        if (limiter.check("", "/api/user").allowed) { std::cerr << "[TEST] empty IP allowed\n"; return 80; }
        std::cout << "[TEST] OK whitelist and blacklist\n";
    }

    // Endpoint limits: the longest matching prefix applies
    {
        RateLimitConfig config = small_config(100, 60);
        config.setEndpointLimit("/api/auth/login", 5, std::chrono::minutes(1), "login");
        config.setEndpointLimit("/api/", 50, std::chrono::minutes(1), "api");
        if (config.limitForPath("/api/auth/login").maxRequests != 5) { std::cerr << "[TEST] exact endpoint limit not used\n"; return 81; }
        if (config.limitForPath("/api/user/info").maxRequests != 50) { std::cerr << "[TEST] prefix endpoint limit not used\n"; return 82; }
        if (config.limitForPath("/health").maxRequests != 100) { std::cerr << "[TEST] default limit not used\n"; return 83; }
        std::cout << "[TEST] OK endpoint limits\n";
    }

    // Concurrent checks from one client admit exactly the configured number
    {
        auto clock = std::make_shared<ManualClock>();
        auto blocks = std::make_shared<IPBlockList>("", clock, nullptr);
        RateLimitConfig config = small_config(25, 60);
        config.maxViolationsBeforeBlock = 100000;
        RateLimiter limiter(config, blocks, nullptr, clock);

        std::atomic<int> accepted{0};
        std::vector<std::thread> workers;
        for (int t = 0; t < 8; ++t) {
            workers.emplace_back([&] {
                for (int i = 0; i < 50; ++i) {
                    if (limiter.check("10.0.0.50", "/api/user", "agent", "").allowed) ++accepted;
                }
            });
        }
        for (auto &worker : workers) worker.join();
        if (accepted != 25) { std::cerr << "[TEST] " << accepted << " concurrent requests accepted, expected 25\n"; return 84; }
        std::cout << "[TEST] OK concurrent checks\n";
    }

    std::cout << "[TEST] OK rate limiter\n";
    return 0;
}
