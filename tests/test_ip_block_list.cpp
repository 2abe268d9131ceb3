#include "test_common.h"
#include "restgate/auth/ip_block_list.hpp"
#include "restgate/auth/security_logger.hpp"
#include <atomic>
#include <fstream>
#include <thread>

using namespace restgate;
using namespace restgate::auth;

int main() {
    quiet_logs();
    const std::string dir = scratch_dir("block_list");
    const std::string file = dir + "/blocked_ips.json";

    SecurityLogger::Config logConfig;
    logConfig.directory = dir + "/logs";
    auto clock = std::make_shared<ManualClock>();
    auto securityLog = std::make_shared<SecurityLogger>(logConfig, clock);

    {
        IPBlockList list(file, clock, securityLog);
        list.blockIP("10.1.1.1", std::chrono::minutes(1), "short", 3);
        list.blockIP("10.1.1.2", std::chrono::hours(1), "long", 6);
        if (list.getBlockedCount() != 2) { std::cerr << "[TEST] expected two blocks\n"; return 65; }

        auto info = list.getBlockInfo("10.1.1.2");
        if (!info || info->reason != "long" || info->violationCount != 6) { std::cerr << "[TEST] block info mismatch\n"; return 66; }
    }

    // Records survive a restart; expired ones are dropped on load
    std::ifstream persisted(file);
    if (!persisted.is_open()) { std::cerr << "[TEST] block file not written\n"; return 67; }
    nlohmann::json records = nlohmann::json::parse(persisted);
    if (!records.is_array() || records.size() != 2 || !records[0].contains("blockedUntil")) { std::cerr << "[TEST] block file layout\n"; return 68; }

    clock->advance(std::chrono::seconds(120));
    IPBlockList reloaded(file, clock, securityLog);
    if (reloaded.load() != 1) { std::cerr << "[TEST] expected one live record after reload\n"; return 69; }
    if (reloaded.isBlocked("10.1.1.1")) { std::cerr << "[TEST] expired block still active\n"; return 70; }
    if (!reloaded.isBlocked("10.1.1.2")) { std::cerr << "[TEST] live block lost\n"; return 71; }

    // Expiry is checked on lookup
    clock->advance(std::chrono::hours(2));
    if (reloaded.isBlocked("10.1.1.2")) { std::cerr << "[TEST] block outlived its expiry\n"; return 72; }
    if (reloaded.getBlockedCount() != 0) { std::cerr << "[TEST] expired record not removed\n"; return 73; }

    reloaded.blockIP("10.1.1.3", std::chrono::minutes(5), "manual");
    if (!reloaded.unblockIP("10.1.1.3", "test")) { std::cerr << "[TEST] unblock reported nothing removed\n"; return 74; }
    if (reloaded.unblockIP("10.1.1.3", "test")) { std::cerr << "[TEST] second unblock removed something\n"; return 75; }

    // A missing file loads nothing
    IPBlockList missing(dir + "/nope.json", clock, nullptr);
    if (missing.load() != 0) { std::cerr << "[TEST] missing file loaded records\n"; return 76; }

    if (!std::filesystem::exists(logConfig.directory + "/" + SecurityLogger::BLOCKED_IPS_LOG_FILE)) {
        std::cerr << "[TEST] block events not written to the security log\n"; return 77;
    }

    // Expiry sweeps only drop records that are still expired
    {
        IPBlockList sweep("", clock, nullptr);
        sweep.blockIP("10.2.2.1", std::chrono::seconds(0), "stale");
        sweep.blockIP("10.2.2.2", std::chrono::minutes(5), "fresh");
        if (sweep.clearExpiredBlocks() != 1 || !sweep.getBlockInfo("10.2.2.2")) { std::cerr << "[TEST] sweep removed a live block\n"; return 78; }
    }

    // An expiry check racing a re-block never erases the refreshed record
    {
        IPBlockList shared("", clock, nullptr);
        std::atomic<bool> done{false};
        std::thread checker([&] {
            while (!done) shared.isBlocked("10.3.3.3");
        });
        int lost = 0;
        for (int i = 0; i < 2000; ++i) {
            shared.blockIP("10.3.3.3", std::chrono::seconds(0), "expired at once");
            shared.blockIP("10.3.3.3", std::chrono::hours(1), "refreshed");
            if (!shared.getBlockInfo("10.3.3.3")) ++lost;
            shared.unblockIP("10.3.3.3", "reset");
        }
        done = true;
        checker.join();
        if (lost != 0) { std::cerr << "[TEST] refreshed block erased " << lost << " times\n"; return 79; }
    }

    std::cout << "[TEST] OK ip block list\n";
    return 0;
}
