#include "test_common.h"
#include "restgate/routing/route_registry.hpp"
#include <stdexcept>

using namespace restgate;
using namespace restgate::routing;

namespace {

http::ActionResult noop(RequestContext &, const Arguments &) { return http::ActionResult::ok(); }

ControllerDescriptor controller(const std::string &type, const std::string &route) {
    ControllerBuilder builder(type);
    builder.route(route);
    builder.get().named("root").handle(noop);
    builder.get("info").named("info").handle(noop);
    builder.get("{id}").named("byId").handle(noop);
    builder.put("{user_id}/Orders/{orderId}").named("order").handle(noop);
    return builder.build();
}

} // namespace

int main() {
    quiet_logs();

    RouteRegistry registry;
    registry.registerController(controller("UserController", "api/[controller]"));
    registry.registerController(controller("UserAdminController", "api/user/admin"));
    registry.registerController(controller("HealthController", "/Health/"));

    if (registry.size() != 3) { std::cerr << "[TEST] expected 3 controllers\n"; return 65; }

    // Duplicate prefixes are rejected
    bool threw = false;
    try { registry.registerController(controller("Other", "API/User")); }
    catch (const std::invalid_argument &) { threw = true; }
    if (!threw) { std::cerr << "[TEST] duplicate prefix accepted\n"; return 66; }

    // Longest prefix wins
    auto admin = registry.findController("/api/user/admin/info");
    if (!admin || admin->prefix != "api/user/admin" || admin->subPath != "/info") { std::cerr << "[TEST] specific prefix not chosen\n"; return 67; }
    auto user = registry.findController("/API/User/info");
    if (!user || user->prefix != "api/user" || user->controller->typeName != "UserController") { std::cerr << "[TEST] case-insensitive prefix failed\n"; return 68; }
    auto health = registry.findController("/health");
    if (!health || health->subPath != "/") { std::cerr << "[TEST] bare prefix sub-path should be '/'\n"; return 69; }
    if (registry.findController("/api/usr/info") || registry.findController("/")) { std::cerr << "[TEST] unknown path matched\n"; return 70; }
    // A prefix must end on a segment boundary
    if (registry.findController("/api/username")) { std::cerr << "[TEST] partial segment matched\n"; return 71; }

    // Method matching: segment counts must agree, literals beat later templates in registration order
    const ControllerDescriptor &users = *user->controller;
    auto root = RouteRegistry::matchMethod(users, "GET", "/");
    if (!root || root->action->name != "root") { std::cerr << "[TEST] root action not matched\n"; return 72; }
    auto info = RouteRegistry::matchMethod(users, "get", "/INFO");
    if (!info || info->action->name != "info") { std::cerr << "[TEST] literal action not matched\n"; return 73; }
    auto byId = RouteRegistry::matchMethod(users, "GET", "/42");
    if (!byId || byId->action->name != "byId" || byId->routeParams.at("id") != "42") { std::cerr << "[TEST] placeholder not captured\n"; return 74; }
    if (RouteRegistry::matchMethod(users, "GET", "/42/extra")) { std::cerr << "[TEST] longer sub-path matched a shorter template\n"; return 75; }
    if (RouteRegistry::matchMethod(users, "DELETE", "/42")) { std::cerr << "[TEST] wrong verb matched\n"; return 76; }

    // Captures keep the request text; names are lowercased
    auto order = RouteRegistry::matchMethod(users, "PUT", "/AbC-7/orders/X_9");
    if (!order || order->routeParams.at("user_id") != "AbC-7" || order->routeParams.at("orderid") != "X_9") {
        std::cerr << "[TEST] captures altered\n"; return 77;
    }

    auto routes = registry.registeredRoutes();
    if (routes.size() != 3 || routes.front() != "api/user/admin") { std::cerr << "[TEST] route listing not ordered by specificity\n"; return 78; }

    if (RouteRegistry::normalizePrefix("/API/User/") != "api/user") { std::cerr << "[TEST] prefix normalization\n"; return 79; }

    // Builders refuse actions without a handler
    threw = false;
    try {
        ControllerBuilder incomplete("BrokenController");
        incomplete.get("x");
        incomplete.build();
    } catch (const std::invalid_argument &) { threw = true; }
    if (!threw) { std::cerr << "[TEST] action without handler accepted\n"; return 80; }

    std::cout << "[TEST] OK route registry\n";
    return 0;
}
