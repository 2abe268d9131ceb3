#include <iostream>
#include <string>
#include <chrono>
#include <thread>
#include <csignal>
#include <atomic>
#include <memory>
#include "restgate/server_api.hpp"
#include "restgate/server_config.hpp"
#include "restgate/logger.hpp"
#include "restgate/routing/route_registry.hpp"
#include "restgate/controllers/admin_controller.hpp"
#include "restgate/controllers/file_upload_controller.hpp"
#include "restgate/controllers/login_directory.hpp"
#include "restgate/controllers/security_controller.hpp"
#include "restgate/controllers/user_controller.hpp"

using namespace restgate;

// Global flag for graceful shutdown
std::atomic<bool> keep_running{true};

// Signal handler for graceful shutdown
void signal_handler(int signal)
{
    std::cout << "\nReceived signal " << signal << ", shutting down gracefully..." << std::endl;
    keep_running = false;
}

int main(int argc, char *argv[])
{
    // Load configuration from command line arguments
    ServerConfig config;
    if (!config.loadFromArgs(argc, argv))
    {
        return 1;
    }
    if (config.helpOrVersionShown)
    {
        return 0;
    }

    // Set up signal handlers for graceful shutdown
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
#ifdef _WIN32
    std::signal(SIGBREAK, signal_handler);
#endif

    // Print startup banner
    std::cout << "Starting restgate Server v1.0.0..." << std::endl;
    config.printSummary();

    ServerAPI &server = ServerAPI::instance();
    if (!server.init(config))
    {
        std::cerr << "Failed to initialize server" << std::endl;
        return 1;
    }

    // Explicit registration table
    try
    {
        auto logins = controllers::LoginDirectory::fromTokens(config.tokens);
        ServerLogger::logInfo("%zu account(s) can use the sample login actions", logins->size());

        server.addController(std::make_shared<controllers::UserController>(logins)->describe());
        server.addController(std::make_shared<controllers::AdminController>(logins)->describe());
        server.addController(std::make_shared<controllers::FileUploadController>()->describe());
        server.addController(std::make_shared<controllers::SecurityController>(server.getRateLimiter())->describe());
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Failed to register controllers: " << ex.what() << std::endl;
        server.shutdown();
        return 1;
    }

    if (!server.start())
    {
        std::cerr << "Failed to start server on " << config.host << ":" << config.port << std::endl;
        server.shutdown();
        return 1;
    }

    std::cout << "\nServer started successfully!" << std::endl;
    std::cout << "Server URL: http://" << config.host << ":" << config.port << std::endl;

    std::cout << "\nRegistered routes:" << std::endl;
    for (const auto &route : server.getRouteRegistry()->registeredRoutes())
    {
        std::cout << "  /" << route << std::endl;
    }

    std::cout << "\nPress Ctrl+C to stop the server..." << std::endl;

    // Main server loop
    while (keep_running)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "Shutting down server..." << std::endl;
    server.shutdown();
    std::cout << "Server stopped." << std::endl;

    return 0;
}
