#pragma once

#include <string>
#include <memory>

#include "export.hpp"
#include "server_config.hpp"
#include "routing/controller.hpp"

namespace restgate
{

    // Forward declarations
    namespace auth
    {
        class AuthMiddleware;
        class IPBlockList;
        class ITokenVerifier;
        class RateLimiter;
        class SecurityLogger;
    }
    namespace routing
    {
        class RouteRegistry;
    }

    /**
     * @brief Process-wide owner of the server components
     *
     * init() builds the block list, security logger, rate limiter, token verifier,
     * CORS handler and route registry from a ServerConfig. Controllers are added
     * afterwards; start() freezes the route table, binds the socket and runs the
     * accept loop on a background thread. shutdown() tears everything down in
     * reverse order.
     */
    class RESTGATE_SERVER_API ServerAPI
    {
    public:
        // Singleton pattern
        static ServerAPI &instance();

        // Delete copy/move constructors and assignments
        ServerAPI(const ServerAPI &) = delete;
        ServerAPI &operator=(const ServerAPI &) = delete;
        ServerAPI(ServerAPI &&) = delete;
        ServerAPI &operator=(ServerAPI &&) = delete;

        /**
         * @brief Build every component from the configuration
         * @param verifier Token verifier to use; null builds a StaticTokenVerifier from config.tokens
         * @return False when a component could not be created
         */
        bool init(const ServerConfig &config, std::shared_ptr<const auth::ITokenVerifier> verifier = nullptr);

        /**
         * @brief Register a controller's routes
         * @throws std::runtime_error when called before init() or after start()
         * @throws std::invalid_argument for a duplicate route prefix
         */
        void addController(routing::ControllerDescriptor controller);

        /**
         * @brief Bind the listening socket and start the accept loop in the background
         */
        bool start();

        void shutdown();

        bool isRunning() const;

        // Component access, valid after init()
        const ServerConfig &getConfig() const;
        std::shared_ptr<auth::RateLimiter> getRateLimiter() const;
        std::shared_ptr<auth::IPBlockList> getBlockList() const;
        std::shared_ptr<auth::SecurityLogger> getSecurityLogger() const;
        std::shared_ptr<const routing::RouteRegistry> getRouteRegistry() const;

    private:
        ServerAPI();
        ~ServerAPI();

        class Impl;
#pragma warning(push)
#pragma warning(disable: 4251)
        std::unique_ptr<Impl> pImpl;
#pragma warning(pop)
    };

} // namespace restgate
