#include "restgate/server_api.hpp"
#include "restgate/server.hpp"
#include "restgate/auth/auth_middleware.hpp"
#include "restgate/auth/cors_handler.hpp"
#include "restgate/auth/ip_block_list.hpp"
#include "restgate/auth/rate_limiter.hpp"
#include "restgate/auth/security_logger.hpp"
#include "restgate/auth/token_verifier.hpp"
#include "restgate/http/response_writer.hpp"
#include "restgate/routing/request_dispatcher.hpp"
#include "restgate/routing/route_registry.hpp"
#include "restgate/logger.hpp"
#include <memory>
#include <stdexcept>
#include <thread>

namespace restgate
{

    class ServerAPI::Impl
    {
    public:
        ServerConfig config;
        bool initialized = false;

        std::shared_ptr<auth::SecurityLogger> securityLogger;
        std::shared_ptr<auth::IPBlockList> blockList;
        std::shared_ptr<auth::RateLimiter> rateLimiter;
        std::shared_ptr<const auth::ITokenVerifier> verifier;
        std::shared_ptr<routing::RouteRegistry> registry;

        std::unique_ptr<Server> server;
        std::thread serverThread;

        void applyLogging()
        {
            auto &logger = ServerLogger::instance();
            logger.setLevel(ServerLogger::parseLevel(config.logLevel));
            logger.setQuietMode(config.quietMode);
            logger.setShowRequestDetails(config.showRequestDetails);
            logger.setHistoryLimit(config.logHistorySize);
            if (!config.logFile.empty() && !logger.setLogFile(config.logFile))
            {
                ServerLogger::logWarning("Could not open log file %s, logging to console only", config.logFile.c_str());
            }
        }

        std::shared_ptr<const auth::ITokenVerifier> buildTokenVerifier() const
        {
            auto staticVerifier = std::make_shared<auth::StaticTokenVerifier>();
            for (const auto &token : config.tokens)
            {
                auth::Identity identity;
                identity.name = token.name;
                identity.roles = token.roles;
                staticVerifier->addToken(token.token, identity);
            }
            ServerLogger::logInfo("Loaded %zu bearer token(s)", staticVerifier->size());
            return staticVerifier;
        }
    };

    ServerAPI::ServerAPI() : pImpl(std::make_unique<Impl>()) {}

    ServerAPI::~ServerAPI()
    {
        shutdown();
    }

    ServerAPI &ServerAPI::instance()
    {
        static ServerAPI instance;
        return instance;
    }

    bool ServerAPI::init(const ServerConfig &config, std::shared_ptr<const auth::ITokenVerifier> verifier)
    {
        try
        {
            pImpl->config = config;
            pImpl->applyLogging();

            ServerLogger::logInfo("Initializing server on %s:%s", config.host.c_str(), config.port.c_str());

            pImpl->securityLogger = std::make_shared<auth::SecurityLogger>(config.securityLog);
            if (config.securityLog.enabled)
            {
                pImpl->securityLogger->rotateLogs(config.securityLog.maxFileSizeMB);
                pImpl->securityLogger->pruneOldLogs(config.securityLog.retentionDays);
            }
            pImpl->blockList = std::make_shared<auth::IPBlockList>(config.rateLimit.blockFile, Clock::system(),
                                                                   pImpl->securityLogger);
            size_t restored = pImpl->blockList->load();
            if (restored > 0)
            {
                ServerLogger::logInfo("Restored %zu blocked IP(s) from %s", restored, config.rateLimit.blockFile.c_str());
            }

            pImpl->rateLimiter = std::make_shared<auth::RateLimiter>(config.rateLimit, pImpl->blockList,
                                                                     pImpl->securityLogger);
            pImpl->verifier = verifier ? std::move(verifier) : pImpl->buildTokenVerifier();
            pImpl->registry = std::make_shared<routing::RouteRegistry>();
            pImpl->initialized = true;

            ServerLogger::logInfo("Rate limiting %s: %zu requests per %lld s by default",
                                  config.rateLimit.enabled ? "enabled" : "disabled",
                                  config.rateLimit.defaultMaxRequests,
                                  static_cast<long long>(config.rateLimit.defaultTimeWindow.count()));
            return true;
        }
        catch (const std::exception &ex)
        {
            ServerLogger::logError("Failed to initialize server: %s", ex.what());
            return false;
        }
    }

    void ServerAPI::addController(routing::ControllerDescriptor controller)
    {
        if (!pImpl->initialized)
        {
            throw std::runtime_error("Server not initialized - call init() first");
        }
        if (pImpl->server)
        {
            throw std::runtime_error("Controllers must be added before start()");
        }
        pImpl->registry->registerController(std::move(controller));
    }

    bool ServerAPI::start()
    {
        if (!pImpl->initialized)
        {
            ServerLogger::logError("Server not initialized - call init() first");
            return false;
        }
        if (pImpl->server)
        {
            ServerLogger::logWarning("Server already started");
            return true;
        }

        try
        {
            const ServerConfig &config = pImpl->config;

            auto middleware = std::make_shared<const auth::AuthMiddleware>(pImpl->rateLimiter, pImpl->verifier);
            auto cors = std::make_shared<const auth::CorsHandler>(config.cors);

            http::ResponseWriterOptions writerOptions;
            writerOptions.relaxedCspForDocs = config.relaxedCspForDocs;
            auto writer = std::make_shared<const http::ResponseWriter>(cors, writerOptions);

            routing::RequestDispatcherOptions dispatcherOptions;
            dispatcherOptions.maxBodySizeMB = config.maxBodySizeMB;
            auto dispatcher = std::make_shared<const routing::RequestDispatcher>(pImpl->registry, middleware, writer,
                                                                                dispatcherOptions);

            ServerOptions serverOptions;
            serverOptions.trustProxyHeaders = config.trustProxyHeaders;

            auto server = std::make_unique<Server>(config.port, config.host, dispatcher, serverOptions);
            if (!server->init())
            {
                ServerLogger::logError("Failed to initialize server");
                return false;
            }
            pImpl->server = std::move(server);

            ServerLogger::logInfo("%zu controller(s) registered", pImpl->registry->size());
            pImpl->rateLimiter->startSweeper();

            // Start server in a background thread
            Server *running = pImpl->server.get();
            pImpl->serverThread = std::thread([running]()
                                              {
                ServerLogger::logInfo("Starting server main loop");
                running->run(); });
            return true;
        }
        catch (const std::exception &ex)
        {
            ServerLogger::logError("Failed to start server: %s", ex.what());
            return false;
        }
    }

    void ServerAPI::shutdown()
    {
        if (pImpl->server)
        {
            ServerLogger::logInfo("Shutting down server");
            pImpl->server->stop();
            if (pImpl->serverThread.joinable())
            {
                pImpl->serverThread.join();
            }

            ServerLogger::logInfo("Shutting down HTTP server");
            pImpl->server.reset();
        }

        if (pImpl->rateLimiter)
        {
            pImpl->rateLimiter->stopSweeper();
        }
        if (pImpl->initialized)
        {
            pImpl->initialized = false;
            ServerLogger::logInfo("Server shutdown complete");
        }
    }

    bool ServerAPI::isRunning() const
    {
        return pImpl->server && pImpl->server->isRunning();
    }

    const ServerConfig &ServerAPI::getConfig() const
    {
        return pImpl->config;
    }

    std::shared_ptr<auth::RateLimiter> ServerAPI::getRateLimiter() const
    {
        return pImpl->rateLimiter;
    }

    std::shared_ptr<auth::IPBlockList> ServerAPI::getBlockList() const
    {
        return pImpl->blockList;
    }

    std::shared_ptr<auth::SecurityLogger> ServerAPI::getSecurityLogger() const
    {
        return pImpl->securityLogger;
    }

    std::shared_ptr<const routing::RouteRegistry> ServerAPI::getRouteRegistry() const
    {
        return pImpl->registry;
    }

} // namespace restgate
