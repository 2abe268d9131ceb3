#pragma once

#include <string>
#include <vector>
#include "export.hpp"
#include "auth/cors_handler.hpp"
#include "auth/rate_limit_config.hpp"
#include "auth/security_logger.hpp"

namespace restgate {

/**
 * @brief A bearer token accepted by the built-in token verifier
 */
struct TokenConfig {
    std::string token;
    std::string name;
    std::vector<std::string> roles;
    std::string password;   // Lets the sample login actions exchange name/password for this token
};

/**
 * @brief Server startup configuration
 */
struct RESTGATE_SERVER_API ServerConfig {
    // Basic server settings
#pragma warning(push)
#pragma warning(disable: 4251)
    std::string port = "8080";
    std::string host = "0.0.0.0";
#pragma warning(pop)
    size_t maxBodySizeMB = 10;          // Largest accepted request body
    bool trustProxyHeaders = false;     // Take the client IP from X-Forwarded-For and friends

    // Logging configuration
#pragma warning(push)
#pragma warning(disable: 4251)
    std::string logLevel = "INFO";    // DEBUG, INFO, WARN, ERROR
    std::string logFile = "";         // Empty means console only
#pragma warning(pop)
    bool quietMode = false;           // Suppress routine operational messages
    bool showRequestDetails = true;   // Show detailed request processing logs
    size_t logHistorySize = 1000;     // Entries kept in memory for the logs endpoint

    // Response security
    bool relaxedCspForDocs = true;

#pragma warning(push)
#pragma warning(disable: 4251)
    auth::CorsHandler::Config cors;
    auth::SecurityLogger::Config securityLog;
    auth::RateLimitConfig rateLimit;
    std::vector<TokenConfig> tokens;
#pragma warning(pop)

    // Internal flags
    bool helpOrVersionShown = false;  // Tracks if help/version was displayed

#pragma warning(push)
#pragma warning(disable: 4251)
    std::string currentConfigFilePath; // Path to the loaded config file, empty when none
#pragma warning(pop)

    ServerConfig() = default;

    /**
     * @brief Load configuration from command line arguments
     *
     * A file named with -c/--config is loaded first, otherwise config.yaml in the
     * working directory or /etc/restgate/config.yaml if present. Remaining
     * arguments override file values.
     * @return True if configuration was loaded successfully and is valid
     */
    bool loadFromArgs(int argc, char* argv[]);

    /**
     * @brief Load configuration from YAML file
     * @param configFile Path to configuration file
     * @return True if configuration was loaded successfully
     */
    bool loadFromFile(const std::string& configFile);

    /**
     * @brief Validate the configuration
     * @return True if configuration is valid
     */
    bool validate() const;

    /**
     * @brief Print configuration summary
     */
    void printSummary() const;

    /**
     * @brief Print help message
     */
    static void printHelp();

    /**
     * @brief Print version information
     */
    static void printVersion();
};

} // namespace restgate
