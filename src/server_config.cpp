#include "restgate/server_config.hpp"
#include "restgate/logger.hpp"
#include "restgate/utils.hpp"
#include <yaml-cpp/yaml.h>
#include <iostream>
#include <fstream>
#include <filesystem>

namespace restgate
{
    namespace
    {
        const char *kVersion = "1.0.0";

        std::vector<std::string> readStringList(const YAML::Node &node)
        {
            std::vector<std::string> values;
            for (const auto &item : node)
            {
                values.push_back(item.as<std::string>());
            }
            return values;
        }
    } // namespace

    bool ServerConfig::loadFromArgs(int argc, char *argv[])
    {
        // Explicit config file first, so the remaining arguments can override it
        std::string configFile;
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            if ((arg == "-c" || arg == "--config") && i + 1 < argc)
            {
                configFile = argv[i + 1];
                break;
            }
        }

        if (!configFile.empty())
        {
            if (!loadFromFile(configFile))
            {
                std::cerr << "Failed to load configuration from " << configFile << std::endl;
                return false;
            }
        }
        else
        {
            for (const char *candidate : {"config.yaml", "/etc/restgate/config.yaml"})
            {
                std::ifstream probe(candidate);
                if (probe.good())
                {
                    probe.close();
                    if (loadFromFile(candidate))
                    {
                        break;
                    }
                }
            }
        }

        try
        {
            bool corsOriginsFromArgs = false;

            for (int i = 1; i < argc; ++i)
            {
                std::string arg = argv[i];

                if (arg == "-h" || arg == "--help")
                {
                    printHelp();
                    helpOrVersionShown = true;
                    return true;
                }
                else if (arg == "-v" || arg == "--version")
                {
                    printVersion();
                    helpOrVersionShown = true;
                    return true;
                }

                // Basic server options
                else if ((arg == "-c" || arg == "--config") && i + 1 < argc)
                {
                    ++i; // Already loaded
                }
                else if ((arg == "-p" || arg == "--port") && i + 1 < argc)
                {
                    port = argv[++i];
                }
                else if (arg == "--host" && i + 1 < argc)
                {
                    host = argv[++i];
                }
                else if (arg == "--max-body-mb" && i + 1 < argc)
                {
                    maxBodySizeMB = std::stoul(argv[++i]);
                }
                else if (arg == "--trust-proxy")
                {
                    trustProxyHeaders = true;
                }

                // Logging options
                else if (arg == "--log-level" && i + 1 < argc)
                {
                    logLevel = argv[++i];
                }
                else if (arg == "--log-file" && i + 1 < argc)
                {
                    logFile = argv[++i];
                }
                else if (arg == "--quiet")
                {
                    quietMode = true;
                }

                // Rate limiting options
                else if (arg == "--rate-limit" && i + 1 < argc)
                {
                    rateLimit.defaultMaxRequests = std::stoul(argv[++i]);
                }
                else if (arg == "--rate-window" && i + 1 < argc)
                {
                    rateLimit.defaultTimeWindow = std::chrono::seconds(std::stoi(argv[++i]));
                }
                else if (arg == "--disable-rate-limit")
                {
                    rateLimit.enabled = false;
                }
                else if (arg == "--block-file" && i + 1 < argc)
                {
                    rateLimit.blockFile = argv[++i];
                }

                // CORS options
                else if (arg == "--cors-origin" && i + 1 < argc)
                {
                    if (!corsOriginsFromArgs)
                    {
                        cors.allowedOrigins.clear();
                        corsOriginsFromArgs = true;
                    }
                    cors.allowedOrigins.push_back(argv[++i]);
                }
                else if (arg == "--cors-methods" && i + 1 < argc)
                {
                    cors.allowedMethods.clear();
                    for (const auto &method : split(argv[++i], ',', true))
                        cors.allowedMethods.push_back(trim(method));
                }
                else
                {
                    std::cerr << "Unknown or incomplete argument: " << arg << std::endl;
                    std::cerr << "Use --help for usage information" << std::endl;
                    return false;
                }
            }
        }
        catch (const std::exception &ex)
        {
            std::cerr << "Error parsing command line arguments: " << ex.what() << std::endl;
            return false;
        }

        return validate();
    }

    bool ServerConfig::loadFromFile(const std::string &configFile)
    {
        try
        {
            YAML::Node config = YAML::LoadFile(configFile);

            // Basic server settings
            if (config["server"])
            {
                auto server = config["server"];
                if (server["port"])
                    port = server["port"].as<std::string>();
                if (server["host"])
                    host = server["host"].as<std::string>();
                if (server["max_body_size_mb"])
                    maxBodySizeMB = server["max_body_size_mb"].as<size_t>();
                if (server["trust_proxy_headers"])
                    trustProxyHeaders = server["trust_proxy_headers"].as<bool>();
            }

            // Logging settings
            if (config["logging"])
            {
                auto logging = config["logging"];
                if (logging["level"])
                    logLevel = logging["level"].as<std::string>();
                if (logging["file"])
                    logFile = logging["file"].as<std::string>();
                if (logging["quiet_mode"])
                    quietMode = logging["quiet_mode"].as<bool>();
                if (logging["show_request_details"])
                    showRequestDetails = logging["show_request_details"].as<bool>();
                if (logging["history_size"])
                    logHistorySize = logging["history_size"].as<size_t>();
            }

            // CORS
            if (config["cors"])
            {
                auto corsNode = config["cors"];
                if (corsNode["enabled"])
                    cors.enabled = corsNode["enabled"].as<bool>();
                if (corsNode["allow_credentials"])
                    cors.allowCredentials = corsNode["allow_credentials"].as<bool>();
                if (corsNode["max_age"])
                    cors.maxAge = corsNode["max_age"].as<int>();
                if (corsNode["allowed_origins"])
                    cors.allowedOrigins = readStringList(corsNode["allowed_origins"]);
                if (corsNode["allowed_methods"])
                    cors.allowedMethods = readStringList(corsNode["allowed_methods"]);
                if (corsNode["allowed_headers"])
                    cors.allowedHeaders = readStringList(corsNode["allowed_headers"]);
            }

            // Response and audit-log security
            if (config["security"])
            {
                auto security = config["security"];
                if (security["relaxed_csp_for_docs"])
                    relaxedCspForDocs = security["relaxed_csp_for_docs"].as<bool>();
                if (security["log_directory"])
                    securityLog.directory = security["log_directory"].as<std::string>();
                if (security["security_log_enabled"])
                    securityLog.enabled = security["security_log_enabled"].as<bool>();
                if (security["log_max_size_mb"])
                    securityLog.maxFileSizeMB = security["log_max_size_mb"].as<int>();
                if (security["log_retention_days"])
                    securityLog.retentionDays = security["log_retention_days"].as<int>();
            }

            // Rate limiting
            if (config["rate_limit"])
            {
                auto rl = config["rate_limit"];
                if (rl["enabled"])
                    rateLimit.enabled = rl["enabled"].as<bool>();
                if (rl["default_max_requests"])
                    rateLimit.defaultMaxRequests = rl["default_max_requests"].as<size_t>();
                if (rl["default_window_seconds"])
                    rateLimit.defaultTimeWindow = std::chrono::seconds(rl["default_window_seconds"].as<int>());
                if (rl["block_duration_minutes"])
                    rateLimit.blockDurationMinutes = rl["block_duration_minutes"].as<int>();
                if (rl["max_violations_before_block"])
                    rateLimit.maxViolationsBeforeBlock = rl["max_violations_before_block"].as<int>();
                if (rl["block_file"])
                    rateLimit.blockFile = rl["block_file"].as<std::string>();
                if (rl["sweep_interval_seconds"])
                    rateLimit.sweepInterval = std::chrono::seconds(rl["sweep_interval_seconds"].as<int>());
                if (rl["inactive_client_seconds"])
                    rateLimit.inactiveClientTimeout = std::chrono::seconds(rl["inactive_client_seconds"].as<int>());

                if (rl["endpoints"])
                {
                    rateLimit.clearEndpointLimits();
                    for (const auto &endpoint : rl["endpoints"])
                    {
                        if (!endpoint["path"])
                        {
                            std::cerr << "Error: rate_limit endpoint entry without a path in " << configFile << std::endl;
                            return false;
                        }
                        rateLimit.setEndpointLimit(
                            endpoint["path"].as<std::string>(),
                            endpoint["max_requests"] ? endpoint["max_requests"].as<size_t>() : rateLimit.defaultMaxRequests,
                            endpoint["window_seconds"] ? std::chrono::seconds(endpoint["window_seconds"].as<int>())
                                                       : rateLimit.defaultTimeWindow,
                            endpoint["description"] ? endpoint["description"].as<std::string>() : "");
                    }
                }

                if (rl["whitelist"])
                {
                    for (const auto &ip : readStringList(rl["whitelist"]))
                        rateLimit.whitelist.insert(ip);
                }
                if (rl["blacklist"])
                {
                    for (const auto &ip : readStringList(rl["blacklist"]))
                        rateLimit.blacklist.insert(ip);
                }
            }

            // Bearer tokens for the built-in verifier
            if (config["tokens"])
            {
                tokens.clear();
                for (const auto &tokenNode : config["tokens"])
                {
                    TokenConfig token;
                    if (tokenNode["token"])
                        token.token = tokenNode["token"].as<std::string>();
                    if (tokenNode["name"])
                        token.name = tokenNode["name"].as<std::string>();
                    if (tokenNode["roles"])
                        token.roles = readStringList(tokenNode["roles"]);
                    if (tokenNode["password"])
                        token.password = tokenNode["password"].as<std::string>();
                    tokens.push_back(token);
                }
            }

            currentConfigFilePath = std::filesystem::absolute(configFile).string();
            ServerLogger::instance().info("Loaded configuration from " + currentConfigFilePath);
            return true;
        }
        catch (const YAML::Exception &ex)
        {
            std::cerr << "Error parsing config file " << configFile << ": " << ex.what() << std::endl;
            return false;
        }
        catch (const std::exception &ex)
        {
            std::cerr << "Error loading config file " << configFile << ": " << ex.what() << std::endl;
            return false;
        }
    }

    bool ServerConfig::validate() const
    {
        // Validate port
        try
        {
            int portNum = std::stoi(port);
            if (portNum < 1 || portNum > 65535)
            {
                std::cerr << "Error: Port must be between 1 and 65535" << std::endl;
                return false;
            }
        }
        catch (const std::exception &)
        {
            std::cerr << "Error: Invalid port number: " << port << std::endl;
            return false;
        }

        // Validate log level
        if (logLevel != "DEBUG" && logLevel != "INFO" && logLevel != "WARN" && logLevel != "WARNING" && logLevel != "ERROR")
        {
            std::cerr << "Error: Invalid log level: " << logLevel << std::endl;
            return false;
        }

        if (maxBodySizeMB == 0)
        {
            std::cerr << "Error: Maximum body size must be positive" << std::endl;
            return false;
        }

        if (securityLog.enabled && (securityLog.maxFileSizeMB <= 0 || securityLog.retentionDays <= 0))
        {
            std::cerr << "Error: Security log size and retention must be positive" << std::endl;
            return false;
        }

        // Validate rate limiting
        if (rateLimit.enabled)
        {
            if (rateLimit.defaultMaxRequests == 0 || rateLimit.defaultTimeWindow.count() <= 0)
            {
                std::cerr << "Error: Rate limit max requests and window must be positive when enabled" << std::endl;
                return false;
            }
            if (rateLimit.blockDurationMinutes <= 0 || rateLimit.maxViolationsBeforeBlock <= 0)
            {
                std::cerr << "Error: Block duration and violation threshold must be positive" << std::endl;
                return false;
            }
            for (const auto &entry : rateLimit.endpointLimits)
            {
                if (entry.second.maxRequests == 0 || entry.second.timeWindow.count() <= 0)
                {
                    std::cerr << "Error: Invalid rate limit for endpoint " << entry.first << std::endl;
                    return false;
                }
            }
        }

        for (const auto &token : tokens)
        {
            if (token.token.empty())
            {
                std::cerr << "Error: Token entries must carry a token value" << std::endl;
                return false;
            }
        }

        return true;
    }

    void ServerConfig::printSummary() const
    {
        std::cout << "=== restgate Server Configuration ===" << std::endl;
        std::cout << "Server:" << std::endl;
        std::cout << "  Port: " << port << std::endl;
        std::cout << "  Host: " << host << std::endl;
        std::cout << "  Max Body Size: " << maxBodySizeMB << " MB" << std::endl;
        std::cout << "  Trust Proxy Headers: " << (trustProxyHeaders ? "Yes" : "No") << std::endl;

        std::cout << "\nLogging:" << std::endl;
        std::cout << "  Level: " << logLevel << std::endl;
        std::cout << "  File: " << (logFile.empty() ? "Console" : logFile) << std::endl;
        std::cout << "  Security Logs: " << (securityLog.enabled ? securityLog.directory : "Disabled") << std::endl;

        std::cout << "\nRate Limiting: " << (rateLimit.enabled ? "Enabled" : "Disabled") << std::endl;
        if (rateLimit.enabled)
        {
            std::cout << "  Default: " << rateLimit.defaultMaxRequests << " requests / "
                      << rateLimit.defaultTimeWindow.count() << "s" << std::endl;
            std::cout << "  Endpoint Limits: " << rateLimit.endpointLimits.size() << " configured" << std::endl;
            std::cout << "  Block: " << rateLimit.blockDurationMinutes << " min after "
                      << rateLimit.maxViolationsBeforeBlock << " violations" << std::endl;
            std::cout << "  Block File: " << rateLimit.blockFile << std::endl;
        }

        std::cout << "\nCORS: " << (cors.enabled ? "Enabled" : "Disabled") << std::endl;
        if (cors.enabled)
        {
            std::cout << "  Origins: " << cors.allowedOrigins.size() << " configured" << std::endl;
        }

        std::cout << "\nTokens: " << tokens.size() << " configured" << std::endl;
        std::cout << "=====================================" << std::endl;
    }

    void ServerConfig::printHelp()
    {
        std::cout << "restgate Server v" << kVersion << " - Attribute-free REST controller server\n\n";
        std::cout << "USAGE:\n";
        std::cout << "    restgate-server [OPTIONS]\n\n";
        std::cout << "OPTIONS:\n";
        std::cout << "  Basic Server:\n";
        std::cout << "    -p, --port PORT           Server port (default: 8080)\n";
        std::cout << "    --host HOST               Server host (default: 0.0.0.0)\n";
        std::cout << "    -c, --config FILE         Load configuration from YAML file\n";
        std::cout << "    --max-body-mb N           Maximum request body size in MB (default: 10)\n";
        std::cout << "    --trust-proxy             Take the client IP from proxy headers\n\n";

        std::cout << "  Logging:\n";
        std::cout << "    --log-level LEVEL         Log level: DEBUG, INFO, WARN, ERROR (default: INFO)\n";
        std::cout << "    --log-file FILE           Also log to file\n";
        std::cout << "    --quiet                   Suppress per-request messages\n\n";

        std::cout << "  Rate Limiting:\n";
        std::cout << "    --rate-limit N            Default maximum requests per window (default: 100)\n";
        std::cout << "    --rate-window SEC         Default rate limit window in seconds (default: 60)\n";
        std::cout << "    --disable-rate-limit      Disable rate limiting (blacklist still applies)\n";
        std::cout << "    --block-file FILE         Where blocked IPs are persisted (default: blocked_ips.json)\n\n";

        std::cout << "  CORS:\n";
        std::cout << "    --cors-origin ORIGIN      Add allowed CORS origin (can be used multiple times)\n";
        std::cout << "    --cors-methods METHODS    Comma-separated list of allowed methods\n\n";

        std::cout << "  Help:\n";
        std::cout << "    -h, --help                Show this help message\n";
        std::cout << "    -v, --version             Show version information\n\n";

        std::cout << "EXAMPLES:\n";
        std::cout << "  # Basic server on port 3000\n";
        std::cout << "  restgate-server --port 3000\n\n";
        std::cout << "  # Load from configuration file\n";
        std::cout << "  restgate-server --config /path/to/config.yaml\n\n";
        std::cout << "  # Behind a reverse proxy with a tighter default limit\n";
        std::cout << "  restgate-server --trust-proxy --rate-limit 50 --rate-window 30\n\n";
    }

    void ServerConfig::printVersion()
    {
        std::cout << "restgate Server v" << kVersion << "\n";
        std::cout << "REST controller server with rate limiting and IP blocking\n";
        std::cout << "Built with C++17\n";
    }

} // namespace restgate
