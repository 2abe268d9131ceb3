#include "restgate/auth/cors_handler.hpp"
#include "restgate/logger.hpp"
#include "restgate/utils.hpp"

#include <algorithm>

namespace restgate
{
    namespace auth
    {

        CorsHandler::CorsHandler() : config_()
        {
            updateConfig(config_);
        }

        CorsHandler::CorsHandler(const Config &config) : config_(config)
        {
            updateConfig(config);
        }

        CorsHandler::HeaderMap CorsHandler::headersFor(const std::string &origin) const
        {
            HeaderMap headers;
            if (!config_.enabled)
            {
                return headers;
            }

            if (!origin.empty() && !isOriginAllowed(origin))
            {
                ServerLogger::logDebug("CORS: Origin not in allowed list: %s", origin.c_str());
            }

            headers["Access-Control-Allow-Origin"] = allowOriginValue(origin);
            headers["Access-Control-Allow-Methods"] = methodsValue_;
            headers["Access-Control-Allow-Headers"] = headersValue_;
            headers["Access-Control-Allow-Credentials"] = config_.allowCredentials ? "true" : "false";
            return headers;
        }

        CorsHandler::HeaderMap CorsHandler::preflightHeaders(const std::string &origin) const
        {
            HeaderMap headers = headersFor(origin);
            if (config_.enabled)
            {
                headers["Access-Control-Max-Age"] = std::to_string(config_.maxAge);
                ServerLogger::logInfo("CORS preflight answered for origin: %s",
                                      origin.empty() ? "(none)" : origin.c_str());
            }
            return headers;
        }

        void CorsHandler::updateConfig(const Config &config)
        {
            config_ = config;

            allowedOriginsSet_.clear();
            for (const auto &origin : config_.allowedOrigins)
            {
                allowedOriginsSet_.insert(origin);
            }

            methodsValue_ = join(config_.allowedMethods, ", ");
            headersValue_ = join(config_.allowedHeaders, ", ");

            ServerLogger::logInfo("CORS configuration updated - Enabled: %s, Origins: %zu, Methods: %zu, Headers: %zu",
                                  config_.enabled ? "true" : "false",
                                  config_.allowedOrigins.size(),
                                  config_.allowedMethods.size(),
                                  config_.allowedHeaders.size());
        }

        void CorsHandler::addAllowedOrigin(const std::string &origin)
        {
            auto it = std::find(config_.allowedOrigins.begin(), config_.allowedOrigins.end(), origin);
            if (it == config_.allowedOrigins.end())
            {
                config_.allowedOrigins.push_back(origin);
                allowedOriginsSet_.insert(origin);
                ServerLogger::logInfo("CORS: Added allowed origin: %s", origin.c_str());
            }
        }

        bool CorsHandler::isOriginAllowed(const std::string &origin) const
        {
            if (allowedOriginsSet_.count("*") > 0)
            {
                return true;
            }
            return allowedOriginsSet_.count(origin) > 0;
        }

        std::string CorsHandler::allowOriginValue(const std::string &origin) const
        {
            bool wildcard = allowedOriginsSet_.count("*") > 0;

            if (wildcard)
            {
                if (config_.allowCredentials && !origin.empty())
                {
                    return origin;
                }
                return "*";
            }

            if (!origin.empty() && allowedOriginsSet_.count(origin) > 0)
            {
                return origin;
            }

            return config_.allowedOrigins.empty() ? std::string("null") : config_.allowedOrigins.front();
        }

    } // namespace auth
} // namespace restgate
