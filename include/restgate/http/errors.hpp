#pragma once

#include "../export.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace restgate
{
    namespace http
    {

        /**
         * @brief Base of the request error taxonomy; carries the HTTP status it maps to
         */
        class RESTGATE_SERVER_API HttpError : public std::runtime_error
        {
        public:
            HttpError(int statusCode, const std::string &message)
                : std::runtime_error(message), statusCode_(statusCode) {}

            int statusCode() const noexcept { return statusCode_; }

        private:
            int statusCode_;
        };

        /**
         * @brief Malformed or invalid client-supplied data (400)
         *
         * The only error class whose message is returned to the client verbatim.
         */
        class RESTGATE_SERVER_API ClientInputError : public HttpError
        {
        public:
            explicit ClientInputError(const std::string &message)
                : HttpError(400, message) {}

        protected:
            ClientInputError(int statusCode, const std::string &message)
                : HttpError(statusCode, message) {}
        };

        /**
         * @brief Request body over the configured limit (413)
         */
        class RESTGATE_SERVER_API PayloadTooLargeError : public ClientInputError
        {
        public:
            PayloadTooLargeError(size_t limitBytes, size_t receivedBytes)
                : ClientInputError(413, "Request body exceeds maximum allowed size of " +
                                            std::to_string(limitBytes / (1024 * 1024)) + "MB"),
                  limitBytes_(limitBytes), receivedBytes_(receivedBytes) {}

            size_t limitBytes() const noexcept { return limitBytes_; }
            size_t receivedBytes() const noexcept { return receivedBytes_; }

        private:
            size_t limitBytes_;
            size_t receivedBytes_;
        };

    } // namespace http
} // namespace restgate
