#pragma once

#include "../export.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace restgate
{
    namespace http
    {

        /**
         * @brief Pull-based byte source for request bodies
         */
        class RESTGATE_SERVER_API IByteSource
        {
        public:
            virtual ~IByteSource() = default;

            // Blocking read; returns bytes read, 0 at end of stream, negative on error
            virtual long read(char *buffer, size_t length) = 0;

            // True when more bytes can be read without blocking
            virtual bool hasPending() = 0;
        };

        /**
         * @brief In-memory source, used for buffered prefixes and in tests
         */
        class RESTGATE_SERVER_API StringByteSource : public IByteSource
        {
        public:
            explicit StringByteSource(std::string data) : data_(std::move(data)) {}

            long read(char *buffer, size_t length) override;
            bool hasPending() override { return offset_ < data_.size(); }

        private:
            std::string data_;
            size_t offset_ = 0;
        };

        /**
         * @brief Reads a request body while enforcing a byte limit
         *
         * The declared Content-Length is read first; any bytes still pending on the
         * source afterwards are drained and counted too, so a client that under-reports
         * its length still trips the limit. Throws PayloadTooLargeError as soon as the
         * limit is crossed, before buffering the remainder.
         */
        class RESTGATE_SERVER_API BodyReader
        {
        public:
            explicit BodyReader(size_t maxBytes) : maxBytes_(maxBytes) {}

            std::string read(IByteSource &source, std::optional<size_t> declaredLength) const;

            size_t maxBytes() const { return maxBytes_; }

        private:
            size_t maxBytes_;
        };

    } // namespace http
} // namespace restgate
