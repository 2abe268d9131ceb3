#pragma once

#include "../export.hpp"
#include "body_reader.hpp"
#include "byte_sink.hpp"

#include <string>

#ifdef _WIN32
#include <winsock2.h>
using SocketType = SOCKET;
#else
#include <sys/socket.h>
#include <unistd.h>
using SocketType = int;
#endif

namespace restgate
{
    namespace http
    {

        void RESTGATE_SERVER_API close_socket(SocketType sock);

        /**
         * @brief Body source over a connected socket
         *
         * Serves the bytes already received together with the headers first, then
         * reads from the socket.
         */
        class RESTGATE_SERVER_API SocketByteSource : public IByteSource
        {
        public:
            SocketByteSource(SocketType sock, std::string prefix)
                : sock_(sock), prefix_(std::move(prefix)) {}

            long read(char *buffer, size_t length) override;

            // Buffered prefix left, or the socket is readable within a short grace period
            bool hasPending() override;

        private:
            SocketType sock_;
#pragma warning(push)
#pragma warning(disable: 4251)
            std::string prefix_;
#pragma warning(pop)
            size_t offset_ = 0;
        };

        /**
         * @brief Response sink writing to a socket; close() shuts the connection
         */
        class RESTGATE_SERVER_API SocketSink : public IByteSink
        {
        public:
            explicit SocketSink(SocketType sock) : sock_(sock) {}
            ~SocketSink() override { close(); }

            using IByteSink::write;
            bool write(const char *data, size_t length) override;
            void close() override;

        private:
            SocketType sock_;
            bool closed_ = false;
        };

    } // namespace http
} // namespace restgate
