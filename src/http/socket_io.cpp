#include "restgate/http/socket_io.hpp"
#include "restgate/logger.hpp"

#include <algorithm>
#include <cstring>

#ifdef _WIN32
#include <winsock2.h>
#else
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace restgate
{
    namespace http
    {

        namespace
        {
            // How long hasPending() waits for bytes still in flight
            constexpr int kPendingGraceMs = 50;
        }

        void close_socket(SocketType sock)
        {
#ifdef _WIN32
            closesocket(sock);
#else
            close(sock);
#endif
        }

        long SocketByteSource::read(char *buffer, size_t length)
        {
            if (offset_ < prefix_.size())
            {
                size_t count = std::min(length, prefix_.size() - offset_);
                std::memcpy(buffer, prefix_.data() + offset_, count);
                offset_ += count;
                return static_cast<long>(count);
            }

            int received = recv(sock_, buffer, static_cast<int>(length), 0);
            return static_cast<long>(received);
        }

        bool SocketByteSource::hasPending()
        {
            if (offset_ < prefix_.size())
            {
                return true;
            }

#ifdef _WIN32
            fd_set readfds;
            FD_ZERO(&readfds);
            FD_SET(sock_, &readfds);
            struct timeval tv;
            tv.tv_sec = 0;
            tv.tv_usec = kPendingGraceMs * 1000;
            if (select(0, &readfds, NULL, NULL, &tv) <= 0)
            {
                return false;
            }
#else
            struct pollfd pfd;
            pfd.fd = sock_;
            pfd.events = POLLIN;
            pfd.revents = 0;
            if (poll(&pfd, 1, kPendingGraceMs) <= 0 || !(pfd.revents & POLLIN))
            {
                return false;
            }
#endif

            // Readable can also mean orderly shutdown
            char probe;
            return recv(sock_, &probe, 1, MSG_PEEK) > 0;
        }

        bool SocketSink::write(const char *data, size_t length)
        {
            if (closed_)
            {
                return false;
            }

            size_t sent = 0;
            while (sent < length)
            {
#ifdef _WIN32
                int n = send(sock_, data + sent, static_cast<int>(length - sent), 0);
#else
                ssize_t n = send(sock_, data + sent, length - sent, MSG_NOSIGNAL);
#endif
                if (n <= 0)
                {
                    ServerLogger::logWarning("Socket write failed after %zu of %zu bytes", sent, length);
                    return false;
                }
                sent += static_cast<size_t>(n);
            }
            return true;
        }

        void SocketSink::close()
        {
            if (closed_)
            {
                return;
            }
            closed_ = true;
#ifdef _WIN32
            shutdown(sock_, SD_SEND);
#else
            shutdown(sock_, SHUT_WR);
#endif
            close_socket(sock_);
        }

    } // namespace http
} // namespace restgate
