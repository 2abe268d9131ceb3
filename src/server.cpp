#include "restgate/server.hpp"
#include "restgate/http/errors.hpp"
#include "restgate/http/http_request.hpp"
#include "restgate/logger.hpp"
#include "restgate/utils.hpp"

#include <cstring>
#include <exception>
#include <thread>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#pragma comment(lib, "ws2_32.lib")
#else
#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <netdb.h>
#endif

namespace restgate
{

	namespace
	{
#ifdef _WIN32
		const SocketType kInvalidSocket = INVALID_SOCKET;
#else
		const SocketType kInvalidSocket = -1;
#endif

		// Helper: extract client IP from socket address
		std::string extractClientIP(const struct sockaddr_storage &client_addr)
		{
			char clientIP[INET6_ADDRSTRLEN] = {0};
			inet_ntop(client_addr.ss_family,
					  client_addr.ss_family == AF_INET ? (void *)&(((struct sockaddr_in *)&client_addr)->sin_addr) : (void *)&(((struct sockaddr_in6 *)&client_addr)->sin6_addr),
					  clientIP, sizeof(clientIP));
			return std::string(clientIP);
		}

		// Offset just past the blank line ending the header block, npos while incomplete
		size_t findHeaderEnd(const std::string &data)
		{
			size_t crlf = data.find("\r\n\r\n");
			size_t lf = data.find("\n\n");
			if (crlf != std::string::npos && (lf == std::string::npos || crlf < lf))
			{
				return crlf + 4;
			}
			if (lf != std::string::npos)
			{
				return lf + 2;
			}
			return std::string::npos;
		}

		// Thread function to serve one connection
		void handle_client(SocketType client_sock, const std::string &peerIP,
						   std::shared_ptr<const routing::RequestDispatcher> dispatcher,
						   ServerOptions options)
		{
			http::SocketSink sink(client_sock);

			// Set socket timeout to prevent hanging
#ifdef _WIN32
			DWORD timeout = static_cast<DWORD>(options.receiveTimeoutSeconds) * 1000;
#else
			struct timeval timeout;
			timeout.tv_sec = options.receiveTimeoutSeconds;
			timeout.tv_usec = 0;
#endif
			setsockopt(client_sock, SOL_SOCKET, SO_RCVTIMEO, (const char *)&timeout, sizeof(timeout));

			// Read until the header block is complete
			const size_t chunkSize = 16384;
			char buffer[chunkSize];
			std::string received;
			size_t headerEnd = std::string::npos;

			while (headerEnd == std::string::npos)
			{
				int bytesReceived = recv(client_sock, buffer, static_cast<int>(chunkSize), 0);
				if (bytesReceived <= 0)
				{
					if (received.empty())
					{
						ServerLogger::logDebug("Connection from %s closed before sending a request", peerIP.c_str());
					}
					else
					{
						ServerLogger::logWarning("Incomplete HTTP request from %s (%zu bytes)", peerIP.c_str(),
												 received.size());
					}
					return;
				}

				received.append(buffer, static_cast<size_t>(bytesReceived));
				headerEnd = findHeaderEnd(received);

				if ((headerEnd == std::string::npos ? received.size() : headerEnd) > options.maxHeaderBytes)
				{
					http::HttpRequest rejected;
					rejected.peerIP = peerIP;
					rejected.clientIP = peerIP;
					dispatcher->reject(rejected, sink, 400, "Request header block too large");
					return;
				}
			}

			http::HttpRequest request;
			try
			{
				request = http::HttpRequest::parseHead(received.substr(0, headerEnd));
			}
			catch (const http::ClientInputError &ex)
			{
				http::HttpRequest rejected;
				rejected.peerIP = peerIP;
				rejected.clientIP = peerIP;
				dispatcher->reject(rejected, sink, 400, ex.what());
				return;
			}

			request.peerIP = peerIP;
			request.clientIP = http::resolve_client_ip(request, peerIP, options.trustProxyHeaders);
			request.setBodySource(std::make_shared<http::SocketByteSource>(client_sock, received.substr(headerEnd)));

			ServerLogger::logDebug("[Conn %s] %s %s, Content-Length: %s", thread_tag().c_str(), request.method.c_str(),
								   request.target.c_str(), request.header("Content-Length", "-").c_str());

			dispatcher->dispatch(request, sink);
		}
	} // namespace

	Server::Server(const std::string &port, const std::string &host,
				   std::shared_ptr<const routing::RequestDispatcher> dispatcher, ServerOptions options)
		: port(port), host(host), dispatcher_(std::move(dispatcher)), options_(options),
		  listen_sock(kInvalidSocket), running(false)
	{
	}

	Server::~Server()
	{
		stop();
		if (listen_sock != kInvalidSocket)
			http::close_socket(listen_sock);
#ifdef _WIN32
		WSACleanup();
#endif
	}

	bool Server::init()
	{
#ifdef _WIN32
		WSADATA wsaData;
		if (WSAStartup(MAKEWORD(2, 2), &wsaData) != 0)
		{
			ServerLogger::logError("WSAStartup failed");
			return false;
		}
#endif

		struct addrinfo hints, *servinfo, *p;
		std::memset(&hints, 0, sizeof(hints));
		hints.ai_family = AF_UNSPEC;
		hints.ai_socktype = SOCK_STREAM;
		hints.ai_flags = AI_PASSIVE;
		int rv;
		// Bind every interface for 0.0.0.0, otherwise the given host
		const char *bind_host = (host == "0.0.0.0" || host.empty()) ? NULL : host.c_str();
		if (bind_host == NULL)
			hints.ai_family = AF_INET;
		if ((rv = getaddrinfo(bind_host, port.c_str(), &hints, &servinfo)) != 0)
		{
#ifdef _WIN32
			ServerLogger::logError("getaddrinfo: %s", gai_strerrorA(rv));
#else
			ServerLogger::logError("getaddrinfo: %s", gai_strerror(rv));
#endif
			return false;
		}

		for (p = servinfo; p != nullptr; p = p->ai_next)
		{
			listen_sock = socket(p->ai_family, p->ai_socktype, p->ai_protocol);
			if (listen_sock == kInvalidSocket)
				continue;

			int yes = 1;
			if (setsockopt(listen_sock, SOL_SOCKET, SO_REUSEADDR,
						   reinterpret_cast<const char *>(&yes),
						   sizeof(yes)) == -1)
			{
				http::close_socket(listen_sock);
				listen_sock = kInvalidSocket;
				continue;
			}

			if (bind(listen_sock, p->ai_addr, static_cast<int>(p->ai_addrlen)) == -1)
			{
				http::close_socket(listen_sock);
				listen_sock = kInvalidSocket;
				continue;
			}
			break;
		}
		freeaddrinfo(servinfo);

		if (p == nullptr || listen_sock == kInvalidSocket)
		{
			ServerLogger::logError("Failed to bind socket to %s:%s", host.c_str(), port.c_str());
			return false;
		}

		if (listen(listen_sock, options_.backlog) == -1)
		{
			ServerLogger::logError("Listen failed");
			return false;
		}

		ServerLogger::logInfo("Server initialized and listening on %s:%s",
							  host.c_str(), port.c_str());
		return true;
	}

	void Server::run()
	{
		running = true;
		ServerLogger::logInfo("Server entering main loop with concurrent request handling");

		while (running)
		{
			struct sockaddr_storage client_addr;
#ifdef _WIN32
			int sin_size = sizeof(client_addr);
#else
			socklen_t sin_size = sizeof(client_addr);
#endif

			// Setup select for timeout to check running flag periodically
			fd_set readfds;
			FD_ZERO(&readfds);
			FD_SET(listen_sock, &readfds);

			struct timeval tv;
			tv.tv_sec = 1; // 1 second timeout
			tv.tv_usec = 0;

			int select_result = select(static_cast<int>(listen_sock) + 1, &readfds, NULL, NULL, &tv);

			if (select_result == -1)
			{
				if (!running)
					break;
				ServerLogger::logError("Select failed");
				break;
			}

			if (select_result == 0 || !FD_ISSET(listen_sock, &readfds))
			{
				// Timeout occurred, check if we should continue running
				continue;
			}

			SocketType client_sock = accept(listen_sock,
											reinterpret_cast<struct sockaddr *>(&client_addr),
											&sin_size);
			if (client_sock == kInvalidSocket)
			{
				ServerLogger::logError("Accept failed");
				continue;
			}

			std::string clientIP = extractClientIP(client_addr);
			ServerLogger::logInfo("New client connection from %s", clientIP.c_str());

			// Spawn a thread to handle this client
			std::shared_ptr<const routing::RequestDispatcher> dispatcher = dispatcher_;
			ServerOptions options = options_;
			std::thread([client_sock, clientIP, dispatcher, options]()
						{
							try
							{
								handle_client(client_sock, clientIP, dispatcher, options);
							}
							catch (const std::exception &ex)
							{
								ServerLogger::logError("Connection handler for %s failed: %s", clientIP.c_str(), ex.what());
							}
						})
				.detach(); // Detach the thread to handle the request independently
		}

		ServerLogger::logInfo("Server main loop exited");
	}

	void Server::stop()
	{
		if (running)
		{
			ServerLogger::logInfo("Stopping server");
			running = false;
		}
	}

} // namespace restgate
