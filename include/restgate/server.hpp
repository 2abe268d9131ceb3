#pragma once

#include "export.hpp"
#include "http/socket_io.hpp"
#include "routing/request_dispatcher.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>

namespace restgate {

	struct RESTGATE_SERVER_API ServerOptions {
		bool trustProxyHeaders = false;     // Take the client IP from proxy headers
		size_t maxHeaderBytes = 64 * 1024;  // Larger header blocks answer 400
		int receiveTimeoutSeconds = 30;
		int backlog = 10;
	};

	/**
	 * @brief Listening socket with a select-based accept loop
	 *
	 * Every accepted connection is served on its own detached thread and handed
	 * to the dispatcher once the header block is in.
	 */
	class RESTGATE_SERVER_API Server {
	public:
		Server(const std::string& port, const std::string& host,
			   std::shared_ptr<const routing::RequestDispatcher> dispatcher,
			   ServerOptions options = ServerOptions());
		~Server();

		Server(const Server&) = delete;
		Server& operator=(const Server&) = delete;

		bool init();
		void run();
		void stop();

		bool isRunning() const { return running; }

	private:
#pragma warning(push)
#pragma warning(disable: 4251)
		std::string port;
		std::string host;
		std::shared_ptr<const routing::RequestDispatcher> dispatcher_;
#pragma warning(pop)
		ServerOptions options_;
		SocketType listen_sock;
#pragma warning(push)
#pragma warning(disable: 4251)
		std::atomic<bool> running; // Control flag for server loop
#pragma warning(pop)
	};

} // namespace restgate
