#include "tcpRendezvous.hpp"
#include <iostream>
#include <cstring>
#include <stdexcept>
#include <vector>
#include <sys/socket.h>
#include <arpa/inet.h>
#include <netinet/tcp.h>
#include <unistd.h>
#include "tcpChannel.hpp"

TcpRendezvous::TcpRendezvous(size_t max_frame_size) : max_frame_size(max_frame_size) {
}

TcpRendezvous::~TcpRendezvous() {
	std::map<std::string, std::shared_ptr<Listener>> remaining;
	{
		std::lock_guard<std::mutex> lock(listeners_mutex);
		remaining.swap(listeners);
	}
	for (auto& entry : remaining) {
		stopListener(entry.second);
	}
}

bool TcpRendezvous::parseEndpoint(const std::string& code, std::string& ip, int& port) {
	std::string port_text = code;
	ip = "127.0.0.1";

	size_t colon = code.rfind(':');
	if (colon != std::string::npos) {
		ip = code.substr(0, colon);
		port_text = code.substr(colon + 1);
	}

	try {
		size_t used = 0;
		int value = std::stoi(port_text, &used);
		if (used != port_text.size() || value < 1 || value > 65535) {
			return false;
		}
		port = value;
	} catch (const std::exception& e) {
		return false;
	}
	return !ip.empty();
}

/**
 * Listens on the port named by code
 */
RegistrationResult TcpRendezvous::registerIdentity(const std::string& code, IncomingHandler on_incoming) {
	std::string ip;
	int port = 0;
	if (!parseEndpoint(code, ip, port)) {
		std::cerr << "Invalid share code: " << code << std::endl;
		return RegistrationResult::FAILED;
	}

	{
		std::lock_guard<std::mutex> lock(listeners_mutex);
		if (listeners.count(code) > 0) {
			return RegistrationResult::IDENTITY_TAKEN;
		}
	}

	int server_fd = socket(AF_INET, SOCK_STREAM, 0);
	if (server_fd < 0) {
		std::cerr << "Failed to create server socket. Error: " << strerror(errno) << std::endl;
		return RegistrationResult::FAILED;
	}

	int opt = 1;
	if (setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
		std::cerr << "Failed to set socket options: " << strerror(errno) << std::endl;
		close(server_fd);
		return RegistrationResult::FAILED;
	}

	struct sockaddr_in server_addr;
	std::memset(&server_addr, 0, sizeof(server_addr));
	server_addr.sin_family = AF_INET;
	server_addr.sin_addr.s_addr = INADDR_ANY;
	server_addr.sin_port = htons(port);

	if (bind(server_fd, (struct sockaddr*)&server_addr, sizeof(server_addr)) < 0) {
		int bind_error = errno;
		std::cerr << "Failed to bind to port " << port << ": " << strerror(bind_error) << std::endl;
		close(server_fd);
		// Somebody else already serves this code
		return bind_error == EADDRINUSE ? RegistrationResult::IDENTITY_TAKEN : RegistrationResult::FAILED;
	}

	if (listen(server_fd, 5) < 0) {
		std::cerr << "Failed to listen on socket: " << strerror(errno) << std::endl;
		close(server_fd);
		return RegistrationResult::FAILED;
	}

	// accept() times out every second so the loop notices when it should stop
	struct timeval timeout;
	timeout.tv_sec = 1;
	timeout.tv_usec = 0;
	setsockopt(server_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

	auto listener = std::make_shared<Listener>();
	listener->server_fd = server_fd;
	listener->port = port;
	listener->on_incoming = on_incoming;
	listener->is_running = true;

	{
		std::lock_guard<std::mutex> lock(listeners_mutex);
		if (listeners.count(code) > 0) {
			close(server_fd);
			return RegistrationResult::IDENTITY_TAKEN;
		}
		listeners[code] = listener;
		listener->accept_thread = std::thread(&TcpRendezvous::acceptConnections, this, listener);
	}

	std::cout << "Listening on port " << port << std::endl;
	return RegistrationResult::OK;
}

void TcpRendezvous::unregisterIdentity(const std::string& code) {
	std::shared_ptr<Listener> listener;
	{
		std::lock_guard<std::mutex> lock(listeners_mutex);
		auto it = listeners.find(code);
		if (it == listeners.end()) {
			return;
		}
		listener = it->second;
		listeners.erase(it);
	}
	stopListener(listener);
}

void TcpRendezvous::stopListener(const std::shared_ptr<Listener>& listener) {
	listener->is_running = false;

	// Interrupts a blocked accept()
	shutdown(listener->server_fd, SHUT_RDWR);

	if (listener->accept_thread.joinable()) {
		if (listener->accept_thread.get_id() == std::this_thread::get_id()) {
			listener->accept_thread.detach();
		} else {
			listener->accept_thread.join();
		}
	}

	// A detached loop checks is_running before touching the descriptor again
	if (listener->server_fd >= 0) {
		close(listener->server_fd);
		listener->server_fd = -1;
	}
	std::cout << "Stopped listening on port " << listener->port << std::endl;
}

/**
 * Accept loop for one registered code
 */
void TcpRendezvous::acceptConnections(std::shared_ptr<Listener> listener) {
	while (listener->is_running) {
		struct sockaddr_in client_addr;
		socklen_t client_len = sizeof(client_addr);
		int client_socket = accept(listener->server_fd, (struct sockaddr*)&client_addr, &client_len);

		if (!listener->is_running) {
			if (client_socket >= 0) close(client_socket);
			break;
		}

		if (client_socket < 0) {
			if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
				std::cerr << "Failed to accept connection: " << strerror(errno) << std::endl;
			}
			continue;
		}

		// Small control messages go out right away
		int flag = 1;
		setsockopt(client_socket, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));

		// The listener's receive timeout is inherited; channel reads block
		struct timeval no_timeout;
		no_timeout.tv_sec = 0;
		no_timeout.tv_usec = 0;
		setsockopt(client_socket, SOL_SOCKET, SO_RCVTIMEO, &no_timeout, sizeof(no_timeout));

		char client_ip[INET_ADDRSTRLEN];
		inet_ntop(AF_INET, &(client_addr.sin_addr), client_ip, INET_ADDRSTRLEN);
		std::string peer_id = std::string(client_ip) + ":" + std::to_string(ntohs(client_addr.sin_port));

		std::cout << "New connection from " << peer_id << std::endl;

		listener->on_incoming(TcpChannel::create(client_socket, peer_id, max_frame_size));
	}
}

/**
 * Dials the endpoint named by code
 */
std::shared_ptr<Channel> TcpRendezvous::connect(const std::string& code, const std::string& local_id) {
	std::string server_ip;
	int port = 0;
	if (!parseEndpoint(code, server_ip, port)) {
		std::cerr << "Invalid code: " << code << std::endl;
		return nullptr;
	}

	int client_fd = socket(AF_INET, SOCK_STREAM, 0);
	if (client_fd < 0) {
		std::cerr << "Failed to create socket. Error: " << strerror(errno) << std::endl;
		return nullptr;
	}

	struct sockaddr_in server_addr;
	std::memset(&server_addr, 0, sizeof(server_addr));
	server_addr.sin_family = AF_INET;
	server_addr.sin_port = htons(port);

	if (inet_pton(AF_INET, server_ip.c_str(), &server_addr.sin_addr) <= 0) {
		std::cerr << "Invalid address: " << server_ip << std::endl;
		close(client_fd);
		return nullptr;
	}

	if (::connect(client_fd, (struct sockaddr*)&server_addr, sizeof(server_addr)) < 0) {
		std::cerr << "Connection failed to " << server_ip << ":" << port << ". Error: " << strerror(errno) << std::endl;
		close(client_fd);
		return nullptr;
	}

	int flag = 1;
	setsockopt(client_fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));

	std::cout << local_id << " connected to " << server_ip << ":" << port << std::endl;
	return TcpChannel::create(client_fd, code, max_frame_size);
}
