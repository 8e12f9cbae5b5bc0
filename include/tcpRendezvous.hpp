#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "rendezvous.hpp"

/**
 * TcpRendezvous uses TCP endpoints as codes.
 * Registering a code listens on that port; connecting to "ip:port" (or a
 * bare port, meaning this machine) dials it. Every accepted or dialed socket
 * becomes a TcpChannel.
 */
class TcpRendezvous : public Rendezvous {
public:
	/**
	 * @param max_frame_size: largest binary frame on the channels handed out
	 */
	explicit TcpRendezvous(size_t max_frame_size = 256 * 1024);
	~TcpRendezvous() override;

	TcpRendezvous(const TcpRendezvous&) = delete;
	TcpRendezvous& operator=(const TcpRendezvous&) = delete;

	RegistrationResult registerIdentity(const std::string& code, IncomingHandler on_incoming) override;
	void unregisterIdentity(const std::string& code) override;
	std::shared_ptr<Channel> connect(const std::string& code, const std::string& local_id) override;

	/**
	 * Splits a code into address and port
	 * @param code: "ip:port" or just "port"
	 * @return: false if the port is not a number in 1..65535
	 */
	static bool parseEndpoint(const std::string& code, std::string& ip, int& port);

private:
	struct Listener {
		int server_fd = -1;
		int port = 0;
		std::atomic<bool> is_running{false};
		std::thread accept_thread;
		IncomingHandler on_incoming;
	};

	void acceptConnections(std::shared_ptr<Listener> listener);
	void stopListener(const std::shared_ptr<Listener>& listener);

	size_t max_frame_size;
	std::mutex listeners_mutex;
	std::map<std::string, std::shared_ptr<Listener>> listeners;
};
