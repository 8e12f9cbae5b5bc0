#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "channel.hpp"

/**
 * TcpChannel carries control messages and binary frames over one TCP socket.
 *
 * Every record on the wire is [kind:1][length:4, big endian][payload] where
 * kind 'C' is a JSON control message and 'B' a raw binary frame. Writes go
 * through a queue drained by a writer thread, so outstandingBytes() is the
 * payload still waiting for the socket. A reader thread delivers records.
 */
class TcpChannel : public Channel, public std::enable_shared_from_this<TcpChannel> {
public:
	static constexpr size_t MAX_CONTROL_SIZE = 16 * 1024 * 1024;

	/**
	 * Wraps a connected socket; the channel owns it from here on
	 * @param socket_fd: connected TCP socket
	 * @param peer_id: identity of the remote end, usually ip:port
	 * @param max_frame_size: largest binary frame accepted either way
	 */
	static std::shared_ptr<TcpChannel> create(int socket_fd, const std::string& peer_id, size_t max_frame_size);

	~TcpChannel() override;

	void open() override;
	void close() override;
	bool isOpen() const override;
	bool send(const TransferMessage& message) override;
	bool sendFrame(const char* data, size_t length) override;
	size_t outstandingBytes() const override { return outstanding.load(); }
	size_t maxFrameSize() const override { return max_frame_size; }

private:
	// Closes the descriptor once neither the channel nor its reader needs it
	struct Socket {
		int fd;
		explicit Socket(int fd) : fd(fd) {}
		~Socket();
	};

	TcpChannel(int socket_fd, const std::string& peer_id, size_t max_frame_size);

	static void readerLoop(std::shared_ptr<Socket> socket, std::weak_ptr<TcpChannel> weak_self, size_t max_frame_size);
	void writerLoop();

	bool enqueue(char kind, const char* data, size_t length);
	void stopWriter(bool discard_pending);

	/**
	 * Called by the reader once the connection is gone; delivers close exactly once
	 */
	void finish();

	std::shared_ptr<Socket> socket;
	size_t max_frame_size;
	std::atomic<bool> closed{false};
	std::atomic<bool> started{false};
	std::atomic<bool> finished{false};
	std::atomic<size_t> outstanding{0};

	std::mutex queue_mutex;
	std::condition_variable queue_cv;
	std::deque<std::vector<char>> write_queue;
	bool writer_stopping = false;

	std::thread reader_thread;
	std::thread writer_thread;
};
