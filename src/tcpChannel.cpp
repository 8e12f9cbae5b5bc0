#include "tcpChannel.hpp"
#include <iostream>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

using json = nlohmann::json;

static const char KIND_CONTROL = 'C';
static const char KIND_BINARY = 'B';
static const size_t HEADER_SIZE = 5;

TcpChannel::Socket::~Socket() {
	if (fd >= 0) {
		::close(fd);
	}
}

/**
 * Loops until all bytes are written; send() may write less than asked
 */
static bool writeAll(int fd, const char* data, size_t length) {
	size_t written = 0;
	while (written < length) {
		// MSG_NOSIGNAL: a peer that went away is an error return, not SIGPIPE
		ssize_t sent = ::send(fd, data + written, length - written, MSG_NOSIGNAL);
		if (sent < 0) {
			if (errno == EINTR) continue;
			return false;
		}
		written += static_cast<size_t>(sent);
	}
	return true;
}

/**
 * Reads exactly length bytes
 * @return: false on EOF or error
 */
static bool readAll(int fd, char* data, size_t length) {
	size_t received = 0;
	while (received < length) {
		ssize_t got = ::recv(fd, data + received, length - received, 0);
		if (got < 0) {
			if (errno == EINTR) continue;
			return false;
		}
		if (got == 0) {
			return false;
		}
		received += static_cast<size_t>(got);
	}
	return true;
}

TcpChannel::TcpChannel(int socket_fd, const std::string& peer_id, size_t max_frame_size)
	: Channel(peer_id), socket(std::make_shared<Socket>(socket_fd)), max_frame_size(max_frame_size) {
}

std::shared_ptr<TcpChannel> TcpChannel::create(int socket_fd, const std::string& peer_id, size_t max_frame_size) {
	std::shared_ptr<TcpChannel> channel(new TcpChannel(socket_fd, peer_id, max_frame_size));
	// Writes may be queued before open(), so the writer runs from the start
	channel->writer_thread = std::thread(&TcpChannel::writerLoop, channel.get());
	return channel;
}

TcpChannel::~TcpChannel() {
	closed = true;
	stopWriter(true);
	shutdown(socket->fd, SHUT_RDWR);

	if (writer_thread.joinable()) {
		writer_thread.join();
	}
	if (reader_thread.joinable()) {
		// The last reference can go away inside one of our own callbacks
		if (reader_thread.get_id() == std::this_thread::get_id()) {
			reader_thread.detach();
		} else {
			reader_thread.join();
		}
	}
}

void TcpChannel::open() {
	if (started.exchange(true)) {
		return;
	}
	reader_thread = std::thread(&TcpChannel::readerLoop, socket, weak_from_this(), max_frame_size);
}

void TcpChannel::close() {
	if (closed.exchange(true)) {
		return;
	}
	// Whatever is queued still goes out, then the write side is shut
	stopWriter(false);
	notifyDrained();
}

bool TcpChannel::isOpen() const {
	return !closed.load();
}

bool TcpChannel::send(const TransferMessage& message) {
	std::string serialized;
	try {
		serialized = message.serialize();
	} catch (const json::exception& e) {
		std::cerr << "Cannot encode " << messageTypeToString(message.type)
			  << " for " << peerId() << ": " << e.what() << std::endl;
		return false;
	}
	if (serialized.size() > MAX_CONTROL_SIZE) {
		std::cerr << "Control message of " << serialized.size() << " bytes is too large" << std::endl;
		return false;
	}
	return enqueue(KIND_CONTROL, serialized.data(), serialized.size());
}

bool TcpChannel::sendFrame(const char* data, size_t length) {
	if (length > max_frame_size) {
		std::cerr << "Frame of " << length << " bytes exceeds channel limit of "
			  << max_frame_size << std::endl;
		return false;
	}
	return enqueue(KIND_BINARY, data, length);
}

bool TcpChannel::enqueue(char kind, const char* data, size_t length) {
	std::vector<char> record(HEADER_SIZE + length);
	record[0] = kind;

	// Length in network byte order
	uint32_t size = static_cast<uint32_t>(length);
	record[1] = static_cast<char>((size >> 24) & 0xFF);
	record[2] = static_cast<char>((size >> 16) & 0xFF);
	record[3] = static_cast<char>((size >> 8) & 0xFF);
	record[4] = static_cast<char>(size & 0xFF);
	if (length > 0) {
		std::memcpy(record.data() + HEADER_SIZE, data, length);
	}

	{
		std::lock_guard<std::mutex> lock(queue_mutex);
		if (closed.load() || writer_stopping) {
			return false;
		}
		outstanding += length;
		write_queue.push_back(std::move(record));
	}
	queue_cv.notify_one();
	return true;
}

void TcpChannel::stopWriter(bool discard_pending) {
	{
		std::lock_guard<std::mutex> lock(queue_mutex);
		writer_stopping = true;
		if (discard_pending) {
			write_queue.clear();
			outstanding = 0;
		}
	}
	queue_cv.notify_all();
}

void TcpChannel::writerLoop() {
	for (;;) {
		std::vector<char> record;
		{
			std::unique_lock<std::mutex> lock(queue_mutex);
			queue_cv.wait(lock, [this] { return writer_stopping || !write_queue.empty(); });
			if (write_queue.empty()) {
				break;
			}
			record = std::move(write_queue.front());
			write_queue.pop_front();
		}

		bool written = writeAll(socket->fd, record.data(), record.size());

		size_t payload = record.size() - HEADER_SIZE;
		size_t before = outstanding.fetch_sub(payload);
		noteOutstandingDecrease(before, before - payload);

		if (!written) {
			if (!closed.load()) {
				std::cerr << "Error sending to " << peerId() << ": " << strerror(errno) << std::endl;
			}
			closed = true;
			stopWriter(true);
			// Wakes the reader, which reports the close
			shutdown(socket->fd, SHUT_RDWR);
			notifyDrained();
			return;
		}
	}

	// Graceful close: the peer sees EOF after everything we queued
	shutdown(socket->fd, SHUT_WR);
}

void TcpChannel::readerLoop(std::shared_ptr<Socket> socket, std::weak_ptr<TcpChannel> weak_self, size_t max_frame_size) {
	{
		std::shared_ptr<TcpChannel> self = weak_self.lock();
		if (!self) {
			return;
		}
		self->notifyOpen();
	}

	std::vector<char> payload;
	for (;;) {
		char header[HEADER_SIZE];
		if (!readAll(socket->fd, header, HEADER_SIZE)) {
			break;
		}

		char kind = header[0];
		uint32_t length = (static_cast<uint32_t>(static_cast<unsigned char>(header[1])) << 24) |
				  (static_cast<uint32_t>(static_cast<unsigned char>(header[2])) << 16) |
				  (static_cast<uint32_t>(static_cast<unsigned char>(header[3])) << 8) |
				  static_cast<uint32_t>(static_cast<unsigned char>(header[4]));

		size_t limit = (kind == KIND_BINARY) ? max_frame_size : MAX_CONTROL_SIZE;
		if ((kind != KIND_BINARY && kind != KIND_CONTROL) || length > limit) {
			std::shared_ptr<TcpChannel> self = weak_self.lock();
			if (self) {
				self->notifyError("protocol violation: bad record of kind " + std::to_string(static_cast<int>(kind)) +
						  ", " + std::to_string(length) + " bytes");
			}
			break;
		}

		payload.resize(length);
		if (length > 0 && !readAll(socket->fd, payload.data(), length)) {
			break;
		}

		// Only touch the channel while holding a strong reference to it
		std::shared_ptr<TcpChannel> self = weak_self.lock();
		if (!self) {
			return;
		}

		if (kind == KIND_BINARY) {
			self->notifyFrame(payload);
			continue;
		}

		try {
			TransferMessage message = TransferMessage::deserialize(std::string(payload.begin(), payload.end()));
			self->notifyMessage(message);
		} catch (const json::exception& e) {
			std::cerr << "JSON parse error from " << self->peerId() << ": " << e.what() << std::endl;
		} catch (const std::invalid_argument& e) {
			std::cerr << "Dropping message from " << self->peerId() << ": " << e.what() << std::endl;
		}
	}

	std::shared_ptr<TcpChannel> self = weak_self.lock();
	if (self) {
		self->finish();
	}
}

void TcpChannel::finish() {
	if (finished.exchange(true)) {
		return;
	}
	closed = true;
	stopWriter(true);
	shutdown(socket->fd, SHUT_RDWR);

	notifyDrained();
	notifyClose();
}
