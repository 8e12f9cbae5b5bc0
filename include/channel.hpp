#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "protocol.hpp"

/**
 * Channel is the ordered, reliable, message-oriented link between two peers.
 * It carries typed control messages and raw binary frames. How the link was
 * established (TCP socket, in-process pair, ...) is up to the subclass.
 *
 * Callbacks for one endpoint are invoked from that endpoint's own I/O thread.
 * clearCallbacks() waits for an in-flight callback to return, so an owner
 * that clears its callbacks before dying is never called back afterwards.
 */
class Channel {
public:
	using MessageHandler = std::function<void(const TransferMessage&)>;
	using FrameHandler = std::function<void(const std::vector<char>&)>;
	using EventHandler = std::function<void()>;
	using ErrorHandler = std::function<void(const std::string&)>;

	explicit Channel(std::string peer_id);
	virtual ~Channel() = default;

	Channel(const Channel&) = delete;
	Channel& operator=(const Channel&) = delete;

	/**
	 * Identity of the remote end of this connection
	 */
	const std::string& peerId() const { return peer_id; }

	/**
	 * Starts event delivery. Handlers must be installed before calling this.
	 */
	virtual void open() = 0;

	/**
	 * Closes the link. Data queued before the close is still delivered.
	 */
	virtual void close() = 0;

	virtual bool isOpen() const = 0;

	/**
	 * Queues a control message. Returns false if the channel is not open.
	 */
	virtual bool send(const TransferMessage& message) = 0;

	/**
	 * Queues one binary frame. Returns false if the channel is not open
	 * or the frame exceeds maxFrameSize().
	 */
	virtual bool sendFrame(const char* data, size_t length) = 0;

	/**
	 * Bytes handed to send()/sendFrame() that have not left the endpoint yet
	 */
	virtual size_t outstandingBytes() const = 0;

	virtual size_t maxFrameSize() const = 0;

	/**
	 * The drained callback fires whenever outstandingBytes() falls from above
	 * this mark to at or below it, and once more when the channel closes.
	 */
	void setLowWaterMark(size_t bytes) { low_water_mark = bytes; }
	size_t lowWaterMark() const { return low_water_mark; }

	void setOpenCallback(EventHandler callback);
	void setCloseCallback(EventHandler callback);
	void setErrorCallback(ErrorHandler callback);
	void setMessageCallback(MessageHandler callback);
	void setFrameCallback(FrameHandler callback);
	void setDrainedCallback(EventHandler callback);

	/**
	 * Drops every callback. Blocks while another thread is inside one.
	 */
	void clearCallbacks();

protected:
	void notifyOpen();
	void notifyClose();
	void notifyError(const std::string& error);
	void notifyMessage(const TransferMessage& message);
	void notifyFrame(const std::vector<char>& frame);
	void notifyDrained();

	/**
	 * Subclasses report every decrease of their outstanding count here
	 */
	void noteOutstandingDecrease(size_t before, size_t after);

private:
	std::string peer_id;
	std::atomic<size_t> low_water_mark{0};

	// Held while a dispatch callback runs; recursive so a callback may clear itself
	std::recursive_mutex callback_mutex;
	EventHandler open_callback;
	EventHandler close_callback;
	ErrorHandler error_callback;
	MessageHandler message_callback;
	FrameHandler frame_callback;

	// Separate lock: drained notifications come from foreign threads too
	std::mutex drained_mutex;
	EventHandler drained_callback;
};
