#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "channel.hpp"
#include "rendezvous.hpp"

struct MemoryChannelOptions {
	uint64_t drain_bytes_per_second = 0;   // 0 delivers as fast as the dispatch thread runs
	size_t max_frame_size = 256 * 1024;
};

/**
 * MemoryChannel is one endpoint of an in-process channel pair.
 * Every endpoint owns a dispatch thread that delivers what the other side
 * sent, in order. Outstanding bytes are the bytes this side has sent that
 * the other side has not dispatched yet, so a throttled pair behaves like a
 * slow link with a growing send buffer.
 */
class MemoryChannel : public Channel, public std::enable_shared_from_this<MemoryChannel> {
public:
	/**
	 * Creates a connected pair
	 * @param first_name: identity of the first endpoint's owner
	 * @param second_name: identity of the second endpoint's owner
	 * @return: {first owner's end (peerId = second_name), second owner's end (peerId = first_name)}
	 */
	static std::pair<std::shared_ptr<MemoryChannel>, std::shared_ptr<MemoryChannel>>
	createPair(const std::string& first_name, const std::string& second_name,
		   const MemoryChannelOptions& options = MemoryChannelOptions());

	~MemoryChannel() override;

	void open() override;
	void close() override;
	bool isOpen() const override;
	bool send(const TransferMessage& message) override;
	bool sendFrame(const char* data, size_t length) override;
	size_t outstandingBytes() const override;
	size_t maxFrameSize() const override { return options.max_frame_size; }

private:
	struct Event {
		enum Kind { OPEN, CONTROL, BINARY, CLOSE } kind = OPEN;
		TransferMessage message{};
		std::vector<char> frame;
		size_t bytes = 0;
	};

	struct Inbox {
		std::mutex mutex;
		std::condition_variable cv;
		std::deque<Event> events;
		bool stopping = false;
	};

	// State shared by both endpoints of a pair
	struct Link {
		std::atomic<bool> closed{false};
		std::atomic<size_t> outstanding[2];
		Link() { outstanding[0] = 0; outstanding[1] = 0; }
	};

	MemoryChannel(const std::string& peer_id, std::shared_ptr<Link> link, int side,
		      const MemoryChannelOptions& options);

	static void dispatchLoop(std::shared_ptr<Inbox> inbox, std::weak_ptr<MemoryChannel> weak_self);

	/**
	 * Handles one event on the dispatch thread
	 * @return: false once the close event has been delivered
	 */
	bool dispatch(Event& event);

	bool enqueueToPeer(Event event);
	void shutdownLink();

	std::shared_ptr<Link> link;
	int side;
	MemoryChannelOptions options;
	std::shared_ptr<Inbox> inbox;
	std::weak_ptr<MemoryChannel> peer;
	std::atomic<bool> started{false};
	std::thread dispatch_thread;
};

/**
 * InProcessRendezvous hands out MemoryChannel pairs between registered
 * codes and connecting peers living in the same process.
 */
class InProcessRendezvous : public Rendezvous {
public:
	explicit InProcessRendezvous(MemoryChannelOptions options = MemoryChannelOptions());

	RegistrationResult registerIdentity(const std::string& code, IncomingHandler on_incoming) override;
	void unregisterIdentity(const std::string& code) override;
	std::shared_ptr<Channel> connect(const std::string& code, const std::string& local_id) override;

	/**
	 * Options used for connections created from now on
	 */
	void setConnectionOptions(const MemoryChannelOptions& options);

	bool isRegistered(const std::string& code) const;

	/**
	 * Closes every live channel handed out so far, like a network outage
	 */
	void dropAllConnections();

private:
	mutable std::mutex registry_mutex;
	std::map<std::string, IncomingHandler> registry;
	std::vector<std::weak_ptr<MemoryChannel>> live_channels;
	MemoryChannelOptions connection_options;
	uint64_t next_connection_id = 1;
};
