#include "memoryChannel.hpp"
#include <chrono>
#include <iostream>

using json = nlohmann::json;

MemoryChannel::MemoryChannel(const std::string& peer_id, std::shared_ptr<Link> link, int side,
			     const MemoryChannelOptions& options)
	: Channel(peer_id), link(std::move(link)), side(side), options(options), inbox(std::make_shared<Inbox>()) {
}

std::pair<std::shared_ptr<MemoryChannel>, std::shared_ptr<MemoryChannel>>
MemoryChannel::createPair(const std::string& first_name, const std::string& second_name,
			  const MemoryChannelOptions& options) {
	auto link = std::make_shared<Link>();

	// Constructor is private, so make_shared is not available here
	std::shared_ptr<MemoryChannel> first(new MemoryChannel(second_name, link, 0, options));
	std::shared_ptr<MemoryChannel> second(new MemoryChannel(first_name, link, 1, options));
	first->peer = second;
	second->peer = first;

	// Both sides see the open event before any data
	Event opened;
	opened.kind = Event::OPEN;
	first->inbox->events.push_back(opened);
	second->inbox->events.push_back(opened);

	return {first, second};
}

MemoryChannel::~MemoryChannel() {
	shutdownLink();

	{
		std::lock_guard<std::mutex> lock(inbox->mutex);
		inbox->stopping = true;
	}
	inbox->cv.notify_all();

	if (dispatch_thread.joinable()) {
		// The last reference can be dropped from inside one of our own callbacks
		if (dispatch_thread.get_id() == std::this_thread::get_id()) {
			dispatch_thread.detach();
		} else {
			dispatch_thread.join();
		}
	}
}

void MemoryChannel::open() {
	if (started.exchange(true)) {
		return;
	}
	dispatch_thread = std::thread(&MemoryChannel::dispatchLoop, inbox, weak_from_this());
}

void MemoryChannel::close() {
	shutdownLink();
}

void MemoryChannel::shutdownLink() {
	if (link->closed.exchange(true)) {
		return;
	}

	Event closed;
	closed.kind = Event::CLOSE;

	{
		std::lock_guard<std::mutex> lock(inbox->mutex);
		inbox->events.push_back(closed);
	}
	inbox->cv.notify_all();

	std::shared_ptr<MemoryChannel> other = peer.lock();
	if (other) {
		{
			std::lock_guard<std::mutex> lock(other->inbox->mutex);
			other->inbox->events.push_back(closed);
		}
		other->inbox->cv.notify_all();
		other->notifyDrained();
	}

	// Release anyone blocked on our send buffer right away
	notifyDrained();
}

bool MemoryChannel::isOpen() const {
	return !link->closed.load();
}

bool MemoryChannel::enqueueToPeer(Event event) {
	std::shared_ptr<MemoryChannel> other = peer.lock();
	if (!other) {
		return false;
	}

	{
		std::lock_guard<std::mutex> lock(other->inbox->mutex);
		// Checked under the inbox lock so nothing lands behind the close event
		if (link->closed.load()) {
			return false;
		}
		link->outstanding[side] += event.bytes;
		other->inbox->events.push_back(std::move(event));
	}
	other->inbox->cv.notify_all();
	return true;
}

bool MemoryChannel::send(const TransferMessage& message) {
	Event event;
	event.kind = Event::CONTROL;
	event.message = message;
	try {
		event.bytes = message.serialize().size();
	} catch (const json::exception& e) {
		std::cerr << "Cannot encode " << messageTypeToString(message.type)
			  << " for " << peerId() << ": " << e.what() << std::endl;
		return false;
	}
	return enqueueToPeer(std::move(event));
}

bool MemoryChannel::sendFrame(const char* data, size_t length) {
	if (length > options.max_frame_size) {
		std::cerr << "Frame of " << length << " bytes exceeds channel limit of "
			  << options.max_frame_size << std::endl;
		return false;
	}

	Event event;
	event.kind = Event::BINARY;
	event.frame.assign(data, data + length);
	event.bytes = length;
	return enqueueToPeer(std::move(event));
}

size_t MemoryChannel::outstandingBytes() const {
	return link->outstanding[side].load();
}

void MemoryChannel::dispatchLoop(std::shared_ptr<Inbox> inbox, std::weak_ptr<MemoryChannel> weak_self) {
	for (;;) {
		Event event;
		{
			std::unique_lock<std::mutex> lock(inbox->mutex);
			inbox->cv.wait(lock, [&inbox] { return inbox->stopping || !inbox->events.empty(); });
			if (inbox->stopping) {
				return;
			}
			event = std::move(inbox->events.front());
			inbox->events.pop_front();
		}

		// Only touch the endpoint while holding a strong reference to it
		std::shared_ptr<MemoryChannel> self = weak_self.lock();
		if (!self) {
			return;
		}
		if (!self->dispatch(event)) {
			return;
		}
	}
}

bool MemoryChannel::dispatch(Event& event) {
	switch (event.kind) {
		case Event::OPEN:
			notifyOpen();
			return true;

		case Event::CLOSE:
			notifyDrained();
			notifyClose();
			return false;

		case Event::CONTROL:
		case Event::BINARY: {
			if (options.drain_bytes_per_second > 0) {
				auto delay = std::chrono::microseconds(event.bytes * 1000000 / options.drain_bytes_per_second);
				std::this_thread::sleep_for(delay);
			}

			// The sender's buffer shrinks once the bytes are on our side
			int other_side = 1 - side;
			size_t before = link->outstanding[other_side].fetch_sub(event.bytes);
			std::shared_ptr<MemoryChannel> other = peer.lock();
			if (other) {
				other->noteOutstandingDecrease(before, before - event.bytes);
			}

			if (event.kind == Event::CONTROL) {
				notifyMessage(event.message);
			} else {
				notifyFrame(event.frame);
			}
			return true;
		}
	}
	return true;
}

InProcessRendezvous::InProcessRendezvous(MemoryChannelOptions options) : connection_options(options) {
}

RegistrationResult InProcessRendezvous::registerIdentity(const std::string& code, IncomingHandler on_incoming) {
	std::lock_guard<std::mutex> lock(registry_mutex);
	if (registry.count(code) > 0) {
		return RegistrationResult::IDENTITY_TAKEN;
	}
	registry[code] = std::move(on_incoming);
	return RegistrationResult::OK;
}

void InProcessRendezvous::unregisterIdentity(const std::string& code) {
	std::lock_guard<std::mutex> lock(registry_mutex);
	registry.erase(code);
}

std::shared_ptr<Channel> InProcessRendezvous::connect(const std::string& code, const std::string& local_id) {
	std::lock_guard<std::mutex> lock(registry_mutex);

	auto it = registry.find(code);
	if (it == registry.end()) {
		std::cerr << "No peer registered under code " << code << std::endl;
		return nullptr;
	}

	// Connection ids stay unique even when the same peer reconnects
	std::string connection_id = local_id + "#" + std::to_string(next_connection_id++);
	auto pair = MemoryChannel::createPair(connection_id, code, connection_options);

	live_channels.push_back(pair.first);
	live_channels.push_back(pair.second);

	// Invoked under the lock so unregisterIdentity() is a hard cut-off
	it->second(pair.second);

	return pair.first;
}

void InProcessRendezvous::setConnectionOptions(const MemoryChannelOptions& options) {
	std::lock_guard<std::mutex> lock(registry_mutex);
	connection_options = options;
}

bool InProcessRendezvous::isRegistered(const std::string& code) const {
	std::lock_guard<std::mutex> lock(registry_mutex);
	return registry.count(code) > 0;
}

void InProcessRendezvous::dropAllConnections() {
	std::vector<std::shared_ptr<MemoryChannel>> channels;
	{
		std::lock_guard<std::mutex> lock(registry_mutex);
		for (auto& weak : live_channels) {
			if (auto channel = weak.lock()) {
				channels.push_back(channel);
			}
		}
		live_channels.clear();
	}
	for (auto& channel : channels) {
		channel->close();
	}
}
