#include "chatRelay.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <iostream>
#include <thread>

using json = nlohmann::json;

const char* chatRoleToString(ChatRole role) {
	switch (role) {
		case ChatRole::HOST: return "host";
		case ChatRole::GUEST: return "guest";
	}
	return "unknown";
}

const char* chatStateToString(ChatState state) {
	switch (state) {
		case ChatState::IDLE: return "idle";
		case ChatState::CONNECTING: return "connecting";
		case ChatState::CHATTING: return "chatting";
		case ChatState::RECONNECTING: return "reconnecting";
		case ChatState::ERROR: return "error";
	}
	return "unknown";
}

std::vector<std::string> relayTargets(ChatRole role, const std::string& origin,
				      const std::vector<std::string>& connections) {
	std::vector<std::string> targets;
	if (role == ChatRole::GUEST && !origin.empty()) {
		return targets;
	}
	for (const auto& id : connections) {
		if (id != origin) {
			targets.push_back(id);
		}
	}
	return targets;
}

static std::string toBase36(uint64_t value) {
	static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
	std::string result;
	do {
		result.insert(result.begin(), digits[value % 36]);
		value /= 36;
	} while (value > 0);
	return result;
}

ChatRelay::ChatRelay(const ChatConfig& config, Rendezvous& rendezvous, const std::string& local_id)
	: config(config), rendezvous(rendezvous), local_id(local_id), chunker(config.fragment_size),
	  rng(std::random_device{}()) {
}

ChatRelay::~ChatRelay() {
	scheduler.stop();
	leaveRoom();

	std::vector<std::shared_ptr<Channel>> retired;
	{
		std::lock_guard<std::mutex> lock(mutex);
		retired.swap(retired_channels);
	}
	for (auto& channel : retired) {
		channel->clearCallbacks();
	}
}

bool ChatRelay::hostRoom(const std::string& room_code, bool restoring_room) {
	uint64_t host_session;
	Deferred deferred;
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (active) {
			std::cerr << "Already in room " << code << std::endl;
			return false;
		}

		role = ChatRole::HOST;
		code = room_code;
		active = true;
		restoring = restoring_room;
		host_attempts = 0;
		host_session = ++session;
		last_error = TransferError::NONE;
		error_message.clear();
		setStateLocked(ChatState::CONNECTING, deferred);
	}
	runDeferred(deferred);

	return attemptHost(host_session);
}

bool ChatRelay::attemptHost(uint64_t host_session) {
	std::string room_code;
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (session != host_session || !active) {
			return false;
		}
		room_code = code;
	}

	RegistrationResult result = rendezvous.registerIdentity(room_code, [this, host_session](std::shared_ptr<Channel> channel) {
		handleIncoming(channel, host_session);
	});

	Deferred deferred;
	bool hosted = false;
	{
		std::unique_lock<std::mutex> lock(mutex);
		if (session != host_session || !active) {
			// Left while registering
			lock.unlock();
			if (result == RegistrationResult::OK) {
				rendezvous.unregisterIdentity(room_code);
			}
			return false;
		}

		switch (result) {
			case RegistrationResult::OK:
				registered = true;
				host_attempts = 0;
				hosted = true;
				std::cout << "Chat room ready: " << room_code << std::endl;
				setStateLocked(ChatState::CHATTING, deferred);
				applyLocked(systemMessageLocked(restoring ? "chat session restored"
								      : "room created, code: " + room_code), deferred);
				break;

			case RegistrationResult::IDENTITY_TAKEN:
				if (restoring && host_attempts < config.max_host_retries) {
					host_attempts++;
					std::cout << "Room code taken, retrying (" << host_attempts << "/"
						  << config.max_host_retries << ")..." << std::endl;
					scheduler.schedule(std::chrono::milliseconds(config.host_retry_delay_ms), [this, host_session]() {
						attemptHost(host_session);
					});
				} else if (restoring) {
					failLocked(TransferError::IDENTITY_CONFLICT, "could not restore the room, code still in use", deferred);
				} else {
					failLocked(TransferError::IDENTITY_CONFLICT, "room code already in use", deferred);
				}
				break;

			case RegistrationResult::FAILED:
				failLocked(TransferError::IO_ERROR, "could not open room " + room_code, deferred);
				break;
		}
	}

	runDeferred(deferred);
	return hosted;
}

bool ChatRelay::joinRoom(const std::string& room_code) {
	uint64_t join_session;
	Deferred deferred;
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (active) {
			std::cerr << "Already in room " << code << std::endl;
			return false;
		}

		role = ChatRole::GUEST;
		code = room_code;
		active = true;
		restoring = false;
		join_session = ++session;
		last_error = TransferError::NONE;
		error_message.clear();
		setStateLocked(ChatState::CONNECTING, deferred);
	}
	runDeferred(deferred);

	return attemptJoin(join_session, true);
}

bool ChatRelay::attemptJoin(uint64_t join_session, bool first_attempt) {
	std::string room_code;
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (session != join_session || !active) {
			return false;
		}
		room_code = code;
	}

	std::shared_ptr<Channel> channel = rendezvous.connect(room_code, local_id);

	Deferred deferred;
	{
		std::unique_lock<std::mutex> lock(mutex);
		if (session != join_session || !active) {
			lock.unlock();
			if (channel) {
				channel->close();
			}
			return false;
		}

		if (!channel) {
			if (first_attempt) {
				failLocked(TransferError::CHANNEL_CLOSED, "could not join room " + room_code, deferred);
				lock.unlock();
				runDeferred(deferred);
				return false;
			}
			lock.unlock();
			std::cerr << "Room " << room_code << " unreachable, retrying" << std::endl;
			scheduleRejoin(join_session);
			return false;
		}

		std::string connection_id = channel->peerId();
		Connection connection;
		connection.channel = channel;
		connections[connection_id] = connection;
		installCallbacks(channel, connection_id, join_session);
	}

	channel->open();
	return true;
}

void ChatRelay::scheduleRejoin(uint64_t join_session) {
	scheduler.schedule(std::chrono::milliseconds(config.reconnect_delay_ms), [this, join_session]() {
		attemptJoin(join_session, false);
	});
}

void ChatRelay::leaveRoom() {
	std::map<std::string, Connection> closing;
	std::vector<std::shared_ptr<Channel>> retired;
	std::string old_code;
	bool was_registered = false;
	Deferred deferred;
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (!active && state == ChatState::IDLE) {
			return;
		}

		active = false;
		session++;
		closing.swap(connections);
		retired.swap(retired_channels);
		old_code = code;
		was_registered = registered;
		registered = false;
		code.clear();

		messages.clear();
		applied_ids.clear();
		reassembler.clear();
		host_attempts = 0;
		setStateLocked(ChatState::IDLE, deferred);
	}

	scheduler.cancelAll();
	if (was_registered) {
		rendezvous.unregisterIdentity(old_code);
	}

	for (auto& entry : closing) {
		entry.second.channel->clearCallbacks();
		entry.second.channel->close();
	}
	for (auto& channel : retired) {
		channel->clearCallbacks();
	}

	if (!old_code.empty()) {
		std::cout << "Left chat room " << old_code << std::endl;
	}
	runDeferred(deferred);
}

void ChatRelay::handleIncoming(std::shared_ptr<Channel> channel, uint64_t host_session) {
	std::string connection_id = channel->peerId();
	{
		std::unique_lock<std::mutex> lock(mutex);
		if (session != host_session || !active || role != ChatRole::HOST || connections.count(connection_id) > 0) {
			lock.unlock();
			channel->close();
			return;
		}

		Connection connection;
		connection.channel = channel;
		connections[connection_id] = connection;
		installCallbacks(channel, connection_id, host_session);
	}
	channel->open();
}

void ChatRelay::installCallbacks(const std::shared_ptr<Channel>& channel, const std::string& connection_id,
				 uint64_t connection_session) {
	channel->setOpenCallback([this, connection_id, connection_session]() {
		handleOpen(connection_id, connection_session);
	});
	channel->setMessageCallback([this, connection_id, connection_session](const TransferMessage& message) {
		handleMessage(connection_id, connection_session, message);
	});
	channel->setCloseCallback([this, connection_id, connection_session]() {
		handleClose(connection_id, connection_session);
	});
	channel->setErrorCallback([connection_id](const std::string& error) {
		std::cerr << "Chat connection error with " << connection_id << ": " << error << std::endl;
	});
}

void ChatRelay::handleOpen(const std::string& connection_id, uint64_t connection_session) {
	Deferred deferred;
	Outgoing outgoing;
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (session != connection_session) {
			return;
		}
		auto it = connections.find(connection_id);
		if (it == connections.end()) {
			return;
		}
		it->second.opened = true;

		if (role == ChatRole::HOST) {
			std::cout << "Member joined: " << connection_id << std::endl;
			ChatMessage joined = systemMessageLocked("member joined (" + connection_id + ")");
			applyLocked(joined, deferred);
			queueLocked(targetsLocked(connection_id), makeMessage(MessageType::CHAT_MESSAGE, joined), outgoing);
		} else {
			std::cout << "Joined chat room " << code << std::endl;
			setStateLocked(ChatState::CHATTING, deferred);
			applyLocked(systemMessageLocked("joined the room"), deferred);
		}
	}
	flush(outgoing);
	runDeferred(deferred);
}

void ChatRelay::handleMessage(const std::string& connection_id, uint64_t connection_session, const TransferMessage& message) {
	Deferred deferred;
	Outgoing outgoing;
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (session != connection_session || connections.count(connection_id) == 0) {
			return;
		}

		if (message.type == MessageType::CHAT_MESSAGE) {
			ChatMessage chat;
			try {
				chat = message.data.get<ChatMessage>();
			} catch (const json::exception& e) {
				std::cerr << "Malformed chat message from " << connection_id << ": " << e.what() << std::endl;
				return;
			} catch (const std::invalid_argument& e) {
				std::cerr << "Malformed chat message from " << connection_id << ": " << e.what() << std::endl;
				return;
			}

			if (applyLocked(chat, deferred)) {
				queueLocked(targetsLocked(connection_id), message, outgoing);
			}
		} else if (message.type == MessageType::CHAT_MESSAGE_CHUNK) {
			ChunkedChatPayload fragment;
			try {
				fragment = message.data.get<ChunkedChatPayload>();
			} catch (const json::exception& e) {
				std::cerr << "Malformed chat fragment from " << connection_id << ": " << e.what() << std::endl;
				return;
			}

			if (applied_ids.count(fragment.message_id) > 0) {
				duplicates++;
				return;
			}

			std::string assembled;
			MessageReassembler::Result result = reassembler.addFragment(fragment, assembled);
			switch (result) {
				case MessageReassembler::Result::INVALID:
					std::cerr << "Invalid fragment " << fragment.index << "/" << fragment.total
						  << " of " << fragment.message_id << std::endl;
					return;
				case MessageReassembler::Result::DUPLICATE:
					duplicates++;
					return;
				case MessageReassembler::Result::ACCEPTED:
				case MessageReassembler::Result::COMPLETED:
					// Forwarded right away, the other guests reassemble on their own
					queueLocked(targetsLocked(connection_id), message, outgoing);
					break;
			}

			if (result == MessageReassembler::Result::COMPLETED) {
				try {
					applyLocked(json::parse(assembled).get<ChatMessage>(), deferred);
				} catch (const json::exception& e) {
					std::cerr << "Failed to parse chunked message " << fragment.message_id << ": " << e.what() << std::endl;
				} catch (const std::invalid_argument& e) {
					std::cerr << "Failed to parse chunked message " << fragment.message_id << ": " << e.what() << std::endl;
				}
			}
		} else {
			std::cerr << "Ignoring " << messageTypeToString(message.type) << " in chat room" << std::endl;
		}
	}
	flush(outgoing);
	runDeferred(deferred);
}

void ChatRelay::handleClose(const std::string& connection_id, uint64_t connection_session) {
	Deferred deferred;
	Outgoing outgoing;
	uint64_t rejoin_session = 0;
	std::shared_ptr<Channel> closed_channel;
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (session != connection_session) {
			return;
		}
		auto it = connections.find(connection_id);
		if (it == connections.end()) {
			return;
		}
		bool was_open = it->second.opened;
		closed_channel = it->second.channel;
		retired_channels.push_back(closed_channel);
		connections.erase(it);

		if (role == ChatRole::HOST) {
			if (was_open) {
				std::cout << "Member left: " << connection_id << std::endl;
				ChatMessage left = systemMessageLocked("member left (" + connection_id + ")");
				applyLocked(left, deferred);
				queueLocked(targetsLocked(""), makeMessage(MessageType::CHAT_MESSAGE, left), outgoing);
			}
		} else if (active) {
			std::cerr << "Lost connection to room " << code << std::endl;
			applyLocked(systemMessageLocked("connection lost, reconnecting"), deferred);
			setStateLocked(ChatState::RECONNECTING, deferred);
			rejoin_session = session;
		}
	}

	if (rejoin_session != 0) {
		scheduleRejoin(rejoin_session);
	}
	flush(outgoing);
	runDeferred(deferred);

	// We are on the channel's own thread, so clearing cannot wait on anything
	closed_channel->clearCallbacks();
	releaseRetired(closed_channel);
}

void ChatRelay::releaseRetired(const std::shared_ptr<Channel>& channel) {
	std::lock_guard<std::mutex> lock(mutex);
	auto it = std::find(retired_channels.begin(), retired_channels.end(), channel);
	if (it != retired_channels.end()) {
		retired_channels.erase(it);
	}
}

bool ChatRelay::sendMessage(ChatMessage message) {
	std::vector<std::shared_ptr<Channel>> targets;
	Deferred deferred;
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (state != ChatState::CHATTING) {
			std::cerr << "Not in a chat room" << std::endl;
			return false;
		}
		if (message.has_file_data && message.file_data.size > config.max_attachment_bytes) {
			std::cerr << "Attachment " << message.file_data.name << " is larger than the chat limit of "
				  << config.max_attachment_bytes << " bytes" << std::endl;
			return false;
		}

		if (message.id.empty()) {
			message.id = newIdLocked();
		}
		if (message.sender_id.empty()) {
			message.sender_id = local_id;
		}
		if (message.timestamp == 0) {
			message.timestamp = currentTimeMillis();
		}

		if (!applyLocked(message, deferred)) {
			return false;
		}
		targets = targetsLocked("");
	}
	runDeferred(deferred);

	return broadcast(message, targets);
}

bool ChatRelay::sendText(const std::string& text) {
	ChatMessage message;
	message.type = ChatMessageType::TEXT;
	message.content = text;
	return sendMessage(message);
}

bool ChatRelay::broadcast(const ChatMessage& message, const std::vector<std::shared_ptr<Channel>>& targets) {
	std::string serialized;
	try {
		serialized = json(message).dump();
	} catch (const json::exception& e) {
		std::cerr << "Cannot encode chat message: " << e.what() << std::endl;
		return false;
	}

	if (!chunker.needsChunking(serialized)) {
		TransferMessage whole = makeMessage(MessageType::CHAT_MESSAGE, message);
		for (const auto& channel : targets) {
			if (channel->isOpen() && !channel->send(whole)) {
				std::cerr << "Send failed to " << channel->peerId() << std::endl;
			}
		}
		return true;
	}

	std::vector<ChunkedChatPayload> fragments = chunker.split(message.id, serialized);
	for (size_t i = 0; i < fragments.size(); i++) {
		TransferMessage chunk = makeMessage(MessageType::CHAT_MESSAGE_CHUNK, fragments[i]);
		for (const auto& channel : targets) {
			if (channel->isOpen() && !channel->send(chunk)) {
				std::cerr << "Send chunk failed to " << channel->peerId() << std::endl;
			}
		}

		// Let other work on this thread breathe between fragments
		if (i % config.yield_every == 0) {
			std::this_thread::yield();
		}
		if (i % config.pause_every == 0) {
			std::this_thread::sleep_for(std::chrono::milliseconds(config.pause_ms));
		}
	}
	return true;
}

std::string ChatRelay::generateMessageId() {
	std::lock_guard<std::mutex> lock(mutex);
	return newIdLocked();
}

// Time in base 36 plus four random base 36 digits
std::string ChatRelay::newIdLocked() {
	return toBase36(static_cast<uint64_t>(currentTimeMillis())) + toBase36(rng() % 1679616);
}

bool ChatRelay::applyLocked(const ChatMessage& message, Deferred& deferred) {
	if (!applied_ids.insert(message.id).second) {
		duplicates++;
		return false;
	}
	messages.push_back(message);

	if (message_callback) {
		MessageCallback callback = message_callback;
		deferred.push_back([callback, message]() { callback(message); });
	}
	return true;
}

ChatMessage ChatRelay::systemMessageLocked(const std::string& text) {
	ChatMessage message;
	message.id = newIdLocked();
	message.sender_id = "system";
	message.type = ChatMessageType::TEXT;
	message.content = text;
	message.timestamp = currentTimeMillis();
	message.is_system = true;
	return message;
}

std::vector<std::shared_ptr<Channel>> ChatRelay::targetsLocked(const std::string& origin) const {
	std::vector<std::string> open_ids;
	for (const auto& entry : connections) {
		if (entry.second.opened) {
			open_ids.push_back(entry.first);
		}
	}

	std::vector<std::shared_ptr<Channel>> targets;
	for (const auto& id : relayTargets(role, origin, open_ids)) {
		targets.push_back(connections.at(id).channel);
	}
	return targets;
}

void ChatRelay::queueLocked(const std::vector<std::shared_ptr<Channel>>& targets, const TransferMessage& message,
			    Outgoing& outgoing) const {
	for (const auto& channel : targets) {
		outgoing.emplace_back(channel, message);
	}
}

void ChatRelay::setStateLocked(ChatState new_state, Deferred& deferred) {
	if (state == new_state) {
		return;
	}
	state = new_state;

	if (state_callback) {
		StateCallback callback = state_callback;
		std::string error = error_message;
		deferred.push_back([callback, new_state, error]() { callback(new_state, error); });
	}
}

void ChatRelay::failLocked(TransferError error, const std::string& reason, Deferred& deferred) {
	std::cerr << "Chat room error: " << reason << std::endl;
	active = false;
	last_error = error;
	error_message = reason;
	setStateLocked(ChatState::ERROR, deferred);
}

void ChatRelay::flush(Outgoing& outgoing) {
	for (auto& item : outgoing) {
		if (item.first->isOpen() && !item.first->send(item.second)) {
			std::cerr << "Relay failed to " << item.first->peerId() << std::endl;
		}
	}
	outgoing.clear();
}

void ChatRelay::runDeferred(Deferred& deferred) {
	for (auto& notify : deferred) {
		notify();
	}
	deferred.clear();
}

ChatState ChatRelay::getState() const {
	std::lock_guard<std::mutex> lock(mutex);
	return state;
}

ChatRole ChatRelay::getRole() const {
	std::lock_guard<std::mutex> lock(mutex);
	return role;
}

std::string ChatRelay::getCode() const {
	std::lock_guard<std::mutex> lock(mutex);
	return code;
}

TransferError ChatRelay::getLastError() const {
	std::lock_guard<std::mutex> lock(mutex);
	return last_error;
}

std::string ChatRelay::getErrorMessage() const {
	std::lock_guard<std::mutex> lock(mutex);
	return error_message;
}

std::vector<ChatMessage> ChatRelay::getMessages() const {
	std::lock_guard<std::mutex> lock(mutex);
	return messages;
}

size_t ChatRelay::onlineCount() const {
	std::lock_guard<std::mutex> lock(mutex);
	size_t count = 1;
	for (const auto& entry : connections) {
		if (entry.second.opened) {
			count++;
		}
	}
	return count;
}

size_t ChatRelay::retiredCount() const {
	std::lock_guard<std::mutex> lock(mutex);
	return retired_channels.size();
}

uint64_t ChatRelay::duplicateCount() const {
	std::lock_guard<std::mutex> lock(mutex);
	return duplicates;
}
