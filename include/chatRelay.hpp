#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <vector>
#include "channel.hpp"
#include "config.hpp"
#include "messageChunker.hpp"
#include "protocol.hpp"
#include "rendezvous.hpp"
#include "taskScheduler.hpp"

enum class ChatRole {
	HOST,
	GUEST
};

enum class ChatState {
	IDLE,
	CONNECTING,
	CHATTING,
	RECONNECTING,    // guest lost the host and is rejoining
	ERROR
};

const char* chatRoleToString(ChatRole role);
const char* chatStateToString(ChatState state);

/**
 * Which connections a chat message goes to
 * @param role: our role in the room
 * @param origin: connection the message came from, empty if typed locally
 * @param connections: currently open connections
 * @return: a host forwards to everyone but the origin, a guest only sends its own messages
 */
std::vector<std::string> relayTargets(ChatRole role, const std::string& origin,
				      const std::vector<std::string>& connections);

/**
 * ChatRelay is one participant of a chat room with star topology:
 * one host, guests connected only to the host. The host applies and relays
 * what a guest sends to every other guest, guests only apply.
 *
 * Every applied message id is remembered and a message seen again is dropped,
 * so relays and reconnects never show a message twice. Messages too large
 * for one control message travel as CHAT_MESSAGE_CHUNK fragments, which the
 * host forwards as they arrive.
 */
class ChatRelay {
public:
	using MessageCallback = std::function<void(const ChatMessage& message)>;
	using StateCallback = std::function<void(ChatState state, const std::string& error)>;

	ChatRelay(const ChatConfig& config, Rendezvous& rendezvous, const std::string& local_id);
	~ChatRelay();

	ChatRelay(const ChatRelay&) = delete;
	ChatRelay& operator=(const ChatRelay&) = delete;

	/**
	 * Opens a room under code
	 * @param restoring: reclaiming a room we hosted before; a taken code is then
	 *                   retried a bounded number of times instead of failing at once
	 * @return: true once registered; false on failure or while a retry is pending
	 */
	bool hostRoom(const std::string& code, bool restoring = false);

	/**
	 * Joins the room hosted under code
	 */
	bool joinRoom(const std::string& code);

	/**
	 * Leaves the room: closes every connection and stops reconnecting
	 */
	void leaveRoom();

	/**
	 * Sends a message to the room and applies it locally
	 * Missing id, sender and timestamp are filled in
	 * @return: false when not in a room or the attachment is too large
	 */
	bool sendMessage(ChatMessage message);

	bool sendText(const std::string& text);

	std::string generateMessageId();

	ChatState getState() const;
	ChatRole getRole() const;
	std::string getCode() const;
	const std::string& getLocalId() const { return local_id; }
	TransferError getLastError() const;
	std::string getErrorMessage() const;

	std::vector<ChatMessage> getMessages() const;
	size_t onlineCount() const;
	uint64_t duplicateCount() const;

	/**
	 * Closed connections whose handlers are still being unwound
	 */
	size_t retiredCount() const;

	void setMessageCallback(MessageCallback callback) { message_callback = callback; }
	void setStateCallback(StateCallback callback) { state_callback = callback; }

private:
	struct Connection {
		std::shared_ptr<Channel> channel;
		bool opened = false;
	};

	using Deferred = std::vector<std::function<void()>>;
	using Outgoing = std::vector<std::pair<std::shared_ptr<Channel>, TransferMessage>>;

	bool attemptHost(uint64_t session);
	bool attemptJoin(uint64_t session, bool first_attempt);
	void scheduleRejoin(uint64_t session);

	void handleIncoming(std::shared_ptr<Channel> channel, uint64_t session);
	void installCallbacks(const std::shared_ptr<Channel>& channel, const std::string& connection_id, uint64_t session);
	void handleOpen(const std::string& connection_id, uint64_t session);
	void handleMessage(const std::string& connection_id, uint64_t session, const TransferMessage& message);
	void handleClose(const std::string& connection_id, uint64_t session);
	void releaseRetired(const std::shared_ptr<Channel>& channel);

	bool applyLocked(const ChatMessage& message, Deferred& deferred);
	ChatMessage systemMessageLocked(const std::string& text);
	std::string newIdLocked();
	std::vector<std::shared_ptr<Channel>> targetsLocked(const std::string& origin) const;
	void queueLocked(const std::vector<std::shared_ptr<Channel>>& targets, const TransferMessage& message,
			 Outgoing& outgoing) const;
	void setStateLocked(ChatState new_state, Deferred& deferred);
	void failLocked(TransferError error, const std::string& reason, Deferred& deferred);

	/**
	 * Sends a message whole, or as paced fragments when it is too large
	 */
	bool broadcast(const ChatMessage& message, const std::vector<std::shared_ptr<Channel>>& targets);

	static void flush(Outgoing& outgoing);
	static void runDeferred(Deferred& deferred);

	ChatConfig config;
	Rendezvous& rendezvous;
	std::string local_id;
	MessageChunker chunker;
	TaskScheduler scheduler;

	mutable std::mutex mutex;
	ChatState state = ChatState::IDLE;
	ChatRole role = ChatRole::GUEST;
	std::string code;
	bool active = false;               // the user is in a room; drives reconnects
	bool restoring = false;
	bool registered = false;
	uint32_t host_attempts = 0;
	uint64_t session = 0;              // bumped on every host/join/leave
	TransferError last_error = TransferError::NONE;
	std::string error_message;

	std::map<std::string, Connection> connections;
	std::vector<std::shared_ptr<Channel>> retired_channels;
	std::vector<ChatMessage> messages;
	std::set<std::string> applied_ids;
	MessageReassembler reassembler;
	uint64_t duplicates = 0;
	std::mt19937 rng;

	MessageCallback message_callback;
	StateCallback state_callback;
};
