#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "protocol.hpp"

/**
 * Splits serialized chat messages that are too large for one control
 * message into ordered fragments. Cuts never split a UTF-8 sequence, so
 * every fragment is valid string content on its own.
 */
class MessageChunker {
public:
	explicit MessageChunker(size_t fragment_size);

	bool needsChunking(const std::string& serialized) const { return serialized.size() > fragment_size; }

	/**
	 * @param message_id: id of the chat message being split
	 * @param serialized: the message in its wire form
	 * @return: fragments in order, each tagged with index and total
	 */
	std::vector<ChunkedChatPayload> split(const std::string& message_id, const std::string& serialized) const;

	size_t fragmentSize() const { return fragment_size; }

private:
	size_t fragment_size;
};

/**
 * Collects fragments per message id and hands back the whole message once
 * every index arrived. Duplicate fragments never count twice, and a message
 * that was already assembled is never assembled again.
 */
class MessageReassembler {
public:
	enum class Result {
		ACCEPTED,    // new fragment stored, message incomplete
		DUPLICATE,   // fragment seen before, or message already assembled
		COMPLETED,   // this fragment finished the message
		INVALID      // index or total make no sense
	};

	/**
	 * @param assembled: receives the whole serialized message on COMPLETED
	 */
	Result addFragment(const ChunkedChatPayload& fragment, std::string& assembled);

	bool isCompleted(const std::string& message_id) const { return completed.count(message_id) > 0; }
	size_t pendingCount() const { return buffers.size(); }
	void clear();

private:
	struct Buffer {
		std::vector<std::string> parts;
		std::vector<bool> present;
		uint32_t received_count = 0;
	};

	std::map<std::string, Buffer> buffers;
	std::set<std::string> completed;
};
