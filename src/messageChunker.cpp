#include "messageChunker.hpp"
#include <algorithm>

MessageChunker::MessageChunker(size_t fragment_size) : fragment_size(std::max<size_t>(fragment_size, 4)) {
}

static bool isContinuationByte(char c) {
	return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

std::vector<ChunkedChatPayload> MessageChunker::split(const std::string& message_id, const std::string& serialized) const {
	std::vector<std::string> pieces;

	size_t pos = 0;
	while (pos < serialized.size()) {
		size_t end = std::min(pos + fragment_size, serialized.size());

		// Back off to the start of a code point; a fragment always holds at least one
		if (end < serialized.size()) {
			size_t cut = end;
			while (cut > pos && isContinuationByte(serialized[cut])) {
				cut--;
			}
			if (cut > pos) {
				end = cut;
			}
		}

		pieces.push_back(serialized.substr(pos, end - pos));
		pos = end;
	}

	std::vector<ChunkedChatPayload> fragments;
	uint32_t total = static_cast<uint32_t>(pieces.size());
	for (uint32_t i = 0; i < total; i++) {
		ChunkedChatPayload fragment;
		fragment.message_id = message_id;
		fragment.index = i;
		fragment.total = total;
		fragment.fragment = std::move(pieces[i]);
		fragments.push_back(std::move(fragment));
	}
	return fragments;
}

MessageReassembler::Result MessageReassembler::addFragment(const ChunkedChatPayload& fragment, std::string& assembled) {
	if (fragment.message_id.empty() || fragment.total == 0 || fragment.index >= fragment.total) {
		return Result::INVALID;
	}
	if (completed.count(fragment.message_id) > 0) {
		return Result::DUPLICATE;
	}

	auto it = buffers.find(fragment.message_id);
	if (it == buffers.end()) {
		Buffer buffer;
		buffer.parts.resize(fragment.total);
		buffer.present.assign(fragment.total, false);
		it = buffers.emplace(fragment.message_id, std::move(buffer)).first;
	}

	Buffer& buffer = it->second;
	if (buffer.parts.size() != fragment.total) {
		return Result::INVALID;
	}
	if (buffer.present[fragment.index]) {
		return Result::DUPLICATE;
	}

	buffer.parts[fragment.index] = fragment.fragment;
	buffer.present[fragment.index] = true;
	buffer.received_count++;

	if (buffer.received_count < fragment.total) {
		return Result::ACCEPTED;
	}

	assembled.clear();
	for (const auto& part : buffer.parts) {
		assembled += part;
	}
	completed.insert(fragment.message_id);
	buffers.erase(it);
	return Result::COMPLETED;
}

void MessageReassembler::clear() {
	buffers.clear();
	completed.clear();
}
