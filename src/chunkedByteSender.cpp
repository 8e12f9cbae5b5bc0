#include "chunkedByteSender.hpp"
#include <algorithm>
#include <iostream>

const char* sendResultToString(SendResult result) {
	switch (result) {
		case SendResult::COMPLETED: return "completed";
		case SendResult::CHANNEL_CLOSED: return "channel closed";
		case SendResult::CANCELLED: return "cancelled";
		case SendResult::READ_ERROR: return "read error";
	}
	return "unknown";
}

ChunkedByteSender::ChunkedByteSender(std::shared_ptr<Channel> channel, FlowController& flow,
				     size_t frame_size, size_t read_batch_size)
	: channel(std::move(channel)), flow(flow), frame_size(frame_size),
	  read_batch_size(std::max(read_batch_size, frame_size)) {
}

SendResult ChunkedByteSender::send(const ByteSource& source, uint64_t start_offset,
				   const std::function<bool()>& still_valid) {
	const uint64_t total = source.size();
	uint64_t offset = std::min(start_offset, total);

	while (offset < total) {
		// Batch never exceeds what is left, so small files stay small in memory
		size_t want = static_cast<size_t>(std::min<uint64_t>(read_batch_size, total - offset));
		if (batch.size() < want) {
			batch.resize(want);
		}

		int64_t got = source.read(offset, batch.data(), want);
		if (got <= 0) {
			std::cerr << "Failed to read source at offset " << offset << std::endl;
			return SendResult::READ_ERROR;
		}

		size_t batch_length = static_cast<size_t>(got);
		for (size_t pos = 0; pos < batch_length; pos += frame_size) {
			if (!still_valid()) {
				return SendResult::CANCELLED;
			}

			if (!flow.waitForCapacity(still_valid)) {
				return channel->isOpen() ? SendResult::CANCELLED : SendResult::CHANNEL_CLOSED;
			}

			size_t length = std::min(frame_size, batch_length - pos);
			if (!channel->sendFrame(batch.data() + pos, length)) {
				return SendResult::CHANNEL_CLOSED;
			}

			if (frame_sent_callback) {
				frame_sent_callback(length);
			}
		}

		offset += batch_length;
	}

	return SendResult::COMPLETED;
}
