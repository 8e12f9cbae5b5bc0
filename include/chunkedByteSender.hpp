#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>
#include "byteSource.hpp"
#include "channel.hpp"
#include "flowController.hpp"

enum class SendResult {
	COMPLETED,
	CHANNEL_CLOSED,
	CANCELLED,
	READ_ERROR
};

const char* sendResultToString(SendResult result);

/**
 * ChunkedByteSender streams a byte source onto a channel as fixed-size
 * binary frames, in order and without gaps.
 *
 * Reads are batched (read_batch_size) and each batch is sliced into frames.
 * Every frame waits on the FlowController first. A failed send aborts the
 * stream; retrying is up to the session that owns the sender.
 */
class ChunkedByteSender {
private:
	std::shared_ptr<Channel> channel;
	FlowController& flow;
	size_t frame_size;
	size_t read_batch_size;
	std::vector<char> batch;

	std::function<void(size_t)> frame_sent_callback;

public:
	ChunkedByteSender(std::shared_ptr<Channel> channel, FlowController& flow,
			  size_t frame_size, size_t read_batch_size);

	/**
	 * Sends source[start_offset, size) as frames
	 * @param still_valid: polled before every frame; false cancels the stream
	 */
	SendResult send(const ByteSource& source, uint64_t start_offset, const std::function<bool()>& still_valid);

	/**
	 * Called with each frame's length right after it was handed to the channel
	 */
	void setFrameSentCallback(std::function<void(size_t)> callback) {
		frame_sent_callback = callback;
	}

	size_t getFrameSize() const { return frame_size; }
};
