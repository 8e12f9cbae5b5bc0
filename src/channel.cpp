#include "channel.hpp"
#include <iostream>

Channel::Channel(std::string peer_id) : peer_id(std::move(peer_id)) {
}

void Channel::setOpenCallback(EventHandler callback) {
	std::lock_guard<std::recursive_mutex> lock(callback_mutex);
	open_callback = std::move(callback);
}

void Channel::setCloseCallback(EventHandler callback) {
	std::lock_guard<std::recursive_mutex> lock(callback_mutex);
	close_callback = std::move(callback);
}

void Channel::setErrorCallback(ErrorHandler callback) {
	std::lock_guard<std::recursive_mutex> lock(callback_mutex);
	error_callback = std::move(callback);
}

void Channel::setMessageCallback(MessageHandler callback) {
	std::lock_guard<std::recursive_mutex> lock(callback_mutex);
	message_callback = std::move(callback);
}

void Channel::setFrameCallback(FrameHandler callback) {
	std::lock_guard<std::recursive_mutex> lock(callback_mutex);
	frame_callback = std::move(callback);
}

void Channel::setDrainedCallback(EventHandler callback) {
	std::lock_guard<std::mutex> lock(drained_mutex);
	drained_callback = std::move(callback);
}

void Channel::clearCallbacks() {
	{
		std::lock_guard<std::recursive_mutex> lock(callback_mutex);
		open_callback = nullptr;
		close_callback = nullptr;
		error_callback = nullptr;
		message_callback = nullptr;
		frame_callback = nullptr;
	}
	std::lock_guard<std::mutex> lock(drained_mutex);
	drained_callback = nullptr;
}

void Channel::notifyOpen() {
	std::lock_guard<std::recursive_mutex> lock(callback_mutex);
	if (open_callback) {
		// Copy first: the callback may replace itself
		EventHandler callback = open_callback;
		callback();
	}
}

void Channel::notifyClose() {
	std::lock_guard<std::recursive_mutex> lock(callback_mutex);
	if (close_callback) {
		EventHandler callback = close_callback;
		callback();
	}
}

void Channel::notifyError(const std::string& error) {
	std::lock_guard<std::recursive_mutex> lock(callback_mutex);
	if (error_callback) {
		ErrorHandler callback = error_callback;
		callback(error);
	} else {
		std::cerr << "Channel error on " << peer_id << ": " << error << std::endl;
	}
}

void Channel::notifyMessage(const TransferMessage& message) {
	std::lock_guard<std::recursive_mutex> lock(callback_mutex);
	if (message_callback) {
		MessageHandler callback = message_callback;
		callback(message);
	}
}

void Channel::notifyFrame(const std::vector<char>& frame) {
	std::lock_guard<std::recursive_mutex> lock(callback_mutex);
	if (frame_callback) {
		FrameHandler callback = frame_callback;
		callback(frame);
	}
}

void Channel::notifyDrained() {
	std::lock_guard<std::mutex> lock(drained_mutex);
	if (drained_callback) {
		drained_callback();
	}
}

void Channel::noteOutstandingDecrease(size_t before, size_t after) {
	size_t mark = low_water_mark.load();
	if (before > mark && after <= mark) {
		notifyDrained();
	}
}
