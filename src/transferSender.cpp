#include "transferSender.hpp"
#include <algorithm>
#include <iostream>

using json = nlohmann::json;

TransferSender::TransferSender(std::shared_ptr<Channel> channel, std::shared_ptr<const ShareSet> share,
			       const TransferConfig& config, std::shared_ptr<std::atomic<uint64_t>> session_epoch)
	: peer_id(channel->peerId()), channel(channel), share(std::move(share)), config(config),
	  session_epoch(std::move(session_epoch)),
	  flow(channel, config.high_water_mark, config.low_water_mark),
	  byte_sender(channel, flow, config.frame_size, config.read_batch_size) {

	state.peer_id = peer_id;

	byte_sender.setFrameSentCallback([this](size_t length) {
		bytes_handed += length;
		std::lock_guard<std::mutex> lock(state_mutex);
		state.bytes_sent_for_current_file += length;
	});
}

TransferSender::~TransferSender() {
	shutdown();
}

bool TransferSender::start(size_t file_index, uint64_t chunk_index) {
	std::lock_guard<std::mutex> lock(control_mutex);
	if (is_shut_down) {
		return false;
	}

	const FileManifest& manifest = share->manifest;
	if (file_index > manifest.files.size()) {
		std::cerr << "Peer " << peer_id << " asked for file " << file_index
			  << " but only " << manifest.files.size() << " are shared" << std::endl;
		return false;
	}

	stopLocked();
	flow.reset();

	// The receiver is the authority on what it already holds
	uint64_t offset = 0;
	if (file_index < manifest.files.size()) {
		uint64_t file_size = manifest.files[file_index].size;
		// Compared before multiplying so a huge chunk index cannot wrap around
		if (chunk_index > file_size / config.frame_size) {
			std::cerr << "Resume chunk " << chunk_index << " past end of " << manifest.files[file_index].name
				  << ", clamping" << std::endl;
			offset = file_size;
		} else {
			offset = chunk_index * config.frame_size;
			if (offset > file_size) {
				offset = file_size;
			}
		}
	}

	uint64_t epoch = session_epoch->load();
	uint64_t loop_generation = ++generation;

	{
		std::lock_guard<std::mutex> state_lock(state_mutex);
		base_bytes = offset;
		for (size_t i = 0; i < file_index; i++) {
			base_bytes += manifest.files[i].size;
		}
		state.current_file_index = file_index;
		state.bytes_sent_for_current_file = offset;
		state.session_id = epoch;
		bytes_handed = 0;
		meter.start(ThroughputMeter::Clock::now(), 0, channel->outstandingBytes());
	}

	active = true;
	loop_thread = std::thread(&TransferSender::sendLoop, this, epoch, loop_generation, file_index, offset);
	return true;
}

void TransferSender::stop() {
	std::lock_guard<std::mutex> lock(control_mutex);
	stopLocked();
}

void TransferSender::shutdown() {
	std::lock_guard<std::mutex> lock(control_mutex);
	is_shut_down = true;
	stopLocked();
}

void TransferSender::stopLocked() {
	generation++;
	flow.interrupt();

	if (loop_thread.joinable()) {
		if (loop_thread.get_id() == std::this_thread::get_id()) {
			loop_thread.detach();
		} else {
			loop_thread.join();
		}
	}
	active = false;
}

bool TransferSender::isCurrent(uint64_t epoch, uint64_t loop_generation) const {
	return session_epoch->load() == epoch && generation.load() == loop_generation;
}

void TransferSender::sendLoop(uint64_t epoch, uint64_t loop_generation, size_t file_index, uint64_t offset) {
	const FileManifest& manifest = share->manifest;
	auto still_valid = [this, epoch, loop_generation]() { return isCurrent(epoch, loop_generation); };

	std::cout << "Starting transfer to " << peer_id << " at file " << file_index
		  << ", offset " << offset << std::endl;

	SendResult result = SendResult::COMPLETED;

	for (size_t i = file_index; i < manifest.files.size(); i++) {
		if (!still_valid()) {
			return;
		}
		if (!channel->isOpen()) {
			result = SendResult::CHANNEL_CLOSED;
			break;
		}

		const FileEntry& entry = manifest.files[i];
		uint64_t start_offset = (i == file_index) ? offset : 0;

		{
			std::lock_guard<std::mutex> lock(state_mutex);
			state.current_file_index = i;
			state.bytes_sent_for_current_file = start_offset;
		}

		FileStartPayload start_payload;
		start_payload.file_index = i;
		start_payload.file_name = entry.name;
		start_payload.file_size = entry.size;
		start_payload.file_type = entry.mime_type;
		if (!channel->send(makeMessage(MessageType::FILE_START, start_payload))) {
			result = SendResult::CHANNEL_CLOSED;
			break;
		}

		result = byte_sender.send(*share->sources[i], start_offset, still_valid);
		if (result != SendResult::COMPLETED) {
			break;
		}

		if (!still_valid()) {
			return;
		}
		if (!channel->send(makeMessage(MessageType::FILE_COMPLETE, json{{"fileIndex", i}}))) {
			result = SendResult::CHANNEL_CLOSED;
			break;
		}
	}

	if (!still_valid()) {
		return;
	}

	if (result == SendResult::COMPLETED) {
		{
			std::lock_guard<std::mutex> lock(state_mutex);
			state.current_file_index = manifest.files.size();
			state.bytes_sent_for_current_file = 0;
		}
		if (!channel->send(makeMessage(MessageType::ALL_FILES_COMPLETE))) {
			result = SendResult::CHANNEL_CLOSED;
		} else {
			std::cout << "All files sent to " << peer_id << std::endl;
		}
	}

	if (result != SendResult::COMPLETED) {
		std::cerr << "Transfer to " << peer_id << " stopped: " << sendResultToString(result) << std::endl;
	}

	active = false;
	if (finished_callback) {
		finished_callback(peer_id, result);
	}
}

PerPeerTransferState TransferSender::getState() const {
	std::lock_guard<std::mutex> lock(state_mutex);
	return state;
}

PeerStats TransferSender::getStats() const {
	std::lock_guard<std::mutex> lock(state_mutex);
	PeerStats stats;
	stats.peer_id = peer_id;
	stats.active = active.load();
	stats.current_file_index = state.current_file_index;
	stats.bytes_sent_for_current_file = state.bytes_sent_for_current_file;
	stats.progress_bytes = std::min(base_bytes + meter.deliveredBytes(), share->manifest.total_size);
	stats.current_speed = meter.currentSpeed();
	stats.average_speed = meter.averageSpeed();
	return stats;
}

void TransferSender::sampleThroughput(ThroughputMeter::Clock::time_point now) {
	std::lock_guard<std::mutex> lock(state_mutex);
	meter.sample(now, bytes_handed.load(), channel->outstandingBytes());
}
