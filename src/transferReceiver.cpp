#include "transferReceiver.hpp"
#include <iostream>

using json = nlohmann::json;

const char* receiverStateToString(ReceiverState state) {
	switch (state) {
		case ReceiverState::IDLE: return "idle";
		case ReceiverState::AWAITING_METADATA: return "awaiting metadata";
		case ReceiverState::READY_TO_ACCEPT: return "ready to accept";
		case ReceiverState::RECEIVING: return "receiving";
		case ReceiverState::PAUSED: return "paused";
		case ReceiverState::COMPLETE: return "complete";
		case ReceiverState::ERROR: return "error";
	}
	return "unknown";
}

const char* fileStatusToString(FileStatus status) {
	switch (status) {
		case FileStatus::PENDING: return "pending";
		case FileStatus::RECEIVING: return "receiving";
		case FileStatus::COMPLETED: return "completed";
		case FileStatus::FAILED: return "failed";
	}
	return "unknown";
}

TransferReceiver::TransferReceiver(const TransferConfig& config, SinkFactory sink_factory)
	: config(config), sink_factory(std::move(sink_factory)) {
}

TransferReceiver::~TransferReceiver() {
	std::shared_ptr<Channel> old;
	{
		std::lock_guard<std::mutex> lock(mutex);
		old = detachLocked();
	}
	if (old) {
		old->clearCallbacks();
		old->close();
	}
}

bool TransferReceiver::connect(Rendezvous& rendezvous, const std::string& code, const std::string& local_id) {
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (channel) {
			std::cerr << "Already connected to a sender" << std::endl;
			return false;
		}
	}

	std::shared_ptr<Channel> new_channel = rendezvous.connect(code, local_id);
	if (!new_channel) {
		std::cerr << "Nobody is sharing under code " << code << std::endl;
		return false;
	}

	if (!attach(new_channel)) {
		new_channel->close();
		return false;
	}
	std::cout << "Connected to " << code << std::endl;
	return true;
}

bool TransferReceiver::attach(std::shared_ptr<Channel> new_channel) {
	if (!new_channel) {
		return false;
	}

	Deferred deferred;
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (channel) {
			std::cerr << "Already connected to a sender" << std::endl;
			return false;
		}

		uint64_t channel_generation = ++generation;
		channel = new_channel;
		last_error = TransferError::NONE;
		error_message.clear();

		// Still unopened, nothing can dispatch yet
		channel->setMessageCallback([this, channel_generation](const TransferMessage& message) {
			handleMessage(channel_generation, message);
		});
		channel->setFrameCallback([this, channel_generation](const std::vector<char>& frame) {
			handleFrame(channel_generation, frame);
		});
		channel->setCloseCallback([this, channel_generation]() {
			handleClose(channel_generation);
		});
		channel->setErrorCallback([](const std::string& error) {
			std::cerr << "Connection error: " << error << std::endl;
		});

		setStateLocked(ReceiverState::AWAITING_METADATA, deferred);
	}

	new_channel->open();
	runDeferred(deferred);
	return true;
}

bool TransferReceiver::accept() {
	Deferred deferred;
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (state != ReceiverState::READY_TO_ACCEPT || !channel) {
			std::cerr << "No transfer waiting to be accepted" << std::endl;
			return false;
		}
		sendStartRequestLocked(deferred);
	}
	runDeferred(deferred);
	return true;
}

void TransferReceiver::disconnect() {
	std::shared_ptr<Channel> old;
	Deferred deferred;
	{
		std::lock_guard<std::mutex> lock(mutex);
		old = detachLocked();
		if (!old) {
			return;
		}

		if (state == ReceiverState::RECEIVING) {
			file_open = false;
			discarding = false;
			awaiting_resume = false;
			last_error = TransferError::CHANNEL_CLOSED;
			error_message = "disconnected";
			setStateLocked(ReceiverState::PAUSED, deferred);
		} else if (state == ReceiverState::AWAITING_METADATA || state == ReceiverState::READY_TO_ACCEPT) {
			setStateLocked(ReceiverState::IDLE, deferred);
		}
	}

	old->clearCallbacks();
	old->close();
	runDeferred(deferred);
}

void TransferReceiver::reset() {
	std::shared_ptr<Channel> old;
	Deferred deferred;
	{
		std::lock_guard<std::mutex> lock(mutex);
		old = detachLocked();

		if (current_sink) {
			current_sink->abort();
			current_sink.reset();
		}
		has_manifest = false;
		manifest = FileManifest();
		files.clear();
		resumable = false;
		has_current = false;
		current_index = 0;
		file_open = false;
		discarding = false;
		awaiting_resume = false;
		last_error = TransferError::NONE;
		error_message.clear();
		setStateLocked(ReceiverState::IDLE, deferred);
	}

	if (old) {
		old->clearCallbacks();
		old->close();
	}
	runDeferred(deferred);
}

void TransferReceiver::handleMessage(uint64_t channel_generation, const TransferMessage& message) {
	Deferred deferred;
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (channel_generation != generation) {
			return;
		}

		switch (message.type) {
			case MessageType::METADATA:
				onMetadata(message, deferred);
				break;
			case MessageType::FILE_START:
				onFileStart(message, deferred);
				break;
			case MessageType::FILE_COMPLETE:
				onFileComplete(message, deferred);
				break;
			case MessageType::ALL_FILES_COMPLETE:
				onAllFilesComplete(deferred);
				break;
			case MessageType::REJECT_TRANSFER: {
				std::string reason = "transfer rejected";
				if (message.data.is_object()) {
					reason = message.data.value("reason", reason);
				}
				std::cerr << "Sender rejected the transfer: " << reason << std::endl;
				failSessionLocked(TransferError::EXPIRED_SESSION, reason, deferred);
				break;
			}
			case MessageType::TRANSFER_CANCELLED:
				std::cerr << "Sender stopped sharing" << std::endl;
				failSessionLocked(TransferError::CANCELLED, "sender stopped sharing", deferred);
				break;
			default:
				std::cerr << "Ignoring " << messageTypeToString(message.type) << " from sender" << std::endl;
				break;
		}
	}
	runDeferred(deferred);
}

void TransferReceiver::onMetadata(const TransferMessage& message, Deferred& deferred) {
	if (state != ReceiverState::AWAITING_METADATA) {
		std::cerr << "Unexpected file list while " << receiverStateToString(state) << std::endl;
		return;
	}

	FileManifest incoming;
	try {
		incoming = message.data.get<FileManifest>();
	} catch (const json::exception& e) {
		std::cerr << "Malformed file list: " << e.what() << std::endl;
		failSessionLocked(TransferError::PROTOCOL_VIOLATION, "malformed file list", deferred);
		return;
	}

	bool can_resume = has_manifest && hasProgressLocked() && incoming.sameFilesAs(manifest);
	if (!can_resume) {
		// A different offer: whatever was half received belongs to nothing now
		if (current_sink) {
			current_sink->abort();
			current_sink.reset();
		}
		files.clear();
		for (const auto& entry : incoming.files) {
			ReceivedFile file;
			file.entry = entry;
			files.push_back(file);
		}
		has_current = false;
		current_index = 0;
	}

	manifest = incoming;
	has_manifest = true;
	resumable = can_resume;
	file_open = false;
	discarding = false;

	std::cout << "Offered " << manifest.files.size() << " files, " << manifest.total_size << " bytes"
		  << (resumable ? " (resumable)" : "") << std::endl;

	if (manifest_callback) {
		ManifestCallback callback = manifest_callback;
		FileManifest offered = manifest;
		bool offered_resumable = resumable;
		deferred.push_back([callback, offered, offered_resumable]() { callback(offered, offered_resumable); });
	}

	if ((resumable && config.auto_resume) || (!resumable && config.auto_accept)) {
		sendStartRequestLocked(deferred);
	} else {
		setStateLocked(ReceiverState::READY_TO_ACCEPT, deferred);
	}
}

void TransferReceiver::sendStartRequestLocked(Deferred& deferred) {
	ResumePayload resume;
	bool sent;

	if (resumable && resumePointLocked(resume)) {
		if (resume.file_index < files.size() && files[resume.file_index].status == FileStatus::FAILED) {
			files[resume.file_index].status = FileStatus::PENDING;
			files[resume.file_index].received_bytes = 0;
		}
		awaiting_resume = true;
		requested_resume = resume;
		std::cout << "Requesting resume at file " << resume.file_index << ", chunk " << resume.chunk_index << std::endl;
		sent = channel->send(makeMessage(MessageType::RESUME_REQUEST, resume));
	} else {
		awaiting_resume = false;
		sent = channel->send(makeMessage(MessageType::ACCEPT_TRANSFER));
	}

	if (!sent) {
		std::cerr << "Failed to reach the sender" << std::endl;
	}
	file_open = false;
	discarding = false;
	setStateLocked(ReceiverState::RECEIVING, deferred);
}

bool TransferReceiver::resumePointLocked(ResumePayload& resume) const {
	if (!has_current || current_index >= files.size()) {
		return false;
	}

	const ReceivedFile& file = files[current_index];
	if (file.status == FileStatus::COMPLETED) {
		resume.file_index = current_index + 1;
		resume.chunk_index = 0;
	} else if (file.status == FileStatus::FAILED) {
		resume.file_index = current_index;
		resume.chunk_index = 0;
	} else {
		// Only whole frames count; a partial tail is received again
		resume.file_index = current_index;
		resume.chunk_index = file.received_bytes / config.frame_size;
	}
	return true;
}

bool TransferReceiver::hasProgressLocked() const {
	return has_current;
}

void TransferReceiver::onFileStart(const TransferMessage& message, Deferred& deferred) {
	if (state != ReceiverState::RECEIVING) {
		std::cerr << "Unexpected FILE_START while " << receiverStateToString(state) << std::endl;
		return;
	}

	FileStartPayload start;
	try {
		start = message.data.get<FileStartPayload>();
	} catch (const json::exception& e) {
		std::cerr << "Malformed FILE_START: " << e.what() << std::endl;
		file_open = false;
		discarding = true;
		return;
	}

	if (start.file_index >= files.size()) {
		std::cerr << "FILE_START for unknown file " << start.file_index << std::endl;
		file_open = false;
		discarding = true;
		return;
	}
	size_t index = static_cast<size_t>(start.file_index);

	// Whatever was open for another file never completed
	if (current_sink && current_index != index) {
		failFileLocked(current_index, TransferError::PROTOCOL_VIOLATION,
			       "next file started before this one completed", deferred);
	}

	ReceivedFile& file = files[index];
	discarding = false;

	bool resuming = awaiting_resume && index == requested_resume.file_index &&
			has_current && current_index == index && current_sink;
	awaiting_resume = false;

	has_current = true;
	current_index = index;

	if (start.file_size != file.entry.size) {
		failFileLocked(index, TransferError::PROTOCOL_VIOLATION, "announced size " +
			       std::to_string(start.file_size) + " does not match the file list", deferred);
		return;
	}

	if (resuming) {
		uint64_t keep = requested_resume.chunk_index * config.frame_size;
		if (keep > file.received_bytes) {
			keep = file.received_bytes;
		}
		if (!current_sink->truncate(keep)) {
			failFileLocked(index, TransferError::IO_ERROR, "could not cut back to the resume point", deferred);
			return;
		}
		file.received_bytes = keep;
		sink_finalized = false;
		std::cout << "Resuming " << file.entry.name << " at byte " << keep << std::endl;
	} else {
		if (current_sink) {
			current_sink->abort();
			current_sink.reset();
		}
		current_sink = sink_factory ? sink_factory(index, file.entry) : nullptr;
		if (!current_sink) {
			failFileLocked(index, TransferError::IO_ERROR, "could not open output", deferred);
			return;
		}
		file.received_bytes = 0;
		sink_finalized = false;
		std::cout << "Receiving " << file.entry.name << " (" << file.entry.size << " bytes)" << std::endl;
	}

	file.status = FileStatus::RECEIVING;
	file.error = TransferError::NONE;
	file_open = true;

	if (file_callback) {
		FileCallback callback = file_callback;
		deferred.push_back([callback, index]() { callback(index, FileStatus::RECEIVING); });
	}
}

void TransferReceiver::handleFrame(uint64_t channel_generation, const std::vector<char>& frame) {
	Deferred deferred;
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (channel_generation != generation) {
			return;
		}

		if (state != ReceiverState::RECEIVING || !file_open) {
			if (!discarding) {
				std::cerr << "Dropping " << frame.size() << " byte frame with no open file" << std::endl;
			}
			return;
		}

		ReceivedFile& file = files[current_index];
		if (file.received_bytes + frame.size() > file.entry.size) {
			failFileLocked(current_index, TransferError::PROTOCOL_VIOLATION,
				       "received more data than announced", deferred);
		} else if (!current_sink->write(frame.data(), frame.size())) {
			failFileLocked(current_index, TransferError::IO_ERROR, "write failed", deferred);
		} else {
			file.received_bytes += frame.size();

			if (progress_callback) {
				ProgressCallback callback = progress_callback;
				size_t index = current_index;
				uint64_t received = file.received_bytes;
				uint64_t total = file.entry.size;
				deferred.push_back([callback, index, received, total]() { callback(index, received, total); });
			}

			if (file.received_bytes == file.entry.size) {
				if (current_sink->finalize()) {
					sink_finalized = true;
				} else {
					failFileLocked(current_index, TransferError::IO_ERROR, "could not finish the file", deferred);
				}
			}
		}
	}
	runDeferred(deferred);
}

void TransferReceiver::onFileComplete(const TransferMessage& message, Deferred& deferred) {
	if (state != ReceiverState::RECEIVING) {
		std::cerr << "Unexpected FILE_COMPLETE while " << receiverStateToString(state) << std::endl;
		return;
	}

	uint64_t index;
	try {
		index = message.data.at("fileIndex").get<uint64_t>();
	} catch (const json::exception& e) {
		std::cerr << "Malformed FILE_COMPLETE: " << e.what() << std::endl;
		return;
	}

	if (discarding && has_current && index == current_index) {
		// Already failed, nothing left to do for it
		discarding = false;
		return;
	}

	if (!file_open || index != current_index) {
		std::cerr << "FILE_COMPLETE for file " << index << " out of order" << std::endl;
		if (file_open) {
			failFileLocked(current_index, TransferError::PROTOCOL_VIOLATION,
				       "completion announced for another file", deferred);
		}
		return;
	}

	ReceivedFile& file = files[current_index];
	if (file.received_bytes != file.entry.size) {
		failFileLocked(current_index, TransferError::PROTOCOL_VIOLATION, "completed after " +
			       std::to_string(file.received_bytes) + " of " + std::to_string(file.entry.size) + " bytes",
			       deferred);
		return;
	}

	// Empty files get no frames, and a file resumed at its very end gets none either
	if (!sink_finalized && !current_sink->finalize()) {
		failFileLocked(current_index, TransferError::IO_ERROR, "could not finish the file", deferred);
		return;
	}

	file.status = FileStatus::COMPLETED;
	file_open = false;
	current_sink.reset();
	std::cout << "Received " << file.entry.name << std::endl;

	if (file_callback) {
		FileCallback callback = file_callback;
		size_t completed = current_index;
		deferred.push_back([callback, completed]() { callback(completed, FileStatus::COMPLETED); });
	}
}

void TransferReceiver::onAllFilesComplete(Deferred& deferred) {
	if (state != ReceiverState::RECEIVING) {
		std::cerr << "Unexpected ALL_FILES_COMPLETE while " << receiverStateToString(state) << std::endl;
		return;
	}

	if (file_open) {
		failFileLocked(current_index, TransferError::PROTOCOL_VIOLATION, "transfer ended mid-file", deferred);
	}
	discarding = false;

	size_t failed = 0;
	for (const auto& file : files) {
		if (file.status != FileStatus::COMPLETED) {
			failed++;
		}
	}
	std::cout << "Transfer complete: " << (files.size() - failed) << " of " << files.size() << " files received" << std::endl;
	setStateLocked(ReceiverState::COMPLETE, deferred);
}

void TransferReceiver::handleClose(uint64_t channel_generation) {
	std::shared_ptr<Channel> old;
	Deferred deferred;
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (channel_generation != generation) {
			return;
		}
		old = detachLocked();

		if (state == ReceiverState::RECEIVING) {
			// Keep the sink and counters, a reconnect picks up from here
			file_open = false;
			discarding = false;
			awaiting_resume = false;
			last_error = TransferError::CHANNEL_CLOSED;
			error_message = "connection lost";
			std::cerr << "Connection lost mid-transfer, progress kept" << std::endl;
			setStateLocked(ReceiverState::PAUSED, deferred);
		} else if (state == ReceiverState::AWAITING_METADATA || state == ReceiverState::READY_TO_ACCEPT) {
			failSessionLocked(TransferError::CHANNEL_CLOSED, "connection closed before the transfer started", deferred);
		}
	}

	if (old) {
		old->clearCallbacks();
	}
	runDeferred(deferred);
}

void TransferReceiver::failFileLocked(size_t index, TransferError error, const std::string& reason, Deferred& deferred) {
	ReceivedFile& file = files[index];
	std::cerr << "File " << file.entry.name << " failed: " << reason << std::endl;

	if (current_sink && current_index == index) {
		current_sink->abort();
		current_sink.reset();
	}
	file.status = FileStatus::FAILED;
	file.error = error;

	if (current_index == index) {
		file_open = false;
		discarding = true;
	}

	if (file_callback) {
		FileCallback callback = file_callback;
		deferred.push_back([callback, index]() { callback(index, FileStatus::FAILED); });
	}
}

void TransferReceiver::failSessionLocked(TransferError error, const std::string& reason, Deferred& deferred) {
	if (file_open) {
		failFileLocked(current_index, error, reason, deferred);
	}
	discarding = false;
	last_error = error;
	error_message = reason;
	setStateLocked(ReceiverState::ERROR, deferred);
}

void TransferReceiver::setStateLocked(ReceiverState new_state, Deferred& deferred) {
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

std::shared_ptr<Channel> TransferReceiver::detachLocked() {
	generation++;
	std::shared_ptr<Channel> old = std::move(channel);
	channel.reset();
	return old;
}

void TransferReceiver::runDeferred(Deferred& deferred) {
	for (auto& notify : deferred) {
		notify();
	}
	deferred.clear();
}

ReceiverState TransferReceiver::getState() const {
	std::lock_guard<std::mutex> lock(mutex);
	return state;
}

TransferError TransferReceiver::getLastError() const {
	std::lock_guard<std::mutex> lock(mutex);
	return last_error;
}

std::string TransferReceiver::getErrorMessage() const {
	std::lock_guard<std::mutex> lock(mutex);
	return error_message;
}

FileManifest TransferReceiver::getManifest() const {
	std::lock_guard<std::mutex> lock(mutex);
	return manifest;
}

std::vector<ReceivedFile> TransferReceiver::getFiles() const {
	std::lock_guard<std::mutex> lock(mutex);
	return files;
}

uint64_t TransferReceiver::totalReceivedBytes() const {
	std::lock_guard<std::mutex> lock(mutex);
	uint64_t total = 0;
	for (const auto& file : files) {
		total += file.received_bytes;
	}
	return total;
}

bool TransferReceiver::getResumePoint(ResumePayload& resume) const {
	std::lock_guard<std::mutex> lock(mutex);
	return resumePointLocked(resume);
}
