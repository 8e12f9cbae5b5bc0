#include "peerFanoutManager.hpp"
#include <sys/stat.h>
#include <algorithm>
#include <filesystem>
#include <iostream>

using json = nlohmann::json;
namespace fs = std::filesystem;

const char* senderStateToString(SenderState state) {
	switch (state) {
		case SenderState::IDLE: return "idle";
		case SenderState::CONFIGURING: return "configuring";
		case SenderState::ANNOUNCING: return "announcing";
		case SenderState::AWAITING_PEER: return "awaiting peer";
		case SenderState::PEER_CONNECTED: return "peer connected";
		case SenderState::TRANSFERRING: return "transferring";
		case SenderState::ERROR: return "error";
	}
	return "unknown";
}

const char* peerStatusToString(PeerStatus status) {
	switch (status) {
		case PeerStatus::CONNECTED: return "connected";
		case PeerStatus::TRANSFERRING: return "transferring";
		case PeerStatus::COMPLETED: return "completed";
		case PeerStatus::FAILED: return "failed";
		case PeerStatus::DISCONNECTED: return "disconnected";
		case PeerStatus::REJECTED: return "rejected";
	}
	return "unknown";
}

static std::string guessMimeType(const std::string& name) {
	static const std::map<std::string, std::string> types = {
		{".txt", "text/plain"}, {".html", "text/html"}, {".json", "application/json"},
		{".pdf", "application/pdf"}, {".zip", "application/zip"}, {".png", "image/png"},
		{".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"}, {".gif", "image/gif"},
		{".mp3", "audio/mpeg"}, {".mp4", "video/mp4"}
	};

	std::string extension = fs::path(name).extension().string();
	std::transform(extension.begin(), extension.end(), extension.begin(), ::tolower);
	auto it = types.find(extension);
	return it != types.end() ? it->second : "application/octet-stream";
}

PeerFanoutManager::PeerFanoutManager(const TransferConfig& config, Rendezvous& rendezvous)
	: config(config), rendezvous(rendezvous), session_epoch(std::make_shared<std::atomic<uint64_t>>(1)) {
}

PeerFanoutManager::~PeerFanoutManager() {
	// No timer may fire into a half-destroyed manager
	scheduler.stop();
	teardown(SenderState::IDLE, TransferError::CANCELLED, "", 0);

	std::vector<std::shared_ptr<Channel>> retired;
	{
		std::lock_guard<std::mutex> lock(mutex);
		retired.swap(retired_channels);
	}
	for (auto& channel : retired) {
		channel->clearCallbacks();
	}
}

bool PeerFanoutManager::configure(std::vector<FileEntry> entries, std::vector<std::shared_ptr<ByteSource>> sources,
				  const TransferConstraints& constraints) {
	if (entries.size() != sources.size()) {
		std::cerr << "Got " << entries.size() << " files but " << sources.size() << " sources" << std::endl;
		return false;
	}
	for (size_t i = 0; i < entries.size(); i++) {
		if (!sources[i] || sources[i]->size() != entries[i].size) {
			std::cerr << "Source for " << entries[i].name << " does not match its announced size" << std::endl;
			return false;
		}
	}

	auto share_set = std::make_shared<ShareSet>();
	share_set->manifest = FileManifest::build(std::move(entries), constraints);
	share_set->sources = std::move(sources);

	Deferred deferred;
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (isSharingLocked()) {
			std::cerr << "Cannot change files while sharing" << std::endl;
			return false;
		}
		share = share_set;
		last_error = TransferError::NONE;
		error_message.clear();
		setStateLocked(SenderState::CONFIGURING, deferred);
	}
	runDeferred(deferred);

	std::cout << "Prepared " << share_set->manifest.files.size() << " files ("
		  << formatFileSize(static_cast<double>(share_set->manifest.total_size)) << ")" << std::endl;
	return true;
}

bool PeerFanoutManager::configureFiles(const std::vector<std::string>& paths, const TransferConstraints& constraints) {
	std::vector<FileEntry> entries;
	std::vector<std::shared_ptr<ByteSource>> sources;

	for (const auto& path : paths) {
		auto source = std::make_shared<FileByteSource>(path);
		if (!source->isOpen()) {
			std::cerr << "Failed to open file: " << path << std::endl;
			return false;
		}

		FileEntry entry;
		entry.name = fs::path(path).filename().string();
		entry.size = source->size();
		entry.mime_type = guessMimeType(entry.name);

		struct stat info;
		if (stat(path.c_str(), &info) == 0) {
			entry.last_modified = static_cast<int64_t>(info.st_mtime) * 1000;
		}

		entries.push_back(entry);
		sources.push_back(source);
	}

	return configure(std::move(entries), std::move(sources), constraints);
}

bool PeerFanoutManager::startSharing(const std::string& room_code) {
	Deferred deferred;
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (state != SenderState::CONFIGURING || !share) {
			std::cerr << "Nothing to share, configure files first" << std::endl;
			return false;
		}
		if (share->manifest.constraints.isExpired(currentTimeMillis())) {
			last_error = TransferError::EXPIRED_SESSION;
			error_message = "share expired before it started";
			setStateLocked(SenderState::ERROR, deferred);
		} else {
			code = room_code;
			last_error = TransferError::NONE;
			error_message.clear();
			setStateLocked(SenderState::ANNOUNCING, deferred);
		}
	}
	runDeferred(deferred);
	if (getState() != SenderState::ANNOUNCING) {
		return false;
	}

	RegistrationResult result = rendezvous.registerIdentity(room_code, [this](std::shared_ptr<Channel> channel) {
		acceptConnection(channel);
	});

	uint64_t epoch = 0;
	bool has_expiry = false;
	{
		std::unique_lock<std::mutex> lock(mutex);
		if (state != SenderState::ANNOUNCING || code != room_code) {
			// Stopped while we were registering
			lock.unlock();
			if (result == RegistrationResult::OK) {
				rendezvous.unregisterIdentity(room_code);
			}
			return false;
		}

		switch (result) {
			case RegistrationResult::OK:
				registered = true;
				epoch = session_epoch->load();
				has_expiry = share->manifest.constraints.has_expiry;
				setStateLocked(SenderState::AWAITING_PEER, deferred);
				recomputeStateLocked(deferred);
				break;

			case RegistrationResult::IDENTITY_TAKEN:
				code.clear();
				last_error = TransferError::IDENTITY_CONFLICT;
				error_message = "code already in use";
				setStateLocked(SenderState::CONFIGURING, deferred);
				break;

			case RegistrationResult::FAILED:
				code.clear();
				last_error = TransferError::IO_ERROR;
				error_message = "could not register code " + room_code;
				setStateLocked(SenderState::ERROR, deferred);
				break;
		}
	}

	if (result == RegistrationResult::OK) {
		std::cout << "Sharing under code " << room_code << std::endl;
		scheduleStats(epoch);
		if (has_expiry) {
			scheduleCountdown(epoch);
		}
	} else {
		std::cerr << "Failed to share under code " << room_code << ": " << getErrorMessage() << std::endl;
	}

	runDeferred(deferred);
	return result == RegistrationResult::OK;
}

void PeerFanoutManager::stopSharing() {
	teardown(SenderState::IDLE, TransferError::CANCELLED, "", 0);
}

void PeerFanoutManager::acceptConnection(std::shared_ptr<Channel> channel) {
	if (!channel) {
		return;
	}
	const std::string peer_id = channel->peerId();

	{
		std::unique_lock<std::mutex> lock(mutex);
		if (!isSharingLocked() || !share || peers.count(peer_id) > 0) {
			lock.unlock();
			std::cerr << "Refusing connection from " << peer_id << std::endl;
			channel->close();
			return;
		}

		uint64_t epoch = session_epoch->load();

		PeerSlot slot;
		slot.channel = channel;
		if (share->manifest.constraints.isExpired(currentTimeMillis())) {
			slot.rejected = true;
		} else {
			slot.sender = std::make_shared<TransferSender>(channel, share, config, session_epoch);
			slot.sender->setFinishedCallback([this, epoch](const std::string& id, SendResult result) {
				handleFinished(id, epoch, result);
			});
		}
		peers[peer_id] = slot;

		// The channel is not open yet, so nothing dispatches while we install these
		channel->setOpenCallback([this, peer_id, epoch]() {
			handleOpen(peer_id, epoch);
		});
		channel->setMessageCallback([this, peer_id, epoch](const TransferMessage& message) {
			handleMessage(peer_id, epoch, message);
		});
		channel->setFrameCallback([peer_id](const std::vector<char>& frame) {
			std::cerr << "Ignoring " << frame.size() << " byte frame from receiver " << peer_id << std::endl;
		});
		channel->setCloseCallback([this, peer_id, epoch]() {
			handleClose(peer_id, epoch);
		});
		channel->setErrorCallback([peer_id](const std::string& error) {
			std::cerr << "Connection error with " << peer_id << ": " << error << std::endl;
		});
	}

	std::cout << "Peer connected: " << peer_id << std::endl;
	channel->open();
}

void PeerFanoutManager::handleOpen(const std::string& peer_id, uint64_t epoch) {
	Deferred deferred;
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (session_epoch->load() != epoch) {
			return;
		}
		auto it = peers.find(peer_id);
		if (it == peers.end()) {
			return;
		}
		PeerSlot& slot = it->second;
		slot.opened = true;

		if (slot.rejected) {
			std::cout << "Rejecting " << peer_id << ": share has expired" << std::endl;
			slot.channel->send(makeMessage(MessageType::REJECT_TRANSFER, json{{"reason", "This share has expired"}}));

			// Give the rejection time to arrive before hanging up
			std::shared_ptr<Channel> channel = slot.channel;
			scheduler.schedule(std::chrono::milliseconds(config.reject_close_delay_ms), [channel]() {
				channel->close();
			});
			notifyPeerLocked(peer_id, PeerStatus::REJECTED, deferred);
		} else {
			if (!slot.channel->send(makeMessage(MessageType::METADATA, share->manifest))) {
				std::cerr << "Failed to send file list to " << peer_id << std::endl;
			}
			notifyPeerLocked(peer_id, PeerStatus::CONNECTED, deferred);
			recomputeStateLocked(deferred);
		}
	}
	runDeferred(deferred);
}

void PeerFanoutManager::handleMessage(const std::string& peer_id, uint64_t epoch, const TransferMessage& message) {
	std::shared_ptr<TransferSender> sender;
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (session_epoch->load() != epoch) {
			return;
		}
		auto it = peers.find(peer_id);
		if (it == peers.end() || !it->second.sender) {
			return;
		}
		sender = it->second.sender;
	}

	size_t file_index = 0;
	uint64_t chunk_index = 0;

	switch (message.type) {
		case MessageType::ACCEPT_TRANSFER:
			std::cout << peer_id << " accepted the transfer" << std::endl;
			break;

		case MessageType::RESUME_REQUEST:
			try {
				ResumePayload resume = message.data.get<ResumePayload>();
				file_index = static_cast<size_t>(resume.file_index);
				chunk_index = resume.chunk_index;
			} catch (const json::exception& e) {
				std::cerr << "Bad resume request from " << peer_id << ": " << e.what() << std::endl;
				return;
			}
			std::cout << peer_id << " resumes at file " << file_index << ", chunk " << chunk_index << std::endl;
			break;

		default:
			std::cerr << "Unexpected " << messageTypeToString(message.type) << " from " << peer_id << std::endl;
			return;
	}

	Deferred deferred;
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (session_epoch->load() != epoch) {
			return;
		}
		notifyPeerLocked(peer_id, PeerStatus::TRANSFERRING, deferred);
	}
	runDeferred(deferred);

	bool started = sender->start(file_index, chunk_index);

	{
		std::lock_guard<std::mutex> lock(mutex);
		if (session_epoch->load() != epoch) {
			return;
		}
		if (!started) {
			notifyPeerLocked(peer_id, PeerStatus::FAILED, deferred);
		}
		recomputeStateLocked(deferred);
	}
	runDeferred(deferred);
}

void PeerFanoutManager::handleClose(const std::string& peer_id, uint64_t epoch) {
	PeerSlot slot;
	Deferred deferred;
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (session_epoch->load() != epoch) {
			return;
		}
		auto it = peers.find(peer_id);
		if (it == peers.end()) {
			return;
		}
		slot = it->second;
		peers.erase(it);
		retired_channels.push_back(slot.channel);

		if (!slot.rejected) {
			notifyPeerLocked(peer_id, PeerStatus::DISCONNECTED, deferred);
		}
		recomputeStateLocked(deferred);
	}

	std::cout << "Peer disconnected: " << peer_id << std::endl;

	// Only this peer's loop stops; everyone else keeps going
	if (slot.sender) {
		slot.sender->shutdown();
	}
	runDeferred(deferred);

	// Runs on the closing channel's own thread, so clearing it cannot block
	slot.channel->clearCallbacks();
	releaseRetired(slot.channel);
}

void PeerFanoutManager::releaseRetired(const std::shared_ptr<Channel>& channel) {
	std::lock_guard<std::mutex> lock(mutex);
	auto it = std::find(retired_channels.begin(), retired_channels.end(), channel);
	if (it != retired_channels.end()) {
		retired_channels.erase(it);
	}
}

void PeerFanoutManager::handleFinished(const std::string& peer_id, uint64_t epoch, SendResult result) {
	Deferred deferred;
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (session_epoch->load() != epoch || peers.count(peer_id) == 0) {
			return;
		}
		notifyPeerLocked(peer_id, result == SendResult::COMPLETED ? PeerStatus::COMPLETED : PeerStatus::FAILED, deferred);
		recomputeStateLocked(deferred);
	}
	runDeferred(deferred);
}

void PeerFanoutManager::teardown(SenderState final_state, TransferError error, const std::string& message,
				 uint64_t expected_epoch) {
	std::map<std::string, PeerSlot> removed;
	std::vector<std::shared_ptr<Channel>> retired;
	std::string old_code;
	bool was_registered = false;
	Deferred deferred;

	{
		std::lock_guard<std::mutex> lock(mutex);
		if (expected_epoch != 0 && session_epoch->load() != expected_epoch) {
			return;
		}

		if (!isSharingLocked()) {
			// Nothing is running; stopping from a configured or failed session just resets it
			if (final_state == SenderState::IDLE && state != SenderState::IDLE) {
				share.reset();
				last_error = TransferError::NONE;
				error_message.clear();
				setStateLocked(SenderState::IDLE, deferred);
			}
		} else {
			// Every loop still running belongs to the old epoch from here on
			(*session_epoch)++;

			removed.swap(peers);
			retired.swap(retired_channels);
			old_code = code;
			code.clear();
			was_registered = registered;
			registered = false;

			last_error = error;
			error_message = message;
			if (final_state == SenderState::IDLE) {
				share.reset();
			}
			setStateLocked(final_state, deferred);
		}
	}

	if (!removed.empty() || was_registered) {
		scheduler.cancelAll();

		if (was_registered) {
			rendezvous.unregisterIdentity(old_code);
		}

		for (auto& entry : removed) {
			if (entry.second.sender) {
				entry.second.sender->shutdown();
			}
		}

		for (auto& entry : removed) {
			PeerSlot& slot = entry.second;
			slot.channel->clearCallbacks();
			if (slot.opened && !slot.rejected && slot.channel->isOpen()) {
				slot.channel->send(makeMessage(MessageType::TRANSFER_CANCELLED));
			}
			slot.channel->close();
		}

		for (auto& channel : retired) {
			channel->clearCallbacks();
		}

		std::cout << "Stopped sharing " << old_code << " (" << removed.size() << " peers disconnected)" << std::endl;
	}

	runDeferred(deferred);
}

void PeerFanoutManager::scheduleStats(uint64_t epoch) {
	scheduler.schedule(std::chrono::milliseconds(config.stats_interval_ms), [this, epoch]() {
		onStatsTick(epoch);
	});
}

void PeerFanoutManager::scheduleCountdown(uint64_t epoch) {
	scheduler.schedule(std::chrono::milliseconds(config.countdown_interval_ms), [this, epoch]() {
		onCountdownTick(epoch);
	});
}

void PeerFanoutManager::onStatsTick(uint64_t epoch) {
	std::vector<std::shared_ptr<TransferSender>> senders;
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (session_epoch->load() != epoch) {
			return;
		}
		for (auto& entry : peers) {
			if (entry.second.sender) {
				senders.push_back(entry.second.sender);
			}
		}
	}

	auto now = ThroughputMeter::Clock::now();
	for (auto& sender : senders) {
		sender->sampleThroughput(now);
	}

	SharingStats stats;
	StatsCallback callback;
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (session_epoch->load() != epoch) {
			return;
		}
		stats = collectStatsLocked();
		callback = stats_callback;
	}

	if (callback) {
		callback(stats);
	}
	scheduleStats(epoch);
}

void PeerFanoutManager::onCountdownTick(uint64_t epoch) {
	TransferConstraints constraints;
	CountdownCallback callback;
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (session_epoch->load() != epoch || !share) {
			return;
		}
		constraints = share->manifest.constraints;
		callback = countdown_callback;
	}

	int64_t now = currentTimeMillis();
	int64_t remaining = std::max<int64_t>(0, (constraints.expires_at_ms - now + 999) / 1000);
	if (callback) {
		callback(remaining);
	}

	if (constraints.isExpired(now)) {
		std::cout << "Share expired, disconnecting everyone" << std::endl;
		teardown(SenderState::ERROR, TransferError::EXPIRED_SESSION, "share expired", epoch);
		return;
	}
	scheduleCountdown(epoch);
}

bool PeerFanoutManager::isSharingLocked() const {
	return state == SenderState::ANNOUNCING || state == SenderState::AWAITING_PEER ||
	       state == SenderState::PEER_CONNECTED || state == SenderState::TRANSFERRING;
}

void PeerFanoutManager::setStateLocked(SenderState new_state, Deferred& deferred) {
	if (state == new_state) {
		return;
	}
	state = new_state;
	std::cout << "Sharing state: " << senderStateToString(new_state) << std::endl;

	if (state_callback) {
		StateCallback callback = state_callback;
		std::string error = error_message;
		deferred.push_back([callback, new_state, error]() { callback(new_state, error); });
	}
}

void PeerFanoutManager::recomputeStateLocked(Deferred& deferred) {
	if (state != SenderState::AWAITING_PEER && state != SenderState::PEER_CONNECTED &&
	    state != SenderState::TRANSFERRING) {
		return;
	}

	bool any_connected = false;
	bool any_active = false;
	for (const auto& entry : peers) {
		const PeerSlot& slot = entry.second;
		if (slot.rejected) {
			continue;
		}
		if (slot.opened) {
			any_connected = true;
		}
		if (slot.sender && slot.sender->isActive()) {
			any_active = true;
		}
	}

	if (any_active) {
		setStateLocked(SenderState::TRANSFERRING, deferred);
	} else if (any_connected) {
		setStateLocked(SenderState::PEER_CONNECTED, deferred);
	} else {
		setStateLocked(SenderState::AWAITING_PEER, deferred);
	}
}

void PeerFanoutManager::notifyPeerLocked(const std::string& peer_id, PeerStatus status, Deferred& deferred) {
	if (peer_callback) {
		PeerCallback callback = peer_callback;
		deferred.push_back([callback, peer_id, status]() { callback(peer_id, status); });
	}
}

SharingStats PeerFanoutManager::collectStatsLocked() const {
	SharingStats stats;
	uint64_t progress_sum = 0;
	size_t active_peers = 0;

	for (const auto& entry : peers) {
		if (!entry.second.sender) {
			continue;
		}
		PeerStats peer = entry.second.sender->getStats();
		if (peer.active) {
			stats.total_speed += peer.current_speed;
			progress_sum += peer.progress_bytes;
			active_peers++;
		}
		stats.peers.push_back(peer);
	}

	uint64_t total_size = share ? share->manifest.total_size : 0;
	if (active_peers > 0 && total_size > 0) {
		stats.progress = static_cast<double>(progress_sum) / (static_cast<double>(active_peers) * total_size);
	}
	return stats;
}

void PeerFanoutManager::runDeferred(Deferred& deferred) {
	for (auto& notify : deferred) {
		notify();
	}
	deferred.clear();
}

SenderState PeerFanoutManager::getState() const {
	std::lock_guard<std::mutex> lock(mutex);
	return state;
}

TransferError PeerFanoutManager::getLastError() const {
	std::lock_guard<std::mutex> lock(mutex);
	return last_error;
}

std::string PeerFanoutManager::getErrorMessage() const {
	std::lock_guard<std::mutex> lock(mutex);
	return error_message;
}

std::string PeerFanoutManager::getCode() const {
	std::lock_guard<std::mutex> lock(mutex);
	return code;
}

size_t PeerFanoutManager::retiredCount() const {
	std::lock_guard<std::mutex> lock(mutex);
	return retired_channels.size();
}

size_t PeerFanoutManager::connectionCount() const {
	std::lock_guard<std::mutex> lock(mutex);
	size_t count = 0;
	for (const auto& entry : peers) {
		if (!entry.second.rejected) {
			count++;
		}
	}
	return count;
}

size_t PeerFanoutManager::activeTransferCount() const {
	std::lock_guard<std::mutex> lock(mutex);
	size_t count = 0;
	for (const auto& entry : peers) {
		if (entry.second.sender && entry.second.sender->isActive()) {
			count++;
		}
	}
	return count;
}

std::vector<PerPeerTransferState> PeerFanoutManager::getPeerStates() const {
	std::lock_guard<std::mutex> lock(mutex);
	std::vector<PerPeerTransferState> states;
	for (const auto& entry : peers) {
		if (entry.second.sender) {
			states.push_back(entry.second.sender->getState());
		}
	}
	return states;
}

SharingStats PeerFanoutManager::getStats() const {
	std::lock_guard<std::mutex> lock(mutex);
	return collectStatsLocked();
}
