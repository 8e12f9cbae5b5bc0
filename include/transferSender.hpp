#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "byteSource.hpp"
#include "channel.hpp"
#include "chunkedByteSender.hpp"
#include "config.hpp"
#include "flowController.hpp"
#include "protocol.hpp"
#include "transferStats.hpp"

/**
 * What a sharer offers: the manifest and one source per manifest entry.
 * Immutable once sharing starts; every send loop reads it concurrently.
 */
struct ShareSet {
	FileManifest manifest;
	std::vector<std::shared_ptr<ByteSource>> sources;
};

/**
 * Where one receiver's transfer stands
 */
struct PerPeerTransferState {
	std::string peer_id;
	size_t current_file_index = 0;
	uint64_t bytes_sent_for_current_file = 0;
	uint64_t session_id = 0;   // sharing epoch the loop was started under
};

/**
 * TransferSender is the sender half of a transfer session with one peer.
 *
 * It runs the send loop on its own thread: FILE_START, frames, FILE_COMPLETE
 * for every file from the start point, then ALL_FILES_COMPLETE. The loop is
 * tagged with the sharing epoch and a per-peer generation and re-checks both
 * before every file and every frame; once either moved on it exits without
 * sending anything else.
 */
class TransferSender {
public:
	using FinishedCallback = std::function<void(const std::string& peer_id, SendResult result)>;

	TransferSender(std::shared_ptr<Channel> channel, std::shared_ptr<const ShareSet> share,
		       const TransferConfig& config, std::shared_ptr<std::atomic<uint64_t>> session_epoch);
	~TransferSender();

	TransferSender(const TransferSender&) = delete;
	TransferSender& operator=(const TransferSender&) = delete;

	/**
	 * Starts (or restarts) the send loop
	 * @param file_index: first file to send
	 * @param chunk_index: frame index within that file, as stated by the receiver
	 * @return: false if the sender was shut down or the index is out of range
	 */
	bool start(size_t file_index, uint64_t chunk_index);

	/**
	 * Stops the running loop and waits for it; start() may be called again
	 */
	void stop();

	/**
	 * Stops for good. Later start() calls are refused.
	 */
	void shutdown();

	bool isActive() const { return active.load(); }
	const std::string& peerId() const { return peer_id; }

	PerPeerTransferState getState() const;
	PeerStats getStats() const;

	/**
	 * Takes one throughput sample (called periodically by the owner)
	 */
	void sampleThroughput(ThroughputMeter::Clock::time_point now);

	/**
	 * Called from the loop thread when a loop that is still current ends
	 */
	void setFinishedCallback(FinishedCallback callback) {
		finished_callback = callback;
	}

private:
	void sendLoop(uint64_t epoch, uint64_t loop_generation, size_t file_index, uint64_t offset);
	bool isCurrent(uint64_t epoch, uint64_t loop_generation) const;
	void stopLocked();

	std::string peer_id;
	std::shared_ptr<Channel> channel;
	std::shared_ptr<const ShareSet> share;
	TransferConfig config;
	std::shared_ptr<std::atomic<uint64_t>> session_epoch;
	FlowController flow;
	ChunkedByteSender byte_sender;

	std::mutex control_mutex;            // serializes start/stop/shutdown
	std::thread loop_thread;
	bool is_shut_down = false;
	std::atomic<uint64_t> generation{0};
	std::atomic<bool> active{false};

	mutable std::mutex state_mutex;
	PerPeerTransferState state;
	uint64_t base_bytes = 0;             // bytes the receiver held before this loop
	std::atomic<uint64_t> bytes_handed{0};
	ThroughputMeter meter;

	FinishedCallback finished_callback;
};
