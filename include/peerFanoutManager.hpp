#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "byteSource.hpp"
#include "channel.hpp"
#include "config.hpp"
#include "protocol.hpp"
#include "rendezvous.hpp"
#include "taskScheduler.hpp"
#include "transferSender.hpp"
#include "transferStats.hpp"

enum class SenderState {
	IDLE,
	CONFIGURING,
	ANNOUNCING,
	AWAITING_PEER,
	PEER_CONNECTED,
	TRANSFERRING,
	ERROR
};

enum class PeerStatus {
	CONNECTED,
	TRANSFERRING,
	COMPLETED,
	FAILED,
	DISCONNECTED,
	REJECTED
};

const char* senderStateToString(SenderState state);
const char* peerStatusToString(PeerStatus status);

/**
 * PeerFanoutManager is the sharing side of the engine.
 *
 * It announces a manifest under a room code, admits every connecting peer,
 * and gives each one its own TransferSender so a slow receiver never holds
 * up a fast one. Peers are kept in a map keyed by connection identity;
 * removing a peer is a map erase followed by stopping its loop.
 *
 * Tearing the session down bumps the shared epoch, which every loop checks
 * before each file and each frame, so nothing stale is sent afterwards.
 *
 * Callbacks are never invoked with the manager's lock held. The rendezvous
 * must outlive the manager.
 */
class PeerFanoutManager {
public:
	using StateCallback = std::function<void(SenderState state, const std::string& error)>;
	using PeerCallback = std::function<void(const std::string& peer_id, PeerStatus status)>;
	using StatsCallback = std::function<void(const SharingStats& stats)>;
	using CountdownCallback = std::function<void(int64_t remaining_seconds)>;

	PeerFanoutManager(const TransferConfig& config, Rendezvous& rendezvous);
	~PeerFanoutManager();

	PeerFanoutManager(const PeerFanoutManager&) = delete;
	PeerFanoutManager& operator=(const PeerFanoutManager&) = delete;

	/**
	 * Sets the files to share
	 * @param entries: manifest entries, in transfer order
	 * @param sources: one byte source per entry
	 * @param constraints: optional expiry
	 * @return: false while sharing or if entries and sources disagree
	 */
	bool configure(std::vector<FileEntry> entries, std::vector<std::shared_ptr<ByteSource>> sources,
		       const TransferConstraints& constraints = TransferConstraints());

	/**
	 * Convenience for files on disk; names are the paths' file names
	 */
	bool configureFiles(const std::vector<std::string>& paths,
			    const TransferConstraints& constraints = TransferConstraints());

	/**
	 * Registers the room code and starts admitting peers
	 * @return: false if the code is taken (back to CONFIGURING) or registration failed (ERROR)
	 */
	bool startSharing(const std::string& code);

	/**
	 * User abort: cancels every loop, tells every peer, closes everything, back to IDLE
	 */
	void stopSharing();

	/**
	 * Admits one incoming connection. Normally called by the rendezvous.
	 */
	void acceptConnection(std::shared_ptr<Channel> channel);

	SenderState getState() const;
	TransferError getLastError() const;
	std::string getErrorMessage() const;
	std::string getCode() const;
	uint64_t getEpoch() const { return session_epoch->load(); }

	size_t connectionCount() const;

	/**
	 * Closed connections whose handlers are still being unwound
	 */
	size_t retiredCount() const;
	size_t activeTransferCount() const;
	std::vector<PerPeerTransferState> getPeerStates() const;
	SharingStats getStats() const;

	void setStateCallback(StateCallback callback) { state_callback = callback; }
	void setPeerCallback(PeerCallback callback) { peer_callback = callback; }
	void setStatsCallback(StatsCallback callback) { stats_callback = callback; }
	void setCountdownCallback(CountdownCallback callback) { countdown_callback = callback; }

private:
	struct PeerSlot {
		std::shared_ptr<Channel> channel;
		std::shared_ptr<TransferSender> sender;   // null for rejected connections
		bool opened = false;
		bool rejected = false;
	};

	using Deferred = std::vector<std::function<void()>>;

	void handleOpen(const std::string& peer_id, uint64_t epoch);
	void handleMessage(const std::string& peer_id, uint64_t epoch, const TransferMessage& message);
	void handleClose(const std::string& peer_id, uint64_t epoch);
	void releaseRetired(const std::shared_ptr<Channel>& channel);
	void handleFinished(const std::string& peer_id, uint64_t epoch, SendResult result);

	/**
	 * Ends the sharing session
	 * @param expected_epoch: only tear down if still in this epoch; 0 for any
	 */
	void teardown(SenderState final_state, TransferError error, const std::string& message,
		      uint64_t expected_epoch);
	void scheduleStats(uint64_t epoch);
	void scheduleCountdown(uint64_t epoch);
	void onStatsTick(uint64_t epoch);
	void onCountdownTick(uint64_t epoch);

	bool isSharingLocked() const;
	void setStateLocked(SenderState new_state, Deferred& deferred);
	void recomputeStateLocked(Deferred& deferred);
	void notifyPeerLocked(const std::string& peer_id, PeerStatus status, Deferred& deferred);
	SharingStats collectStatsLocked() const;
	static void runDeferred(Deferred& deferred);

	TransferConfig config;
	Rendezvous& rendezvous;
	TaskScheduler scheduler;
	std::shared_ptr<std::atomic<uint64_t>> session_epoch;

	mutable std::mutex mutex;
	SenderState state = SenderState::IDLE;
	TransferError last_error = TransferError::NONE;
	std::string error_message;
	std::string code;
	bool registered = false;
	std::shared_ptr<const ShareSet> share;
	std::map<std::string, PeerSlot> peers;
	// Channels removed from the map whose callbacks may still be running
	std::vector<std::shared_ptr<Channel>> retired_channels;

	StateCallback state_callback;
	PeerCallback peer_callback;
	StatsCallback stats_callback;
	CountdownCallback countdown_callback;
};
