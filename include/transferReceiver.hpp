#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "channel.hpp"
#include "config.hpp"
#include "fileSink.hpp"
#include "protocol.hpp"
#include "rendezvous.hpp"

enum class ReceiverState {
	IDLE,
	AWAITING_METADATA,
	READY_TO_ACCEPT,
	RECEIVING,
	PAUSED,          // connection dropped mid-transfer, progress kept for resume
	COMPLETE,
	ERROR
};

enum class FileStatus {
	PENDING,
	RECEIVING,
	COMPLETED,
	FAILED
};

const char* receiverStateToString(ReceiverState state);
const char* fileStatusToString(FileStatus status);

struct ReceivedFile {
	FileEntry entry;
	FileStatus status = FileStatus::PENDING;
	uint64_t received_bytes = 0;
	TransferError error = TransferError::NONE;
};

/**
 * TransferReceiver is the receiving half of a transfer session.
 *
 * Binary frames carry no header: which file they belong to and where they go
 * follows from the last FILE_START and the running byte count. A file that
 * breaks the protocol fails on its own; files already received stay intact.
 *
 * Progress survives a dropped connection. Attaching to a new channel that
 * announces the same manifest resumes with RESUME_REQUEST from the last
 * frame boundary the receiver holds.
 */
class TransferReceiver {
public:
	/**
	 * Creates the output for one file; returning nullptr fails that file.
	 * Called with the receiver's lock held, so it must not call back into it.
	 */
	using SinkFactory = std::function<std::unique_ptr<FileSink>(size_t index, const FileEntry& entry)>;

	using StateCallback = std::function<void(ReceiverState state, const std::string& error)>;
	using ManifestCallback = std::function<void(const FileManifest& manifest, bool resumable)>;
	using ProgressCallback = std::function<void(size_t file_index, uint64_t received, uint64_t total)>;
	using FileCallback = std::function<void(size_t file_index, FileStatus status)>;

	TransferReceiver(const TransferConfig& config, SinkFactory sink_factory);
	~TransferReceiver();

	TransferReceiver(const TransferReceiver&) = delete;
	TransferReceiver& operator=(const TransferReceiver&) = delete;

	/**
	 * Connects to a sharer through the rendezvous and attaches to the channel
	 * @return: false if nobody shares under code or a channel is attached already
	 */
	bool connect(Rendezvous& rendezvous, const std::string& code, const std::string& local_id);

	/**
	 * Starts listening on an unopened channel
	 */
	bool attach(std::shared_ptr<Channel> channel);

	/**
	 * User accepted the offered files; sends ACCEPT_TRANSFER, or RESUME_REQUEST
	 * when the announced manifest continues an interrupted transfer
	 */
	bool accept();

	/**
	 * Drops the connection locally and keeps progress
	 */
	void disconnect();

	/**
	 * Drops the connection and forgets everything, partial output included
	 */
	void reset();

	ReceiverState getState() const;
	TransferError getLastError() const;
	std::string getErrorMessage() const;
	FileManifest getManifest() const;
	std::vector<ReceivedFile> getFiles() const;
	uint64_t totalReceivedBytes() const;

	/**
	 * Where a resumed transfer would start
	 * @return: false if there is nothing to resume
	 */
	bool getResumePoint(ResumePayload& resume) const;

	void setStateCallback(StateCallback callback) { state_callback = callback; }
	void setManifestCallback(ManifestCallback callback) { manifest_callback = callback; }
	void setProgressCallback(ProgressCallback callback) { progress_callback = callback; }
	void setFileCallback(FileCallback callback) { file_callback = callback; }

private:
	using Deferred = std::vector<std::function<void()>>;

	void handleMessage(uint64_t channel_generation, const TransferMessage& message);
	void handleFrame(uint64_t channel_generation, const std::vector<char>& frame);
	void handleClose(uint64_t channel_generation);

	void onMetadata(const TransferMessage& message, Deferred& deferred);
	void onFileStart(const TransferMessage& message, Deferred& deferred);
	void onFileComplete(const TransferMessage& message, Deferred& deferred);
	void onAllFilesComplete(Deferred& deferred);

	void sendStartRequestLocked(Deferred& deferred);
	bool resumePointLocked(ResumePayload& resume) const;
	bool hasProgressLocked() const;
	void failFileLocked(size_t index, TransferError error, const std::string& reason, Deferred& deferred);
	void setStateLocked(ReceiverState new_state, Deferred& deferred);
	void failSessionLocked(TransferError error, const std::string& reason, Deferred& deferred);
	std::shared_ptr<Channel> detachLocked();
	static void runDeferred(Deferred& deferred);

	TransferConfig config;
	SinkFactory sink_factory;

	mutable std::mutex mutex;
	ReceiverState state = ReceiverState::IDLE;
	TransferError last_error = TransferError::NONE;
	std::string error_message;

	std::shared_ptr<Channel> channel;
	uint64_t generation = 0;           // bumped whenever the attached channel changes

	bool has_manifest = false;
	FileManifest manifest;
	std::vector<ReceivedFile> files;
	bool resumable = false;            // the last METADATA continues retained progress

	// The file frames currently go to. Kept across a dropped connection for resume.
	bool has_current = false;
	size_t current_index = 0;
	std::unique_ptr<FileSink> current_sink;
	bool file_open = false;            // frames are expected for current_index
	bool sink_finalized = false;       // current_sink holds the whole file and was closed
	bool discarding = false;           // current file failed, drop frames until the next FILE_START

	bool awaiting_resume = false;
	ResumePayload requested_resume;

	StateCallback state_callback;
	ManifestCallback manifest_callback;
	ProgressCallback progress_callback;
	FileCallback file_callback;
};
