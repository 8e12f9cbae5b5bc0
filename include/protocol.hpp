//this header file defines the control messages exchanged over a channel
#pragma once
#include <string>
#include <cstdint>
#include <vector>
#include <nlohmann/json.hpp>

enum class MessageType {
	METADATA,
	FILE_START,
	FILE_COMPLETE,
	ALL_FILES_COMPLETE,
	ACCEPT_TRANSFER,
	REJECT_TRANSFER,
	RESUME_REQUEST,
	TRANSFER_CANCELLED,
	CHAT_MESSAGE,
	CHAT_MESSAGE_CHUNK
};

/**
 * Failure categories reported by the transfer and chat engines
 */
enum class TransferError {
	NONE,
	PROTOCOL_VIOLATION,   // frame without file context, size overrun, out of order completion
	CHANNEL_CLOSED,       // connection lost mid-transfer, resumable
	IDENTITY_CONFLICT,    // room code already registered
	EXPIRED_SESSION,      // share past its expiry
	CANCELLED,            // voluntary teardown
	IO_ERROR              // sink or source failure
};

const char* messageTypeToString(MessageType type);
const char* transferErrorToString(TransferError error);

struct FileEntry {
	std::string name;
	uint64_t size = 0;
	std::string mime_type;
	int64_t last_modified = 0;
	std::string fingerprint;
};

struct TransferConstraints {
	bool has_expiry = false;
	int64_t expires_at_ms = 0;   // milliseconds since the Unix epoch

	bool isExpired(int64_t now_ms) const { return has_expiry && now_ms > expires_at_ms; }
};

enum class ExpiryPreset {
	TEN_MINUTES,
	ONE_HOUR,
	ONE_DAY,
	NEVER
};

/**
 * Constraints for one of the share durations offered to the user
 * @param preset: how long the share stays open
 * @param now_ms: start of the share, milliseconds since the Unix epoch
 */
TransferConstraints constraintsForPreset(ExpiryPreset preset, int64_t now_ms);

/**
 * Ordered list of files offered in one sharing session
 * Files are identified by position, never by name
 */
struct FileManifest {
	std::vector<FileEntry> files;
	uint64_t total_size = 0;
	TransferConstraints constraints;

	/**
	 * Builds a manifest, filling in total size and missing fingerprints
	 */
	static FileManifest build(std::vector<FileEntry> entries, const TransferConstraints& constraints);

	/**
	 * Checks whether this manifest describes the same files as a previous one
	 * Used by a reconnecting receiver to decide if it may resume
	 */
	bool sameFilesAs(const FileManifest& previous) const;
};

struct FileStartPayload {
	uint64_t file_index = 0;
	std::string file_name;
	uint64_t file_size = 0;
	std::string file_type;
};

struct ResumePayload {
	uint64_t file_index = 0;
	uint64_t chunk_index = 0;
};

enum class ChatMessageType {
	TEXT,
	IMAGE,
	FILE
};

struct ChatFileData {
	std::string name;
	uint64_t size = 0;
	std::string mime_type;
	std::string data;   // base64 content
};

struct ChatMessage {
	std::string id;
	std::string sender_id;
	std::string sender_name;
	ChatMessageType type = ChatMessageType::TEXT;
	std::string content;
	bool has_file_data = false;
	ChatFileData file_data;
	int64_t timestamp = 0;
	bool is_system = false;
};

struct ChunkedChatPayload {
	std::string message_id;
	uint32_t index = 0;
	uint32_t total = 0;
	std::string fragment;
};

struct TransferMessage {
	MessageType type;
	nlohmann::json data;

	std::string serialize() const;
	static TransferMessage deserialize(const std::string& jsonStr);
};

TransferMessage makeMessage(MessageType type, nlohmann::json data = nlohmann::json::object());

/**
 * Lightweight file identity: djb2 over name, size, type and modification time
 * Returned in base 36
 */
std::string computeFingerprint(const FileEntry& entry);

int64_t currentTimeMillis();

void to_json(nlohmann::json& j, const FileEntry& entry);
void from_json(const nlohmann::json& j, FileEntry& entry);
void to_json(nlohmann::json& j, const TransferConstraints& constraints);
void from_json(const nlohmann::json& j, TransferConstraints& constraints);
void to_json(nlohmann::json& j, const FileManifest& manifest);
void from_json(const nlohmann::json& j, FileManifest& manifest);
void to_json(nlohmann::json& j, const FileStartPayload& payload);
void from_json(const nlohmann::json& j, FileStartPayload& payload);
void to_json(nlohmann::json& j, const ResumePayload& payload);
void from_json(const nlohmann::json& j, ResumePayload& payload);
void to_json(nlohmann::json& j, const ChatMessage& message);
void from_json(const nlohmann::json& j, ChatMessage& message);
void to_json(nlohmann::json& j, const ChunkedChatPayload& payload);
void from_json(const nlohmann::json& j, ChunkedChatPayload& payload);
