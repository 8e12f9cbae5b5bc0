#include "protocol.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <stdexcept>

using json = nlohmann::json;

const char* messageTypeToString(MessageType type) {
    switch (type) {
        case MessageType::METADATA: return "METADATA";
        case MessageType::FILE_START: return "FILE_START";
        case MessageType::FILE_COMPLETE: return "FILE_COMPLETE";
        case MessageType::ALL_FILES_COMPLETE: return "ALL_FILES_COMPLETE";
        case MessageType::ACCEPT_TRANSFER: return "ACCEPT_TRANSFER";
        case MessageType::REJECT_TRANSFER: return "REJECT_TRANSFER";
        case MessageType::RESUME_REQUEST: return "RESUME_REQUEST";
        case MessageType::TRANSFER_CANCELLED: return "TRANSFER_CANCELLED";
        case MessageType::CHAT_MESSAGE: return "CHAT_MESSAGE";
        case MessageType::CHAT_MESSAGE_CHUNK: return "CHAT_MESSAGE_CHUNK";
    }
    return "UNKNOWN";
}

const char* transferErrorToString(TransferError error) {
    switch (error) {
        case TransferError::NONE: return "none";
        case TransferError::PROTOCOL_VIOLATION: return "protocol violation";
        case TransferError::CHANNEL_CLOSED: return "channel closed";
        case TransferError::IDENTITY_CONFLICT: return "identity conflict";
        case TransferError::EXPIRED_SESSION: return "session expired";
        case TransferError::CANCELLED: return "cancelled";
        case TransferError::IO_ERROR: return "i/o error";
    }
    return "unknown";
}

/**
 * Serialize a TransferMessage to JSON string for the wire
 * Binary frames never go through here, they travel as raw bytes
 */
std::string TransferMessage::serialize() const {
    json j;
    j["type"] = messageTypeToString(type);

    // Payload-less messages still carry an empty object so the shape is uniform
    j["payload"] = data.is_null() ? json::object() : data;

    return j.dump();
}

/**
 * Deserialize a JSON string back to TransferMessage
 * Throws json::exception on malformed input, std::invalid_argument on unknown type
 */
TransferMessage TransferMessage::deserialize(const std::string& jsonStr) {
    TransferMessage msg;
    json j = json::parse(jsonStr);

    // Convert string type back to enum
    std::string type_str = j.at("type").get<std::string>();
    if (type_str == "METADATA") msg.type = MessageType::METADATA;
    else if (type_str == "FILE_START") msg.type = MessageType::FILE_START;
    else if (type_str == "FILE_COMPLETE") msg.type = MessageType::FILE_COMPLETE;
    else if (type_str == "ALL_FILES_COMPLETE") msg.type = MessageType::ALL_FILES_COMPLETE;
    else if (type_str == "ACCEPT_TRANSFER") msg.type = MessageType::ACCEPT_TRANSFER;
    else if (type_str == "REJECT_TRANSFER") msg.type = MessageType::REJECT_TRANSFER;
    else if (type_str == "RESUME_REQUEST") msg.type = MessageType::RESUME_REQUEST;
    else if (type_str == "TRANSFER_CANCELLED") msg.type = MessageType::TRANSFER_CANCELLED;
    else if (type_str == "CHAT_MESSAGE") msg.type = MessageType::CHAT_MESSAGE;
    else if (type_str == "CHAT_MESSAGE_CHUNK") msg.type = MessageType::CHAT_MESSAGE_CHUNK;
    else throw std::invalid_argument("Unknown message type: " + type_str);

    msg.data = j.value("payload", json::object());

    return msg;
}

TransferMessage makeMessage(MessageType type, json data) {
    TransferMessage msg;
    msg.type = type;
    msg.data = std::move(data);
    return msg;
}

std::string computeFingerprint(const FileEntry& entry) {
    std::string key = entry.name + "|" + std::to_string(entry.size) + "|" +
                      entry.mime_type + "|" + std::to_string(entry.last_modified);

    uint32_t hash = 5381;
    for (unsigned char c : key) {
        hash = ((hash << 5) + hash) ^ c;
    }

    static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::string out;
    do {
        out.insert(out.begin(), digits[hash % 36]);
        hash /= 36;
    } while (hash > 0);
    return out;
}

int64_t currentTimeMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

TransferConstraints constraintsForPreset(ExpiryPreset preset, int64_t now_ms) {
    const int64_t minute = 60 * 1000;
    TransferConstraints constraints;
    constraints.has_expiry = true;

    switch (preset) {
        case ExpiryPreset::TEN_MINUTES:
            constraints.expires_at_ms = now_ms + 10 * minute;
            break;
        case ExpiryPreset::ONE_HOUR:
            constraints.expires_at_ms = now_ms + 60 * minute;
            break;
        case ExpiryPreset::ONE_DAY:
            constraints.expires_at_ms = now_ms + 24 * 60 * minute;
            break;
        case ExpiryPreset::NEVER:
            constraints.has_expiry = false;
            break;
    }
    return constraints;
}

FileManifest FileManifest::build(std::vector<FileEntry> entries, const TransferConstraints& constraints) {
    FileManifest manifest;
    manifest.constraints = constraints;
    for (auto& entry : entries) {
        if (entry.fingerprint.empty()) {
            entry.fingerprint = computeFingerprint(entry);
        }
        manifest.total_size += entry.size;
    }
    manifest.files = std::move(entries);
    return manifest;
}

bool FileManifest::sameFilesAs(const FileManifest& previous) const {
    if (files.size() != previous.files.size() || total_size != previous.total_size) {
        return false;
    }
    for (size_t i = 0; i < files.size(); i++) {
        const FileEntry& now = files[i];
        const FileEntry& before = previous.files[i];
        if (!now.fingerprint.empty() && !before.fingerprint.empty()) {
            if (now.fingerprint != before.fingerprint) return false;
        } else if (now.name != before.name || now.size != before.size) {
            return false;
        }
    }
    return true;
}

void to_json(json& j, const FileEntry& entry) {
    j = json{
        {"name", entry.name},
        {"size", entry.size},
        {"type", entry.mime_type},
        {"lastModified", entry.last_modified},
        {"fingerprint", entry.fingerprint}
    };
}

void from_json(const json& j, FileEntry& entry) {
    entry.name = j.at("name").get<std::string>();
    entry.size = j.at("size").get<uint64_t>();
    entry.mime_type = j.value("type", "");
    entry.last_modified = j.value("lastModified", static_cast<int64_t>(0));
    entry.fingerprint = j.value("fingerprint", "");
}

void to_json(json& j, const TransferConstraints& constraints) {
    j = json::object();
    if (constraints.has_expiry) {
        j["expiresAt"] = constraints.expires_at_ms;
    }
}

void from_json(const json& j, TransferConstraints& constraints) {
    constraints.has_expiry = j.contains("expiresAt") && !j["expiresAt"].is_null();
    constraints.expires_at_ms = constraints.has_expiry ? j["expiresAt"].get<int64_t>() : 0;
}

void to_json(json& j, const FileManifest& manifest) {
    j = json{
        {"files", manifest.files},
        {"totalSize", manifest.total_size},
        {"constraints", manifest.constraints}
    };
}

void from_json(const json& j, FileManifest& manifest) {
    manifest.files = j.at("files").get<std::vector<FileEntry>>();
    manifest.total_size = j.at("totalSize").get<uint64_t>();
    manifest.constraints = j.value("constraints", TransferConstraints());
}

void to_json(json& j, const FileStartPayload& payload) {
    j = json{
        {"fileIndex", payload.file_index},
        {"fileName", payload.file_name},
        {"fileSize", payload.file_size},
        {"fileType", payload.file_type}
    };
}

void from_json(const json& j, FileStartPayload& payload) {
    payload.file_index = j.at("fileIndex").get<uint64_t>();
    payload.file_name = j.value("fileName", "");
    payload.file_size = j.at("fileSize").get<uint64_t>();
    payload.file_type = j.value("fileType", "");
}

void to_json(json& j, const ResumePayload& payload) {
    j = json{{"fileIndex", payload.file_index}, {"chunkIndex", payload.chunk_index}};
}

void from_json(const json& j, ResumePayload& payload) {
    payload.file_index = j.at("fileIndex").get<uint64_t>();
    payload.chunk_index = j.at("chunkIndex").get<uint64_t>();
}

static const char* chatTypeToString(ChatMessageType type) {
    switch (type) {
        case ChatMessageType::TEXT: return "text";
        case ChatMessageType::IMAGE: return "image";
        case ChatMessageType::FILE: return "file";
    }
    return "text";
}

static ChatMessageType chatTypeFromString(const std::string& type) {
    if (type == "image") return ChatMessageType::IMAGE;
    if (type == "file") return ChatMessageType::FILE;
    if (type == "text") return ChatMessageType::TEXT;
    throw std::invalid_argument("Unknown chat message type: " + type);
}

void to_json(json& j, const ChatMessage& message) {
    j = json{
        {"id", message.id},
        {"senderId", message.sender_id},
        {"type", chatTypeToString(message.type)},
        {"content", message.content},
        {"timestamp", message.timestamp},
        {"isSystem", message.is_system}
    };
    if (!message.sender_name.empty()) {
        j["senderName"] = message.sender_name;
    }
    if (message.has_file_data) {
        j["fileData"] = {
            {"name", message.file_data.name},
            {"size", message.file_data.size},
            {"mimeType", message.file_data.mime_type},
            {"data", message.file_data.data}
        };
    }
}

void from_json(const json& j, ChatMessage& message) {
    message.id = j.at("id").get<std::string>();
    message.sender_id = j.at("senderId").get<std::string>();
    message.sender_name = j.value("senderName", "");
    message.type = chatTypeFromString(j.value("type", "text"));
    message.content = j.value("content", "");
    message.timestamp = j.value("timestamp", static_cast<int64_t>(0));
    message.is_system = j.value("isSystem", false);

    message.has_file_data = j.contains("fileData") && j["fileData"].is_object();
    if (message.has_file_data) {
        const json& fd = j["fileData"];
        message.file_data.name = fd.value("name", "");
        message.file_data.size = fd.value("size", static_cast<uint64_t>(0));
        message.file_data.mime_type = fd.value("mimeType", "");
        message.file_data.data = fd.value("data", "");
    }
}

void to_json(json& j, const ChunkedChatPayload& payload) {
    j = json{
        {"messageId", payload.message_id},
        {"index", payload.index},
        {"total", payload.total},
        {"fragment", payload.fragment}
    };
}

void from_json(const json& j, ChunkedChatPayload& payload) {
    payload.message_id = j.at("messageId").get<std::string>();
    payload.index = j.at("index").get<uint32_t>();
    payload.total = j.at("total").get<uint32_t>();
    payload.fragment = j.at("fragment").get<std::string>();
}
