#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

/**
 * Tunables for file transfer sessions (both sides)
 */
struct TransferConfig {
	size_t frame_size = 64 * 1024;                  // bytes per binary frame
	size_t read_batch_size = 16 * 1024 * 1024;      // bytes read from a source at once
	size_t high_water_mark = 64 * 1024;             // suspend sending above this
	size_t low_water_mark = 32 * 1024;              // resume at or below this
	uint32_t stats_interval_ms = 500;               // throughput sampling period
	uint32_t countdown_interval_ms = 1000;          // expiry check period
	uint32_t reject_close_delay_ms = 1000;          // time given to a rejection before closing
	bool auto_accept = false;                       // receiver accepts without user action
	bool auto_resume = true;                        // receiver resumes on reconnect without user action
};

/**
 * Tunables for chat rooms
 */
struct ChatConfig {
	size_t fragment_size = 16 * 1024;               // max serialized message size sent whole
	uint32_t yield_every = 5;                       // fragments between cooperative yields
	uint32_t pause_every = 20;                      // fragments between short sleeps
	uint32_t pause_ms = 5;
	uint32_t reconnect_delay_ms = 2000;             // guest rejoin delay after losing the host
	uint32_t host_retry_delay_ms = 2000;            // delay between host registration attempts
	uint32_t max_host_retries = 10;
	uint64_t max_attachment_bytes = 50ull * 1024 * 1024;
};

struct EngineConfig {
	TransferConfig transfer;
	ChatConfig chat;
};

/**
 * Loads configuration from a JSON file
 * Keys that are absent keep their defaults
 * @param path: JSON file with optional "transfer" and "chat" objects
 * @param config: filled in on success, untouched on failure
 * @return: false if the file cannot be read, parsed or holds invalid values
 */
bool loadConfig(const std::string& path, EngineConfig& config);

/**
 * Checks values that would make the engine misbehave
 * @param error: receives a description of the first problem found
 */
bool validateConfig(const EngineConfig& config, std::string& error);
