#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

/**
 * Estimates how many bytes actually left the sender.
 *
 * Bytes handed to a channel are not delivered yet while they sit in its send
 * buffer, so every sample counts Δhanded − Δoutstanding as delivered.
 */
class ThroughputMeter {
public:
	using Clock = std::chrono::steady_clock;

	void start(Clock::time_point now, uint64_t handed, uint64_t outstanding);
	void sample(Clock::time_point now, uint64_t handed, uint64_t outstanding);

	double currentSpeed() const { return current_speed; }   // bytes per second, last interval
	double averageSpeed() const { return average_speed; }   // bytes per second, whole session
	uint64_t deliveredBytes() const { return delivered; }

private:
	Clock::time_point started_at{};
	Clock::time_point last_sample{};
	uint64_t last_handed = 0;
	uint64_t last_outstanding = 0;
	uint64_t delivered = 0;
	double current_speed = 0.0;
	double average_speed = 0.0;
};

struct PeerStats {
	std::string peer_id;
	bool active = false;                     // a send loop is running
	size_t current_file_index = 0;
	uint64_t bytes_sent_for_current_file = 0;
	uint64_t progress_bytes = 0;             // delivered bytes including files before the resume point
	double current_speed = 0.0;
	double average_speed = 0.0;
};

struct SharingStats {
	std::vector<PeerStats> peers;
	double total_speed = 0.0;                // sum over active peers
	double progress = 0.0;                   // 0..1, averaged over active peers
};

/**
 * Human-readable byte count, e.g. "1.5 MB"
 */
std::string formatFileSize(double bytes);
