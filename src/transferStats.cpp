#include "transferStats.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

void ThroughputMeter::start(Clock::time_point now, uint64_t handed, uint64_t outstanding) {
	started_at = now;
	last_sample = now;
	last_handed = handed;
	last_outstanding = outstanding;
	delivered = 0;
	current_speed = 0.0;
	average_speed = 0.0;
}

void ThroughputMeter::sample(Clock::time_point now, uint64_t handed, uint64_t outstanding) {
	double interval = std::chrono::duration<double>(now - last_sample).count();
	if (interval <= 0.0) {
		return;
	}

	int64_t handed_delta = static_cast<int64_t>(handed - last_handed);
	int64_t outstanding_delta = static_cast<int64_t>(outstanding) - static_cast<int64_t>(last_outstanding);
	int64_t delivered_delta = handed_delta - outstanding_delta;
	if (delivered_delta < 0) {
		delivered_delta = 0;  // control messages also occupy the buffer
	}

	delivered += static_cast<uint64_t>(delivered_delta);
	if (delivered > handed) {
		delivered = handed;
	}

	current_speed = static_cast<double>(delivered_delta) / interval;

	double elapsed = std::chrono::duration<double>(now - started_at).count();
	average_speed = elapsed > 0.0 ? static_cast<double>(delivered) / elapsed : 0.0;

	last_sample = now;
	last_handed = handed;
	last_outstanding = outstanding;
}

std::string formatFileSize(double bytes) {
	if (!std::isfinite(bytes)) return "---";
	if (bytes <= 0) return "0 Bytes";

	static const char* units[] = {"Bytes", "KB", "MB", "GB", "TB"};
	int unit = 0;
	while (bytes >= 1024.0 && unit < 4) {
		bytes /= 1024.0;
		unit++;
	}

	std::ostringstream out;
	if (unit == 0) {
		out << static_cast<uint64_t>(bytes) << " " << units[unit];
	} else {
		out << std::fixed << std::setprecision(2) << bytes << " " << units[unit];
	}
	return out.str();
}
