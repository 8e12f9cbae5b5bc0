#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include "channel.hpp"

/**
 * FlowController gates a sender on one channel's send buffer.
 *
 * Above the high water mark the caller is suspended until the channel reports
 * it drained to the low water mark. The wait is event driven: the drained
 * callback takes the same mutex the wait predicate is evaluated under, so a
 * drain that lands between the check and the wait cannot be missed.
 * The wait also ends on channel close, interrupt(), or when the caller's
 * validity check turns false.
 */
class FlowController {
public:
	FlowController(std::shared_ptr<Channel> channel, size_t high_water_mark, size_t low_water_mark);
	~FlowController();

	FlowController(const FlowController&) = delete;
	FlowController& operator=(const FlowController&) = delete;

	/**
	 * Blocks until one more frame may be sent
	 * @param still_valid: checked while waiting; false means the caller is stale
	 * @return: true if the caller may send, false if it must stop
	 */
	bool waitForCapacity(const std::function<bool()>& still_valid);

	/**
	 * Wakes every waiter and makes further waits fail until reset()
	 */
	void interrupt();
	void reset();

	size_t highWaterMark() const { return high_water_mark; }
	size_t lowWaterMark() const { return low_water_mark; }
	uint64_t suspensionCount() const { return suspensions.load(); }

private:
	// Shared with the drained callback so it never outlives what it touches
	struct Gate {
		std::mutex mutex;
		std::condition_variable cv;
		bool interrupted = false;
	};

	std::shared_ptr<Channel> channel;
	size_t high_water_mark;
	size_t low_water_mark;
	std::shared_ptr<Gate> gate;
	std::atomic<uint64_t> suspensions{0};
};
