#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

/**
 * TaskScheduler runs delayed tasks on one worker thread.
 * Used for countdown ticks, delayed channel closes and reconnect retries.
 * Tasks run without the scheduler lock held, so a task may schedule or
 * cancel other tasks, including the next run of itself.
 */
class TaskScheduler {
public:
	TaskScheduler();
	~TaskScheduler();

	TaskScheduler(const TaskScheduler&) = delete;
	TaskScheduler& operator=(const TaskScheduler&) = delete;

	/**
	 * Schedules a task
	 * @param delay: time to wait before running it
	 * @param task: work to run on the scheduler thread
	 * @return: id usable with cancel()
	 */
	uint64_t schedule(std::chrono::milliseconds delay, std::function<void()> task);

	void cancel(uint64_t task_id);
	void cancelAll();

	/**
	 * Stops the worker. Pending tasks are dropped.
	 */
	void stop();

	size_t pendingCount() const;

private:
	struct Task {
		uint64_t id;
		std::function<void()> work;
	};

	void run();

	mutable std::mutex mutex;
	std::condition_variable cv;
	std::multimap<std::chrono::steady_clock::time_point, Task> tasks;
	uint64_t next_id = 1;
	bool running = true;
	std::thread worker;
};
