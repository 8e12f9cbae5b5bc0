#include "taskScheduler.hpp"
#include <exception>
#include <iostream>

TaskScheduler::TaskScheduler() {
	worker = std::thread(&TaskScheduler::run, this);
}

TaskScheduler::~TaskScheduler() {
	stop();
}

uint64_t TaskScheduler::schedule(std::chrono::milliseconds delay, std::function<void()> task) {
	uint64_t id;
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (!running) {
			return 0;
		}
		id = next_id++;
		tasks.emplace(std::chrono::steady_clock::now() + delay, Task{id, std::move(task)});
	}
	cv.notify_all();
	return id;
}

void TaskScheduler::cancel(uint64_t task_id) {
	std::lock_guard<std::mutex> lock(mutex);
	for (auto it = tasks.begin(); it != tasks.end(); ++it) {
		if (it->second.id == task_id) {
			tasks.erase(it);
			return;
		}
	}
}

void TaskScheduler::cancelAll() {
	std::lock_guard<std::mutex> lock(mutex);
	tasks.clear();
}

void TaskScheduler::stop() {
	{
		std::lock_guard<std::mutex> lock(mutex);
		running = false;
		tasks.clear();
	}
	cv.notify_all();

	if (worker.joinable()) {
		if (worker.get_id() == std::this_thread::get_id()) {
			worker.detach();
		} else {
			worker.join();
		}
	}
}

size_t TaskScheduler::pendingCount() const {
	std::lock_guard<std::mutex> lock(mutex);
	return tasks.size();
}

void TaskScheduler::run() {
	std::unique_lock<std::mutex> lock(mutex);
	while (running) {
		if (tasks.empty()) {
			cv.wait(lock);
			continue;
		}

		auto due = tasks.begin()->first;
		if (std::chrono::steady_clock::now() < due) {
			cv.wait_until(lock, due);
			continue;
		}

		Task task = std::move(tasks.begin()->second);
		tasks.erase(tasks.begin());

		lock.unlock();
		try {
			task.work();
		} catch (const std::exception& e) {
			std::cerr << "Scheduled task " << task.id << " failed: " << e.what() << std::endl;
		}
		lock.lock();
	}
}
