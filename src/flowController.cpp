#include "flowController.hpp"

FlowController::FlowController(std::shared_ptr<Channel> channel, size_t high_water_mark, size_t low_water_mark)
	: channel(std::move(channel)), high_water_mark(high_water_mark),
	  low_water_mark(low_water_mark < high_water_mark ? low_water_mark : high_water_mark),
	  gate(std::make_shared<Gate>()) {

	this->channel->setLowWaterMark(this->low_water_mark);

	std::shared_ptr<Gate> shared_gate = gate;
	this->channel->setDrainedCallback([shared_gate]() {
		// Taking the lock orders us after a waiter's predicate check
		{
			std::lock_guard<std::mutex> lock(shared_gate->mutex);
		}
		shared_gate->cv.notify_all();
	});
}

FlowController::~FlowController() {
	interrupt();
	channel->setDrainedCallback(nullptr);
}

bool FlowController::waitForCapacity(const std::function<bool()>& still_valid) {
	std::unique_lock<std::mutex> lock(gate->mutex);

	auto stopped = [this, &still_valid]() {
		return gate->interrupted || !channel->isOpen() || !still_valid();
	};

	if (stopped()) {
		return false;
	}
	if (channel->outstandingBytes() <= high_water_mark) {
		return true;
	}

	suspensions++;
	gate->cv.wait(lock, [this, &stopped]() {
		return stopped() || channel->outstandingBytes() <= low_water_mark;
	});

	return !stopped();
}

void FlowController::interrupt() {
	{
		std::lock_guard<std::mutex> lock(gate->mutex);
		gate->interrupted = true;
	}
	gate->cv.notify_all();
}

void FlowController::reset() {
	std::lock_guard<std::mutex> lock(gate->mutex);
	gate->interrupted = false;
}
