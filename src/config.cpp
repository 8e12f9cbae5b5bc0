#include "config.hpp"
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

bool validateConfig(const EngineConfig& config, std::string& error) {
	const TransferConfig& t = config.transfer;
	if (t.frame_size == 0) {
		error = "transfer.frame_size must be positive";
		return false;
	}
	if (t.read_batch_size < t.frame_size) {
		error = "transfer.read_batch_size must be at least one frame";
		return false;
	}
	if (t.low_water_mark > t.high_water_mark) {
		error = "transfer.low_water_mark must not exceed transfer.high_water_mark";
		return false;
	}
	if (t.stats_interval_ms == 0 || t.countdown_interval_ms == 0) {
		error = "transfer intervals must be positive";
		return false;
	}
	if (config.chat.fragment_size < 16) {
		error = "chat.fragment_size is too small";
		return false;
	}
	if (config.chat.yield_every == 0 || config.chat.pause_every == 0) {
		error = "chat pacing intervals must be positive";
		return false;
	}
	return true;
}

bool loadConfig(const std::string& path, EngineConfig& config) {
	std::ifstream file(path);
	if (!file.is_open()) {
		std::cerr << "Cannot open config file: " << path << std::endl;
		return false;
	}

	EngineConfig loaded = config;

	try {
		json j = json::parse(file);

		if (j.contains("transfer")) {
			const json& t = j["transfer"];
			TransferConfig& out = loaded.transfer;
			out.frame_size = t.value("frame_size", out.frame_size);
			out.read_batch_size = t.value("read_batch_size", out.read_batch_size);
			out.high_water_mark = t.value("high_water_mark", out.high_water_mark);
			out.low_water_mark = t.value("low_water_mark", out.low_water_mark);
			out.stats_interval_ms = t.value("stats_interval_ms", out.stats_interval_ms);
			out.countdown_interval_ms = t.value("countdown_interval_ms", out.countdown_interval_ms);
			out.reject_close_delay_ms = t.value("reject_close_delay_ms", out.reject_close_delay_ms);
			out.auto_accept = t.value("auto_accept", out.auto_accept);
			out.auto_resume = t.value("auto_resume", out.auto_resume);
		}

		if (j.contains("chat")) {
			const json& c = j["chat"];
			ChatConfig& out = loaded.chat;
			out.fragment_size = c.value("fragment_size", out.fragment_size);
			out.yield_every = c.value("yield_every", out.yield_every);
			out.pause_every = c.value("pause_every", out.pause_every);
			out.pause_ms = c.value("pause_ms", out.pause_ms);
			out.reconnect_delay_ms = c.value("reconnect_delay_ms", out.reconnect_delay_ms);
			out.host_retry_delay_ms = c.value("host_retry_delay_ms", out.host_retry_delay_ms);
			out.max_host_retries = c.value("max_host_retries", out.max_host_retries);
			out.max_attachment_bytes = c.value("max_attachment_bytes", out.max_attachment_bytes);
		}
	} catch (const json::exception& e) {
		std::cerr << "Invalid config file " << path << ": " << e.what() << std::endl;
		return false;
	}

	std::string error;
	if (!validateConfig(loaded, error)) {
		std::cerr << "Invalid config file " << path << ": " << error << std::endl;
		return false;
	}

	config = loaded;
	std::cout << "Loaded configuration from " << path << std::endl;
	return true;
}
