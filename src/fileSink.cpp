#include "fileSink.hpp"
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

MemoryFileSink::MemoryFileSink(std::shared_ptr<Buffer> buffer) : buffer(std::move(buffer)) {
}

bool MemoryFileSink::write(const char* data, size_t length) {
	std::lock_guard<std::mutex> lock(buffer->mutex);
	buffer->bytes.insert(buffer->bytes.end(), data, data + length);
	return true;
}

bool MemoryFileSink::truncate(uint64_t size) {
	std::lock_guard<std::mutex> lock(buffer->mutex);
	if (size > buffer->bytes.size()) {
		return false;
	}
	buffer->bytes.resize(static_cast<size_t>(size));
	buffer->finalized = false;
	return true;
}

bool MemoryFileSink::finalize() {
	std::lock_guard<std::mutex> lock(buffer->mutex);
	buffer->finalized = true;
	return true;
}

void MemoryFileSink::abort() {
	std::lock_guard<std::mutex> lock(buffer->mutex);
	buffer->bytes.clear();
	buffer->finalized = false;
	buffer->aborted = true;
}

uint64_t MemoryFileSink::bytesWritten() const {
	std::lock_guard<std::mutex> lock(buffer->mutex);
	return buffer->bytes.size();
}

/**
 * Keeps a received name inside the output directory:
 * no root, no "..", no empty components
 */
static fs::path safeRelativePath(const std::string& name) {
	fs::path result;
	for (const auto& part : fs::path(name).relative_path()) {
		std::string component = part.string();
		if (component.empty() || component == "." ) continue;
		if (component == "..") component = "_";
		result /= component;
	}
	if (result.empty()) {
		result = "unnamed.bin";
	}
	return result;
}

DiskFileSink::DiskFileSink(const std::string& output_dir, const std::string& name) : written(0) {
	fs::path target = fs::path(output_dir) / safeRelativePath(name);
	path = target.string();

	std::error_code ec;
	if (target.has_parent_path()) {
		fs::create_directories(target.parent_path(), ec);
		if (ec) {
			std::cerr << "Failed to create directory for " << path << ": " << ec.message() << std::endl;
			return;
		}
	}

	output_file.open(path, std::ios::binary | std::ios::trunc);
	if (!output_file.is_open()) {
		std::cerr << "Failed to create output file: " << path << std::endl;
		return;
	}
	std::cout << "Creating file: " << path << std::endl;
}

DiskFileSink::~DiskFileSink() {
	if (output_file.is_open()) {
		output_file.close();
	}
}

bool DiskFileSink::write(const char* data, size_t length) {
	if (!output_file.is_open()) {
		return false;
	}
	output_file.write(data, static_cast<std::streamsize>(length));
	if (!output_file) {
		std::cerr << "Write error on " << path << std::endl;
		return false;
	}
	written += length;
	return true;
}

bool DiskFileSink::truncate(uint64_t size) {
	if (size > written) {
		return false;
	}
	if (output_file.is_open()) {
		output_file.close();
	}

	std::error_code ec;
	fs::resize_file(path, size, ec);
	if (ec) {
		std::cerr << "Failed to truncate " << path << ": " << ec.message() << std::endl;
		return false;
	}

	output_file.open(path, std::ios::binary | std::ios::app);
	if (!output_file.is_open()) {
		std::cerr << "Failed to reopen " << path << std::endl;
		return false;
	}
	written = size;
	return true;
}

bool DiskFileSink::finalize() {
	if (!output_file.is_open()) {
		return false;
	}
	output_file.close();
	if (output_file.fail()) {
		std::cerr << "Failed to close " << path << std::endl;
		return false;
	}
	std::cout << "File received successfully: " << path << " (" << written << " bytes)" << std::endl;
	return true;
}

void DiskFileSink::abort() {
	if (output_file.is_open()) {
		output_file.close();
	}
	std::remove(path.c_str());
	written = 0;
}
