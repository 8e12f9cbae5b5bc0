#include "byteSource.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <sys/stat.h>
#include <unistd.h>

FileByteSource::FileByteSource(const std::string& path) : fd(-1), file_size(0), path(path) {
	fd = ::open(path.c_str(), O_RDONLY);
	if (fd < 0) {
		std::cerr << "Cannot open file: " << path << ". Error: " << strerror(errno) << std::endl;
		return;
	}

	struct stat info;
	if (fstat(fd, &info) < 0 || !S_ISREG(info.st_mode)) {
		std::cerr << "Not a regular file: " << path << std::endl;
		::close(fd);
		fd = -1;
		return;
	}
	file_size = static_cast<uint64_t>(info.st_size);
}

FileByteSource::~FileByteSource() {
	if (fd >= 0) {
		::close(fd);
	}
}

int64_t FileByteSource::read(uint64_t offset, char* buffer, size_t length) const {
	if (fd < 0) {
		return -1;
	}

	size_t total = 0;
	while (total < length) {
		ssize_t n = ::pread(fd, buffer + total, length - total, static_cast<off_t>(offset + total));
		if (n < 0) {
			if (errno == EINTR) continue;
			std::cerr << "Read error on " << path << ": " << strerror(errno) << std::endl;
			return -1;
		}
		if (n == 0) {
			break;  // end of file
		}
		total += static_cast<size_t>(n);
	}
	return static_cast<int64_t>(total);
}

MemoryByteSource::MemoryByteSource(std::vector<char> data)
	: bytes(std::make_shared<const std::vector<char>>(std::move(data))) {
}

int64_t MemoryByteSource::read(uint64_t offset, char* buffer, size_t length) const {
	if (offset >= bytes->size()) {
		return 0;
	}
	size_t available = static_cast<size_t>(bytes->size() - offset);
	size_t count = length < available ? length : available;
	std::memcpy(buffer, bytes->data() + offset, count);
	return static_cast<int64_t>(count);
}
