#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

/**
 * Read-only random access to the bytes of one shared file.
 * read() must be safe to call from several send loops at once.
 */
class ByteSource {
public:
	virtual ~ByteSource() = default;

	virtual uint64_t size() const = 0;

	/**
	 * Reads up to length bytes starting at offset
	 * @return: bytes read, or -1 on error
	 */
	virtual int64_t read(uint64_t offset, char* buffer, size_t length) const = 0;
};

/**
 * File on disk, read with pread() so concurrent readers share one descriptor
 */
class FileByteSource : public ByteSource {
private:
	int fd;
	uint64_t file_size;
	std::string path;

public:
	explicit FileByteSource(const std::string& path);
	~FileByteSource() override;

	FileByteSource(const FileByteSource&) = delete;
	FileByteSource& operator=(const FileByteSource&) = delete;

	bool isOpen() const { return fd >= 0; }
	const std::string& getPath() const { return path; }

	uint64_t size() const override { return file_size; }
	int64_t read(uint64_t offset, char* buffer, size_t length) const override;
};

/**
 * Bytes already in memory
 */
class MemoryByteSource : public ByteSource {
private:
	std::shared_ptr<const std::vector<char>> bytes;

public:
	explicit MemoryByteSource(std::vector<char> data);

	uint64_t size() const override { return bytes->size(); }
	int64_t read(uint64_t offset, char* buffer, size_t length) const override;
};
