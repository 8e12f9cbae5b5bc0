#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * Output for one received file.
 * The receiver writes frames in arrival order, may cut the tail back to a
 * frame boundary when resuming, and either finalizes or aborts the sink.
 */
class FileSink {
public:
	virtual ~FileSink() = default;

	virtual bool write(const char* data, size_t length) = 0;

	/**
	 * Shrinks the written content to size bytes; later writes append from there
	 */
	virtual bool truncate(uint64_t size) = 0;

	virtual bool finalize() = 0;

	/**
	 * Discards the file, also after finalize()
	 */
	virtual void abort() = 0;

	virtual uint64_t bytesWritten() const = 0;
};

/**
 * Keeps received bytes in memory. The buffer is shared so it outlives the
 * sink and can be read by whoever created it.
 */
class MemoryFileSink : public FileSink {
public:
	struct Buffer {
		std::mutex mutex;
		std::vector<char> bytes;
		bool finalized = false;
		bool aborted = false;
	};

	explicit MemoryFileSink(std::shared_ptr<Buffer> buffer);

	bool write(const char* data, size_t length) override;
	bool truncate(uint64_t size) override;
	bool finalize() override;
	void abort() override;
	uint64_t bytesWritten() const override;

private:
	std::shared_ptr<Buffer> buffer;
};

/**
 * Writes to output_dir/name, creating parent directories for nested names
 */
class DiskFileSink : public FileSink {
private:
	std::string path;
	std::ofstream output_file;
	uint64_t written;

public:
	DiskFileSink(const std::string& output_dir, const std::string& name);
	~DiskFileSink() override;

	bool isOpen() const { return output_file.is_open(); }
	const std::string& getPath() const { return path; }

	bool write(const char* data, size_t length) override;
	bool truncate(uint64_t size) override;
	bool finalize() override;
	void abort() override;
	uint64_t bytesWritten() const override { return written; }
};
