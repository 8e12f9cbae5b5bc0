#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <mutex>
#include "memoryChannel.hpp"
#include "peerFanoutManager.hpp"
#include "transferReceiver.hpp"
#include "testUtils.hpp"

using json = nlohmann::json;

static const uint64_t FRAME = 64 * 1024;

static TransferConfig testConfig() {
	TransferConfig config;
	config.stats_interval_ms = 50;
	config.countdown_interval_ms = 50;
	config.reject_close_delay_ms = 100;
	config.auto_accept = true;
	return config;
}

struct SharedFiles {
	std::vector<FileEntry> entries;
	std::vector<std::shared_ptr<ByteSource>> sources;
	std::vector<std::vector<char>> contents;
};

static SharedFiles makeShare(const std::vector<size_t>& sizes) {
	SharedFiles files;
	for (size_t i = 0; i < sizes.size(); i++) {
		FileEntry entry;
		entry.name = "file" + std::to_string(i) + ".bin";
		entry.size = sizes[i];
		entry.mime_type = "application/octet-stream";
		entry.last_modified = 1000;
		files.entries.push_back(entry);
		files.contents.push_back(makePattern(sizes[i], static_cast<unsigned>(i + 1)));
		files.sources.push_back(std::make_shared<MemoryByteSource>(files.contents.back()));
	}
	return files;
}

/**
 * Thread-safe list of peer status changes
 */
struct PeerLog {
	std::mutex mutex;
	std::vector<std::pair<std::string, PeerStatus>> entries;

	PeerFanoutManager::PeerCallback callback() {
		return [this](const std::string& peer_id, PeerStatus status) {
			std::lock_guard<std::mutex> lock(mutex);
			entries.emplace_back(peer_id, status);
		};
	}

	bool saw(PeerStatus status) {
		std::lock_guard<std::mutex> lock(mutex);
		for (const auto& entry : entries) {
			if (entry.second == status) return true;
		}
		return false;
	}
};

TEST(TransferSessionTest, DeliversEveryFileInOrder) {
	TransferConfig config = testConfig();
	InProcessRendezvous rendezvous;
	size_t frame = static_cast<size_t>(FRAME);
	SharedFiles files = makeShare({0, 1, frame - 1, frame, frame + 1, 10 * frame, 200 * 1024});
	PeerLog log;

	PeerFanoutManager manager(config, rendezvous);
	manager.setPeerCallback(log.callback());
	ASSERT_TRUE(manager.configure(files.entries, files.sources));
	EXPECT_EQ(manager.getState(), SenderState::CONFIGURING);
	ASSERT_TRUE(manager.startSharing("room"));
	EXPECT_EQ(manager.getState(), SenderState::AWAITING_PEER);
	EXPECT_TRUE(rendezvous.isRegistered("room"));

	SinkCollector sinks;
	TransferReceiver receiver(config, sinks.factory());
	ASSERT_TRUE(receiver.connect(rendezvous, "room", "rx"));

	ASSERT_TRUE(waitFor([&]() { return receiver.getState() == ReceiverState::COMPLETE; }));
	std::vector<ReceivedFile> received = receiver.getFiles();
	ASSERT_EQ(received.size(), 7u);
	for (size_t i = 0; i < received.size(); i++) {
		EXPECT_EQ(received[i].status, FileStatus::COMPLETED) << "file " << i;
		EXPECT_EQ(sinks.bytes(i), files.contents[i]) << "file " << i;
		EXPECT_TRUE(sinks.finalized(i)) << "file " << i;
	}
	EXPECT_EQ(receiver.totalReceivedBytes(), 1 + 13 * FRAME + 200 * 1024);

	EXPECT_TRUE(waitFor([&]() { return log.saw(PeerStatus::COMPLETED); }));
	EXPECT_TRUE(waitFor([&]() { return manager.getState() == SenderState::PEER_CONNECTED; }));
	EXPECT_EQ(manager.connectionCount(), 1u);
	EXPECT_EQ(manager.activeTransferCount(), 0u);

	receiver.disconnect();
	EXPECT_TRUE(waitFor([&]() { return log.saw(PeerStatus::DISCONNECTED); }));
	EXPECT_TRUE(waitFor([&]() { return manager.getState() == SenderState::AWAITING_PEER; }));
}

TEST(TransferSessionTest, ReceiverWaitsForUserAcceptance) {
	TransferConfig config = testConfig();
	config.auto_accept = false;
	InProcessRendezvous rendezvous;
	SharedFiles files = makeShare({5000});

	PeerFanoutManager manager(config, rendezvous);
	ASSERT_TRUE(manager.configure(files.entries, files.sources));
	ASSERT_TRUE(manager.startSharing("room"));

	std::atomic<int> offers{0};
	SinkCollector sinks;
	TransferReceiver receiver(config, sinks.factory());
	receiver.setManifestCallback([&](const FileManifest& manifest, bool resumable) {
		if (manifest.files.size() == 1 && !resumable) offers++;
	});
	EXPECT_FALSE(receiver.accept());

	ASSERT_TRUE(receiver.connect(rendezvous, "room", "rx"));
	ASSERT_TRUE(waitFor([&]() { return receiver.getState() == ReceiverState::READY_TO_ACCEPT; }));
	EXPECT_EQ(offers.load(), 1);
	EXPECT_EQ(receiver.getManifest().total_size, 5000u);
	EXPECT_EQ(sinks.createdCount(), 0);
	EXPECT_TRUE(waitFor([&]() { return manager.getState() == SenderState::PEER_CONNECTED; }));

	ASSERT_TRUE(receiver.accept());
	ASSERT_TRUE(waitFor([&]() { return receiver.getState() == ReceiverState::COMPLETE; }));
	EXPECT_EQ(sinks.bytes(0), files.contents[0]);
}

TEST(TransferSessionTest, ReceiverResumesFromLastWholeFrame) {
	TransferConfig config = testConfig();
	InProcessRendezvous rendezvous;
	SharedFiles files = makeShare({200 * 1024});

	PeerFanoutManager manager(config, rendezvous);
	ASSERT_TRUE(manager.configure(files.entries, files.sources));
	ASSERT_TRUE(manager.startSharing("room"));

	SinkCollector resumed_sinks;
	SinkCollector steady_sinks;
	std::atomic<bool> dropped{false};
	std::atomic<int> resumable_offers{0};
	TransferReceiver resumed(config, resumed_sinks.factory());
	TransferReceiver steady(config, steady_sinks.factory());

	// Drop the link right after the second frame landed
	resumed.setProgressCallback([&](size_t, uint64_t received, uint64_t) {
		if (received >= 2 * FRAME && !dropped.exchange(true)) {
			resumed.disconnect();
		}
	});
	resumed.setManifestCallback([&](const FileManifest&, bool resumable) {
		if (resumable) resumable_offers++;
	});

	ASSERT_TRUE(steady.connect(rendezvous, "room", "steady"));
	ASSERT_TRUE(resumed.connect(rendezvous, "room", "resumed"));

	ASSERT_TRUE(waitFor([&]() { return resumed.getState() == ReceiverState::PAUSED; }));
	EXPECT_EQ(resumed.getLastError(), TransferError::CHANNEL_CLOSED);
	EXPECT_EQ(resumed.totalReceivedBytes(), 2 * FRAME);

	ResumePayload point;
	ASSERT_TRUE(resumed.getResumePoint(point));
	EXPECT_EQ(point.file_index, 0u);
	EXPECT_EQ(point.chunk_index, 2u);

	ASSERT_TRUE(resumed.connect(rendezvous, "room", "resumed"));
	ASSERT_TRUE(waitFor([&]() { return resumed.getState() == ReceiverState::COMPLETE; }));
	ASSERT_TRUE(waitFor([&]() { return steady.getState() == ReceiverState::COMPLETE; }));

	EXPECT_EQ(resumable_offers.load(), 1);
	// The partial output was kept and continued, not recreated
	EXPECT_EQ(resumed_sinks.createdCount(), 1);
	EXPECT_EQ(resumed_sinks.bytes(0), files.contents[0]);
	EXPECT_TRUE(resumed_sinks.finalized(0));
	EXPECT_EQ(steady_sinks.bytes(0), files.contents[0]);
}

TEST(TransferSessionTest, ResumeAtTheEndOfAFileStillFinishesIt) {
	TransferConfig config = testConfig();
	InProcessRendezvous rendezvous;
	SharedFiles files = makeShare({static_cast<size_t>(FRAME), static_cast<size_t>(FRAME)});

	PeerFanoutManager manager(config, rendezvous);
	ASSERT_TRUE(manager.configure(files.entries, files.sources));
	ASSERT_TRUE(manager.startSharing("room"));

	SinkCollector sinks;
	std::atomic<bool> dropped{false};
	TransferReceiver receiver(config, sinks.factory());

	// Drop after the last frame of the first file but before its FILE_COMPLETE
	receiver.setProgressCallback([&](size_t index, uint64_t received, uint64_t total) {
		if (index == 0 && received == total && !dropped.exchange(true)) {
			receiver.disconnect();
		}
	});

	ASSERT_TRUE(receiver.connect(rendezvous, "room", "rx"));
	ASSERT_TRUE(waitFor([&]() { return receiver.getState() == ReceiverState::PAUSED; }));

	ResumePayload point;
	ASSERT_TRUE(receiver.getResumePoint(point));
	EXPECT_EQ(point.file_index, 0u);
	EXPECT_EQ(point.chunk_index, 1u);

	ASSERT_TRUE(receiver.connect(rendezvous, "room", "rx"));
	ASSERT_TRUE(waitFor([&]() { return receiver.getState() == ReceiverState::COMPLETE; }));

	std::vector<ReceivedFile> received = receiver.getFiles();
	ASSERT_EQ(received.size(), 2u);
	for (size_t i = 0; i < received.size(); i++) {
		EXPECT_EQ(received[i].status, FileStatus::COMPLETED) << "file " << i;
		EXPECT_EQ(sinks.bytes(i), files.contents[i]) << "file " << i;
		EXPECT_TRUE(sinks.finalized(i)) << "file " << i;
	}
}

TEST(TransferSessionTest, SlowPeerDoesNotHoldUpFastPeer) {
	TransferConfig config = testConfig();
	InProcessRendezvous rendezvous;
	SharedFiles files = makeShare({512 * 1024});

	std::mutex stats_mutex;
	double best_progress = 0.0;
	PeerFanoutManager manager(config, rendezvous);
	manager.setStatsCallback([&](const SharingStats& stats) {
		std::lock_guard<std::mutex> lock(stats_mutex);
		best_progress = std::max(best_progress, stats.progress);
	});
	ASSERT_TRUE(manager.configure(files.entries, files.sources));
	ASSERT_TRUE(manager.startSharing("room"));

	SinkCollector slow_sinks;
	SinkCollector fast_sinks;
	TransferReceiver slow(config, slow_sinks.factory());
	TransferReceiver fast(config, fast_sinks.factory());

	MemoryChannelOptions slow_link;
	slow_link.drain_bytes_per_second = 512 * 1024;
	rendezvous.setConnectionOptions(slow_link);
	ASSERT_TRUE(slow.connect(rendezvous, "room", "slow"));

	rendezvous.setConnectionOptions(MemoryChannelOptions());
	ASSERT_TRUE(fast.connect(rendezvous, "room", "fast"));

	ASSERT_TRUE(waitFor([&]() { return fast.getState() == ReceiverState::COMPLETE; }));
	EXPECT_NE(slow.getState(), ReceiverState::COMPLETE);
	EXPECT_EQ(fast_sinks.bytes(0), files.contents[0]);

	ASSERT_TRUE(waitFor([&]() { return slow.getState() == ReceiverState::COMPLETE; }, 15000));
	EXPECT_EQ(slow_sinks.bytes(0), files.contents[0]);
	EXPECT_TRUE(waitFor([&]() { return manager.getState() == SenderState::PEER_CONNECTED; }));
	EXPECT_EQ(manager.connectionCount(), 2u);

	std::lock_guard<std::mutex> lock(stats_mutex);
	EXPECT_GT(best_progress, 0.0);
	EXPECT_LE(best_progress, 1.0);
}

TEST(TransferSessionTest, StopSharingCancelsEveryReceiver) {
	TransferConfig config = testConfig();
	InProcessRendezvous rendezvous;
	SharedFiles files = makeShare({1024 * 1024});

	PeerFanoutManager manager(config, rendezvous);
	ASSERT_TRUE(manager.configure(files.entries, files.sources));
	ASSERT_TRUE(manager.startSharing("room"));

	MemoryChannelOptions slow_link;
	slow_link.drain_bytes_per_second = 256 * 1024;
	rendezvous.setConnectionOptions(slow_link);

	SinkCollector first_sinks;
	SinkCollector second_sinks;
	TransferReceiver first(config, first_sinks.factory());
	TransferReceiver second(config, second_sinks.factory());
	ASSERT_TRUE(first.connect(rendezvous, "room", "first"));
	ASSERT_TRUE(second.connect(rendezvous, "room", "second"));

	ASSERT_TRUE(waitFor([&]() { return first.totalReceivedBytes() > 0 && second.totalReceivedBytes() > 0; }));
	EXPECT_EQ(manager.getState(), SenderState::TRANSFERRING);
	uint64_t epoch = manager.getEpoch();

	manager.stopSharing();
	EXPECT_EQ(manager.getState(), SenderState::IDLE);
	EXPECT_EQ(manager.getEpoch(), epoch + 1);
	EXPECT_EQ(manager.activeTransferCount(), 0u);
	EXPECT_EQ(manager.connectionCount(), 0u);
	EXPECT_FALSE(rendezvous.isRegistered("room"));

	for (TransferReceiver* receiver : {&first, &second}) {
		ASSERT_TRUE(waitFor([&]() { return receiver->getState() == ReceiverState::ERROR; }));
		EXPECT_EQ(receiver->getLastError(), TransferError::CANCELLED);
		EXPECT_EQ(receiver->getErrorMessage(), "sender stopped sharing");
		EXPECT_LT(receiver->totalReceivedBytes(), 1024u * 1024);
		EXPECT_EQ(receiver->getFiles()[0].status, FileStatus::FAILED);
	}
}

TEST(TransferSessionTest, ExpiredShareRejectsNewPeers) {
	TransferConfig config = testConfig();
	config.countdown_interval_ms = 60000;   // keep the share up past its expiry
	InProcessRendezvous rendezvous;
	SharedFiles files = makeShare({1000});
	PeerLog log;

	TransferConstraints constraints;
	constraints.has_expiry = true;
	constraints.expires_at_ms = currentTimeMillis() + 100;

	PeerFanoutManager manager(config, rendezvous);
	manager.setPeerCallback(log.callback());
	ASSERT_TRUE(manager.configure(files.entries, files.sources, constraints));
	ASSERT_TRUE(manager.startSharing("room"));

	std::this_thread::sleep_for(std::chrono::milliseconds(250));

	SinkCollector sinks;
	TransferReceiver receiver(config, sinks.factory());
	ASSERT_TRUE(receiver.connect(rendezvous, "room", "late"));

	ASSERT_TRUE(waitFor([&]() { return receiver.getState() == ReceiverState::ERROR; }));
	EXPECT_EQ(receiver.getLastError(), TransferError::EXPIRED_SESSION);
	EXPECT_EQ(receiver.getErrorMessage(), "This share has expired");
	EXPECT_EQ(sinks.createdCount(), 0);
	EXPECT_TRUE(waitFor([&]() { return log.saw(PeerStatus::REJECTED); }));
	EXPECT_EQ(manager.connectionCount(), 0u);
}

TEST(TransferSessionTest, ExpiryTearsTheShareDown) {
	TransferConfig config = testConfig();
	config.auto_accept = false;
	InProcessRendezvous rendezvous;
	SharedFiles files = makeShare({1000});

	TransferConstraints constraints;
	constraints.has_expiry = true;
	constraints.expires_at_ms = currentTimeMillis() + 300;

	std::mutex countdown_mutex;
	std::vector<int64_t> countdown;
	PeerFanoutManager manager(config, rendezvous);
	manager.setCountdownCallback([&](int64_t remaining) {
		std::lock_guard<std::mutex> lock(countdown_mutex);
		countdown.push_back(remaining);
	});
	ASSERT_TRUE(manager.configure(files.entries, files.sources, constraints));
	ASSERT_TRUE(manager.startSharing("room"));

	SinkCollector sinks;
	TransferReceiver receiver(config, sinks.factory());
	ASSERT_TRUE(receiver.connect(rendezvous, "room", "rx"));
	ASSERT_TRUE(waitFor([&]() { return receiver.getState() == ReceiverState::READY_TO_ACCEPT; }));

	ASSERT_TRUE(waitFor([&]() { return manager.getState() == SenderState::ERROR; }));
	EXPECT_EQ(manager.getLastError(), TransferError::EXPIRED_SESSION);
	EXPECT_FALSE(rendezvous.isRegistered("room"));

	ASSERT_TRUE(waitFor([&]() { return receiver.getState() == ReceiverState::ERROR; }));
	EXPECT_EQ(receiver.getLastError(), TransferError::CANCELLED);

	std::lock_guard<std::mutex> lock(countdown_mutex);
	ASSERT_FALSE(countdown.empty());
	EXPECT_LE(countdown.front(), 1);
	EXPECT_EQ(countdown.back(), 0);
}

TEST(TransferSessionTest, AlreadyExpiredShareNeverStarts) {
	InProcessRendezvous rendezvous;
	SharedFiles files = makeShare({10});
	TransferConstraints constraints;
	constraints.has_expiry = true;
	constraints.expires_at_ms = currentTimeMillis() - 1000;

	PeerFanoutManager manager(testConfig(), rendezvous);
	ASSERT_TRUE(manager.configure(files.entries, files.sources, constraints));
	EXPECT_FALSE(manager.startSharing("room"));
	EXPECT_EQ(manager.getState(), SenderState::ERROR);
	EXPECT_EQ(manager.getLastError(), TransferError::EXPIRED_SESSION);
	EXPECT_FALSE(rendezvous.isRegistered("room"));
}

TEST(TransferSessionTest, TakenCodeGoesBackToConfiguring) {
	InProcessRendezvous rendezvous;
	SharedFiles files = makeShare({10});

	PeerFanoutManager first(testConfig(), rendezvous);
	PeerFanoutManager second(testConfig(), rendezvous);
	ASSERT_TRUE(first.configure(files.entries, files.sources));
	ASSERT_TRUE(second.configure(files.entries, files.sources));
	ASSERT_TRUE(first.startSharing("room"));

	EXPECT_FALSE(second.startSharing("room"));
	EXPECT_EQ(second.getState(), SenderState::CONFIGURING);
	EXPECT_EQ(second.getLastError(), TransferError::IDENTITY_CONFLICT);
	EXPECT_EQ(second.getErrorMessage(), "code already in use");

	EXPECT_TRUE(second.startSharing("other-room"));
	EXPECT_EQ(second.getCode(), "other-room");
}

TEST(TransferSessionTest, FilesCannotChangeWhileSharing) {
	InProcessRendezvous rendezvous;
	SharedFiles files = makeShare({10, 20});

	PeerFanoutManager manager(testConfig(), rendezvous);
	std::vector<std::shared_ptr<ByteSource>> too_few = {files.sources[0]};
	EXPECT_FALSE(manager.configure(files.entries, too_few));
	EXPECT_FALSE(manager.startSharing("room"));

	ASSERT_TRUE(manager.configure(files.entries, files.sources));
	ASSERT_TRUE(manager.startSharing("room"));
	EXPECT_FALSE(manager.configure(files.entries, files.sources));

	manager.stopSharing();
	EXPECT_EQ(manager.getState(), SenderState::IDLE);
	EXPECT_FALSE(rendezvous.isRegistered("room"));
}

TEST(TransferSessionTest, HugeResumeChunkStartsAtTheEndOfTheFile) {
	TransferConfig config = testConfig();
	InProcessRendezvous rendezvous;
	SharedFiles files = makeShare({3 * static_cast<size_t>(FRAME) + 5, 10});

	PeerFanoutManager manager(config, rendezvous);
	ASSERT_TRUE(manager.configure(files.entries, files.sources));
	ASSERT_TRUE(manager.startSharing("room"));

	// Filled from channel callbacks, so declared before the channel
	std::mutex record_mutex;
	std::vector<MessageType> types;
	uint64_t frame_bytes = 0;

	std::shared_ptr<Channel> raw = rendezvous.connect("room", "raw");
	ASSERT_TRUE(raw != nullptr);
	raw->setMessageCallback([&](const TransferMessage& message) {
		std::lock_guard<std::mutex> lock(record_mutex);
		types.push_back(message.type);
	});
	raw->setFrameCallback([&](const std::vector<char>& frame) {
		std::lock_guard<std::mutex> lock(record_mutex);
		frame_bytes += frame.size();
	});
	raw->open();

	auto received = [&](MessageType type) {
		std::lock_guard<std::mutex> lock(record_mutex);
		return std::find(types.begin(), types.end(), type) != types.end();
	};
	ASSERT_TRUE(waitFor([&]() { return received(MessageType::METADATA); }));

	// 2^50 frames of 64 KiB wrap a 64-bit byte offset back to zero
	ResumePayload resume;
	resume.file_index = 0;
	resume.chunk_index = 1ULL << 50;
	ASSERT_TRUE(raw->send(makeMessage(MessageType::RESUME_REQUEST, resume)));

	ASSERT_TRUE(waitFor([&]() { return received(MessageType::ALL_FILES_COMPLETE); }));
	{
		std::lock_guard<std::mutex> lock(record_mutex);
		// Only the second file is sent
		EXPECT_EQ(frame_bytes, 10u);
	}

	raw->clearCallbacks();
	raw->close();
}

TEST(TransferSessionTest, DepartedPeersAreReleased) {
	TransferConfig config = testConfig();
	InProcessRendezvous rendezvous;
	SharedFiles files = makeShare({1000});

	PeerFanoutManager manager(config, rendezvous);
	ASSERT_TRUE(manager.configure(files.entries, files.sources));
	ASSERT_TRUE(manager.startSharing("room"));

	for (int i = 0; i < 10; i++) {
		SinkCollector sinks;
		TransferReceiver receiver(config, sinks.factory());
		ASSERT_TRUE(receiver.connect(rendezvous, "room", "rx" + std::to_string(i)));
		ASSERT_TRUE(waitFor([&]() { return receiver.getState() == ReceiverState::COMPLETE; }));
		receiver.disconnect();
		ASSERT_TRUE(waitFor([&]() { return manager.connectionCount() == 0; }));
	}

	EXPECT_TRUE(waitFor([&]() { return manager.retiredCount() == 0; }));
	EXPECT_EQ(manager.getState(), SenderState::AWAITING_PEER);
}

/**
 * A receiver attached to a hand-driven sender end
 */
class ReceiverProtocolTest : public ::testing::Test {
protected:
	void SetUp() override {
		config = testConfig();
		config.frame_size = 8;
		receiver.reset(new TransferReceiver(config, sinks.factory()));

		pair = MemoryChannel::createPair("rx", "tx");
		pair.first->setMessageCallback([this](const TransferMessage& message) {
			std::lock_guard<std::mutex> lock(mutex);
			replies.push_back(message.type);
		});
		pair.first->open();
		ASSERT_TRUE(receiver->attach(pair.second));
	}

	void TearDown() override {
		receiver.reset();
		pair.first->clearCallbacks();
	}

	void offer(const std::vector<uint64_t>& sizes) {
		std::vector<FileEntry> entries;
		for (size_t i = 0; i < sizes.size(); i++) {
			FileEntry entry;
			entry.name = "f" + std::to_string(i);
			entry.size = sizes[i];
			entries.push_back(entry);
		}
		ASSERT_TRUE(pair.first->send(makeMessage(MessageType::METADATA, FileManifest::build(entries, TransferConstraints()))));
		ASSERT_TRUE(waitFor([this]() { return receiver->getState() == ReceiverState::RECEIVING; }));
	}

	void fileStart(uint64_t index, uint64_t size) {
		FileStartPayload start;
		start.file_index = index;
		start.file_name = "f" + std::to_string(index);
		start.file_size = size;
		ASSERT_TRUE(pair.first->send(makeMessage(MessageType::FILE_START, start)));
	}

	void frame(const std::string& bytes) {
		ASSERT_TRUE(pair.first->sendFrame(bytes.data(), bytes.size()));
	}

	void fileComplete(uint64_t index) {
		ASSERT_TRUE(pair.first->send(makeMessage(MessageType::FILE_COMPLETE, json{{"fileIndex", index}})));
	}

	void allComplete() {
		ASSERT_TRUE(pair.first->send(makeMessage(MessageType::ALL_FILES_COMPLETE)));
		ASSERT_TRUE(waitFor([this]() { return receiver->getState() == ReceiverState::COMPLETE; }));
	}

	std::string contents(size_t index) {
		std::vector<char> bytes = sinks.bytes(index);
		return std::string(bytes.begin(), bytes.end());
	}

	TransferConfig config;
	SinkCollector sinks;
	std::unique_ptr<TransferReceiver> receiver;
	std::pair<std::shared_ptr<MemoryChannel>, std::shared_ptr<MemoryChannel>> pair;
	std::mutex mutex;
	std::vector<MessageType> replies;
};

TEST_F(ReceiverProtocolTest, AcceptsAutomaticallyWhenConfigured) {
	offer({4});
	ASSERT_TRUE(waitFor([this]() { std::lock_guard<std::mutex> lock(mutex); return !replies.empty(); }));
	std::lock_guard<std::mutex> lock(mutex);
	EXPECT_EQ(replies.front(), MessageType::ACCEPT_TRANSFER);
}

TEST_F(ReceiverProtocolTest, OverrunFailsOnlyThatFile) {
	offer({10, 10});

	fileStart(0, 10);
	frame("12345678");
	frame("9abcdefg");          // 16 bytes for a 10 byte file
	frame("hi");
	fileComplete(0);

	fileStart(1, 10);
	frame("ABCDEFGH");
	frame("IJ");
	fileComplete(1);
	allComplete();

	std::vector<ReceivedFile> files = receiver->getFiles();
	EXPECT_EQ(files[0].status, FileStatus::FAILED);
	EXPECT_EQ(files[0].error, TransferError::PROTOCOL_VIOLATION);
	EXPECT_EQ(files[1].status, FileStatus::COMPLETED);
	EXPECT_EQ(contents(1), "ABCDEFGHIJ");
	EXPECT_TRUE(sinks.finalized(1));
}

TEST_F(ReceiverProtocolTest, SizeMismatchFailsTheAnnouncedFile) {
	offer({10, 3});

	fileStart(0, 11);
	frame("12345678");
	fileComplete(0);

	fileStart(1, 3);
	frame("xyz");
	fileComplete(1);
	allComplete();

	std::vector<ReceivedFile> files = receiver->getFiles();
	EXPECT_EQ(files[0].status, FileStatus::FAILED);
	EXPECT_EQ(files[0].error, TransferError::PROTOCOL_VIOLATION);
	EXPECT_EQ(files[0].received_bytes, 0u);
	EXPECT_EQ(files[1].status, FileStatus::COMPLETED);
	EXPECT_EQ(contents(1), "xyz");
}

TEST_F(ReceiverProtocolTest, EarlyCompletionIsAViolation) {
	offer({10, 2});

	fileStart(0, 10);
	frame("1234");
	fileComplete(0);

	fileStart(1, 2);
	frame("ok");
	fileComplete(1);
	allComplete();

	std::vector<ReceivedFile> files = receiver->getFiles();
	EXPECT_EQ(files[0].status, FileStatus::FAILED);
	EXPECT_EQ(files[1].status, FileStatus::COMPLETED);
}

TEST_F(ReceiverProtocolTest, FramesWithoutFileAreDropped) {
	offer({4});

	frame("lost");
	fileStart(0, 4);
	frame("good");
	fileComplete(0);
	allComplete();

	EXPECT_EQ(receiver->getFiles()[0].status, FileStatus::COMPLETED);
	EXPECT_EQ(contents(0), "good");
}

TEST_F(ReceiverProtocolTest, EmptyFileCompletesWithoutFrames) {
	offer({0, 1});

	fileStart(0, 0);
	fileComplete(0);
	fileStart(1, 1);
	frame("z");
	fileComplete(1);
	allComplete();

	std::vector<ReceivedFile> files = receiver->getFiles();
	EXPECT_EQ(files[0].status, FileStatus::COMPLETED);
	EXPECT_TRUE(sinks.finalized(0));
	EXPECT_EQ(contents(1), "z");
}

TEST_F(ReceiverProtocolTest, UnfinishedFileFailsAtTheEnd) {
	offer({10});

	fileStart(0, 10);
	frame("12345");
	allComplete();

	EXPECT_EQ(receiver->getFiles()[0].status, FileStatus::FAILED);
}

TEST_F(ReceiverProtocolTest, CloseBeforeMetadataIsAnError) {
	TransferReceiver waiting(config, sinks.factory());
	auto other = MemoryChannel::createPair("a", "b");
	ASSERT_TRUE(waiting.attach(other.second));
	EXPECT_EQ(waiting.getState(), ReceiverState::AWAITING_METADATA);

	other.first->close();
	ASSERT_TRUE(waitFor([&]() { return waiting.getState() == ReceiverState::ERROR; }));
	EXPECT_EQ(waiting.getLastError(), TransferError::CHANNEL_CLOSED);
}

TEST_F(ReceiverProtocolTest, ResetForgetsPartialOutput) {
	offer({16});
	fileStart(0, 16);
	frame("12345678");
	ASSERT_TRUE(waitFor([this]() { return receiver->totalReceivedBytes() == 8; }));

	receiver->reset();
	EXPECT_EQ(receiver->getState(), ReceiverState::IDLE);
	EXPECT_TRUE(receiver->getFiles().empty());
	ResumePayload point;
	EXPECT_FALSE(receiver->getResumePoint(point));
	EXPECT_TRUE(contents(0).empty());
}
