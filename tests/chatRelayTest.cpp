#include <gtest/gtest.h>
#include <algorithm>
#include <mutex>
#include "chatRelay.hpp"
#include "memoryChannel.hpp"
#include "testUtils.hpp"

using json = nlohmann::json;

static ChatConfig testChatConfig() {
	ChatConfig config;
	config.reconnect_delay_ms = 20;
	config.host_retry_delay_ms = 20;
	config.pause_ms = 1;
	return config;
}

static size_t countContent(const ChatRelay& relay, const std::string& content) {
	size_t count = 0;
	for (const auto& message : relay.getMessages()) {
		if (message.content == content) count++;
	}
	return count;
}

static bool hasContentStartingWith(const ChatRelay& relay, const std::string& prefix) {
	for (const auto& message : relay.getMessages()) {
		if (message.content.compare(0, prefix.size(), prefix) == 0) return true;
	}
	return false;
}

TEST(RelayTargetsTest, HostForwardsToEveryoneButTheOrigin) {
	std::vector<std::string> connections = {"a", "b", "c"};
	EXPECT_EQ(relayTargets(ChatRole::HOST, "b", connections), std::vector<std::string>({"a", "c"}));
	EXPECT_EQ(relayTargets(ChatRole::HOST, "", connections), connections);
	EXPECT_TRUE(relayTargets(ChatRole::HOST, "a", {"a"}).empty());
}

TEST(RelayTargetsTest, GuestOnlySendsItsOwnMessages) {
	std::vector<std::string> connections = {"host"};
	EXPECT_EQ(relayTargets(ChatRole::GUEST, "", connections), connections);
	EXPECT_TRUE(relayTargets(ChatRole::GUEST, "host", connections).empty());
}

class ChatRelayTest : public ::testing::Test {
protected:
	ChatRelayTest()
		: config(testChatConfig()),
		  host(config, rendezvous, "host"),
		  alice(config, rendezvous, "alice"),
		  bob(config, rendezvous, "bob") {
	}

	void SetUp() override {
		ASSERT_TRUE(host.hostRoom("room"));
		ASSERT_TRUE(alice.joinRoom("room"));
		ASSERT_TRUE(waitFor([this]() { return host.onlineCount() == 2 && alice.getState() == ChatState::CHATTING; }));
		ASSERT_TRUE(bob.joinRoom("room"));
		ASSERT_TRUE(waitFor([this]() { return host.onlineCount() == 3 && bob.getState() == ChatState::CHATTING; }));
	}

	ChatConfig config;
	InProcessRendezvous rendezvous;

	// Filled from relay callbacks, so declared before the relays
	std::mutex record_mutex;
	std::vector<std::string> seen;
	std::vector<ChatState> states;

	ChatRelay host;
	ChatRelay alice;
	ChatRelay bob;
};

TEST_F(ChatRelayTest, RoomStartsWithPresenceMessages) {
	EXPECT_EQ(host.getRole(), ChatRole::HOST);
	EXPECT_EQ(alice.getRole(), ChatRole::GUEST);
	EXPECT_EQ(countContent(host, "room created, code: room"), 1u);
	EXPECT_EQ(countContent(alice, "joined the room"), 1u);
	EXPECT_TRUE(hasContentStartingWith(host, "member joined (alice"));

	// Alice was already in the room when Bob came in
	ASSERT_TRUE(waitFor([this]() { return hasContentStartingWith(alice, "member joined (bob"); }));
	EXPECT_FALSE(hasContentStartingWith(bob, "member joined (alice"));

	for (const auto& message : host.getMessages()) {
		EXPECT_TRUE(message.is_system);
		EXPECT_EQ(message.sender_id, "system");
	}
}

TEST_F(ChatRelayTest, GuestMessageReachesEveryoneOnce) {
	ASSERT_TRUE(alice.sendText("hello room"));
	ASSERT_TRUE(waitFor([this]() { return countContent(bob, "hello room") == 1 && countContent(host, "hello room") == 1; }));

	ASSERT_TRUE(bob.sendText("hi alice"));
	ASSERT_TRUE(waitFor([this]() { return countContent(alice, "hi alice") == 1; }));
	std::this_thread::sleep_for(std::chrono::milliseconds(50));

	EXPECT_EQ(countContent(alice, "hello room"), 1u);
	EXPECT_EQ(countContent(bob, "hello room"), 1u);
	EXPECT_EQ(countContent(host, "hello room"), 1u);
	EXPECT_EQ(alice.duplicateCount(), 0u);
	EXPECT_EQ(bob.duplicateCount(), 0u);

	for (const auto& message : bob.getMessages()) {
		if (message.content == "hello room") {
			EXPECT_EQ(message.sender_id, "alice");
			EXPECT_FALSE(message.id.empty());
			EXPECT_GT(message.timestamp, 0);
		}
	}
}

TEST_F(ChatRelayTest, HostMessageReachesAllGuests) {
	bob.setMessageCallback([this](const ChatMessage& message) {
		std::lock_guard<std::mutex> lock(record_mutex);
		seen.push_back(message.content);
	});

	ASSERT_TRUE(host.sendText("welcome"));
	ASSERT_TRUE(waitFor([this]() { return countContent(alice, "welcome") == 1 && countContent(bob, "welcome") == 1; }));
	EXPECT_EQ(countContent(host, "welcome"), 1u);

	std::lock_guard<std::mutex> lock(record_mutex);
	EXPECT_EQ(std::count(seen.begin(), seen.end(), "welcome"), 1);
}

TEST_F(ChatRelayTest, LargeMessageIsChunkedAndReassembled) {
	ChatConfig small = testChatConfig();
	small.fragment_size = 256;
	ChatRelay carol(small, rendezvous, "carol");
	ASSERT_TRUE(carol.joinRoom("room"));
	ASSERT_TRUE(waitFor([&]() { return carol.getState() == ChatState::CHATTING && host.onlineCount() == 4; }));

	std::string text;
	for (int i = 0; i < 300; i++) {
		text += "line " + std::to_string(i) + " \xE2\x82\xAC ";
	}
	ASSERT_TRUE(carol.sendText(text));

	ASSERT_TRUE(waitFor([&]() {
		return countContent(host, text) == 1 && countContent(alice, text) == 1 && countContent(bob, text) == 1;
	}));
	std::this_thread::sleep_for(std::chrono::milliseconds(50));
	EXPECT_EQ(countContent(carol, text), 1u);
	EXPECT_EQ(carol.duplicateCount(), 0u);

	carol.leaveRoom();
}

TEST_F(ChatRelayTest, RepeatedMessageIsAppliedOnce) {
	std::shared_ptr<Channel> raw = rendezvous.connect("room", "raw");
	ASSERT_TRUE(raw != nullptr);
	raw->open();
	ASSERT_TRUE(waitFor([this]() { return host.onlineCount() == 4; }));

	ChatMessage message;
	message.id = "fixed-id";
	message.sender_id = "raw";
	message.content = "only once";
	message.timestamp = 1;
	TransferMessage wire = makeMessage(MessageType::CHAT_MESSAGE, message);
	ASSERT_TRUE(raw->send(wire));
	ASSERT_TRUE(raw->send(wire));

	ASSERT_TRUE(waitFor([this]() { return host.duplicateCount() == 1; }));
	ASSERT_TRUE(waitFor([this]() { return countContent(bob, "only once") == 1; }));
	EXPECT_EQ(countContent(host, "only once"), 1u);
	EXPECT_EQ(bob.duplicateCount(), 0u);

	raw->clearCallbacks();
	raw->close();
}

TEST_F(ChatRelayTest, UnknownMessageTypeIsDropped) {
	std::shared_ptr<Channel> raw = rendezvous.connect("room", "raw");
	ASSERT_TRUE(raw != nullptr);
	raw->open();
	ASSERT_TRUE(waitFor([this]() { return host.onlineCount() == 4; }));

	json bad = {{"id", "bad-1"}, {"senderId", "raw"}, {"type", "video"}, {"content", "unplayable"}, {"timestamp", 1}};
	ASSERT_TRUE(raw->send(makeMessage(MessageType::CHAT_MESSAGE, bad)));

	// The same thing split into fragments, so it only fails once reassembled
	bad["id"] = "bad-2";
	bad["content"] = std::string(300, 'x');
	MessageChunker chunker(64);
	for (const auto& fragment : chunker.split("bad-2", bad.dump())) {
		ASSERT_TRUE(raw->send(makeMessage(MessageType::CHAT_MESSAGE_CHUNK, fragment)));
	}

	ChatMessage good;
	good.id = "good-1";
	good.sender_id = "raw";
	good.content = "still talking";
	good.timestamp = 2;
	ASSERT_TRUE(raw->send(makeMessage(MessageType::CHAT_MESSAGE, good)));

	ASSERT_TRUE(waitFor([this]() { return countContent(bob, "still talking") == 1; }));
	EXPECT_EQ(countContent(host, "still talking"), 1u);
	EXPECT_EQ(countContent(host, "unplayable"), 0u);
	EXPECT_EQ(host.getState(), ChatState::CHATTING);
	EXPECT_EQ(host.onlineCount(), 4u);

	raw->clearCallbacks();
	raw->close();
}

TEST_F(ChatRelayTest, LeavingGuestIsAnnounced) {
	bob.leaveRoom();
	EXPECT_EQ(bob.getState(), ChatState::IDLE);
	EXPECT_TRUE(bob.getMessages().empty());

	ASSERT_TRUE(waitFor([this]() { return host.onlineCount() == 2; }));
	ASSERT_TRUE(waitFor([this]() { return hasContentStartingWith(alice, "member left (bob"); }));
	EXPECT_FALSE(bob.sendText("too late"));
}

TEST_F(ChatRelayTest, GuestReconnectsAfterLinkDrop) {
	ASSERT_TRUE(waitFor([this]() { return hasContentStartingWith(alice, "member joined (bob"); }));

	alice.setStateCallback([this](ChatState state, const std::string&) {
		std::lock_guard<std::mutex> lock(record_mutex);
		states.push_back(state);
	});

	rendezvous.dropAllConnections();

	ASSERT_TRUE(waitFor([this]() { return countContent(alice, "joined the room") == 2; }));
	ASSERT_TRUE(waitFor([this]() { return alice.getState() == ChatState::CHATTING && host.onlineCount() == 3; }));
	EXPECT_EQ(countContent(alice, "connection lost, reconnecting"), 1u);
	{
		std::lock_guard<std::mutex> lock(record_mutex);
		ASSERT_GE(states.size(), 2u);
		EXPECT_EQ(states.front(), ChatState::RECONNECTING);
		EXPECT_EQ(states.back(), ChatState::CHATTING);
	}

	ASSERT_TRUE(alice.sendText("back again"));
	ASSERT_TRUE(waitFor([this]() { return countContent(bob, "back again") == 1; }));
}

TEST_F(ChatRelayTest, RestoredHostBringsGuestsBack) {
	host.leaveRoom();
	EXPECT_FALSE(rendezvous.isRegistered("room"));
	ASSERT_TRUE(waitFor([this]() { return alice.getState() == ChatState::RECONNECTING; }));

	ChatRelay restored(config, rendezvous, "host");
	ASSERT_TRUE(restored.hostRoom("room", true));
	EXPECT_EQ(countContent(restored, "chat session restored"), 1u);

	ASSERT_TRUE(waitFor([&]() { return restored.onlineCount() == 3; }));
	ASSERT_TRUE(waitFor([this]() {
		return alice.getState() == ChatState::CHATTING && bob.getState() == ChatState::CHATTING;
	}));

	ASSERT_TRUE(alice.sendText("still here"));
	ASSERT_TRUE(waitFor([this]() { return countContent(bob, "still here") == 1; }));
}

TEST(ChatRelayHostingTest, TakenCodeFailsRightAway) {
	InProcessRendezvous rendezvous;
	ChatRelay first(testChatConfig(), rendezvous, "first");
	ChatRelay second(testChatConfig(), rendezvous, "second");
	ASSERT_TRUE(first.hostRoom("room"));

	EXPECT_FALSE(second.hostRoom("room"));
	EXPECT_EQ(second.getState(), ChatState::ERROR);
	EXPECT_EQ(second.getLastError(), TransferError::IDENTITY_CONFLICT);
	EXPECT_EQ(second.getErrorMessage(), "room code already in use");

	// A failed attempt does not hold on to the room
	EXPECT_TRUE(second.hostRoom("other"));
}

TEST(ChatRelayHostingTest, RestoringRetriesUntilTheCodeFrees) {
	InProcessRendezvous rendezvous;
	ChatRelay previous(testChatConfig(), rendezvous, "previous");
	ChatRelay restored(testChatConfig(), rendezvous, "restored");
	ASSERT_TRUE(previous.hostRoom("room"));

	EXPECT_FALSE(restored.hostRoom("room", true));
	EXPECT_EQ(restored.getState(), ChatState::CONNECTING);

	previous.leaveRoom();
	ASSERT_TRUE(waitFor([&]() { return restored.getState() == ChatState::CHATTING; }));
	EXPECT_EQ(countContent(restored, "chat session restored"), 1u);
	EXPECT_TRUE(rendezvous.isRegistered("room"));
}

TEST(ChatRelayHostingTest, RestoringGivesUpAfterTheRetryLimit) {
	ChatConfig config = testChatConfig();
	config.max_host_retries = 3;
	config.host_retry_delay_ms = 5;

	InProcessRendezvous rendezvous;
	ChatRelay holder(config, rendezvous, "holder");
	ChatRelay restored(config, rendezvous, "restored");
	ASSERT_TRUE(holder.hostRoom("room"));

	EXPECT_FALSE(restored.hostRoom("room", true));
	ASSERT_TRUE(waitFor([&]() { return restored.getState() == ChatState::ERROR; }));
	EXPECT_EQ(restored.getLastError(), TransferError::IDENTITY_CONFLICT);
	EXPECT_EQ(restored.getErrorMessage(), "could not restore the room, code still in use");
	EXPECT_EQ(holder.getState(), ChatState::CHATTING);
}

TEST(ChatRelayHostingTest, JoiningAMissingRoomFails) {
	InProcessRendezvous rendezvous;
	ChatRelay guest(testChatConfig(), rendezvous, "guest");

	EXPECT_FALSE(guest.joinRoom("nowhere"));
	EXPECT_EQ(guest.getState(), ChatState::ERROR);
	EXPECT_EQ(guest.getLastError(), TransferError::CHANNEL_CLOSED);
	EXPECT_FALSE(guest.sendText("anyone?"));
}

TEST(ChatRelayHostingTest, OversizedAttachmentIsRefused) {
	ChatConfig config = testChatConfig();
	config.max_attachment_bytes = 10;

	InProcessRendezvous rendezvous;
	ChatRelay host(config, rendezvous, "host");
	ASSERT_TRUE(host.hostRoom("room"));

	ChatMessage image;
	image.type = ChatMessageType::IMAGE;
	image.has_file_data = true;
	image.file_data.name = "pic.png";
	image.file_data.mime_type = "image/png";
	image.file_data.size = 11;
	image.file_data.data = "AAAAAAAAAAAAAAAA";
	EXPECT_FALSE(host.sendMessage(image));

	image.file_data.size = 10;
	EXPECT_TRUE(host.sendMessage(image));
	EXPECT_EQ(host.getMessages().back().file_data.name, "pic.png");
}

TEST(ChatRelayHostingTest, DepartedGuestsAreReleased) {
	InProcessRendezvous rendezvous;
	ChatRelay host(testChatConfig(), rendezvous, "host");
	ASSERT_TRUE(host.hostRoom("room"));

	for (int i = 0; i < 20; i++) {
		ChatRelay guest(testChatConfig(), rendezvous, "guest" + std::to_string(i));
		ASSERT_TRUE(guest.joinRoom("room"));
		ASSERT_TRUE(waitFor([&]() { return host.onlineCount() == 2; }));
		guest.leaveRoom();
		ASSERT_TRUE(waitFor([&]() { return host.onlineCount() == 1; }));
	}

	EXPECT_TRUE(waitFor([&]() { return host.retiredCount() == 0; }));
	EXPECT_EQ(host.getState(), ChatState::CHATTING);
}

TEST(ChatRelayHostingTest, GeneratedIdsAreUnique) {
	InProcessRendezvous rendezvous;
	ChatRelay relay(testChatConfig(), rendezvous, "me");

	std::set<std::string> ids;
	for (int i = 0; i < 200; i++) {
		ids.insert(relay.generateMessageId());
	}
	EXPECT_GT(ids.size(), 190u);
}
