#include <gtest/gtest.h>
#include <algorithm>
#include <random>
#include "messageChunker.hpp"

static std::string joinFragments(const std::vector<ChunkedChatPayload>& fragments) {
	std::string all;
	for (const auto& fragment : fragments) {
		all += fragment.fragment;
	}
	return all;
}

static bool isValidUtf8Start(const std::string& text) {
	return text.empty() || (static_cast<unsigned char>(text[0]) & 0xC0) != 0x80;
}

TEST(MessageChunkerTest, SmallMessagesAreNotChunked) {
	MessageChunker chunker(64);
	EXPECT_FALSE(chunker.needsChunking(std::string(64, 'a')));
	EXPECT_TRUE(chunker.needsChunking(std::string(65, 'a')));
}

TEST(MessageChunkerTest, FragmentsAreOrderedAndBounded) {
	MessageChunker chunker(100);
	std::string text(1050, 'q');

	std::vector<ChunkedChatPayload> fragments = chunker.split("msg-1", text);
	ASSERT_EQ(fragments.size(), 11u);
	for (uint32_t i = 0; i < fragments.size(); i++) {
		EXPECT_EQ(fragments[i].message_id, "msg-1");
		EXPECT_EQ(fragments[i].index, i);
		EXPECT_EQ(fragments[i].total, 11u);
		EXPECT_LE(fragments[i].fragment.size(), 100u);
	}
	EXPECT_EQ(joinFragments(fragments), text);
}

TEST(MessageChunkerTest, CutsNeverSplitACodePoint) {
	// Three byte characters against a fragment size that is not a multiple of three
	std::string text;
	for (int i = 0; i < 200; i++) {
		text += "\xE2\x82\xAC";   // euro sign
	}
	MessageChunker chunker(16);

	std::vector<ChunkedChatPayload> fragments = chunker.split("utf8", text);
	for (const auto& fragment : fragments) {
		EXPECT_TRUE(isValidUtf8Start(fragment.fragment));
		EXPECT_EQ(fragment.fragment.size() % 3, 0u);
		EXPECT_LE(fragment.fragment.size(), 16u);
	}
	EXPECT_EQ(joinFragments(fragments), text);
}

TEST(MessageChunkerTest, ReassemblesInAnyOrder) {
	MessageChunker chunker(10);
	std::string text = "the quick brown fox jumps over the lazy dog, again and again";
	std::vector<ChunkedChatPayload> fragments = chunker.split("m", text);
	ASSERT_GT(fragments.size(), 3u);

	std::mt19937 rng(7);
	std::shuffle(fragments.begin(), fragments.end(), rng);

	MessageReassembler reassembler;
	std::string assembled;
	for (size_t i = 0; i + 1 < fragments.size(); i++) {
		EXPECT_EQ(reassembler.addFragment(fragments[i], assembled), MessageReassembler::Result::ACCEPTED);
	}
	EXPECT_EQ(reassembler.pendingCount(), 1u);
	EXPECT_EQ(reassembler.addFragment(fragments.back(), assembled), MessageReassembler::Result::COMPLETED);
	EXPECT_EQ(assembled, text);
	EXPECT_EQ(reassembler.pendingCount(), 0u);
	EXPECT_TRUE(reassembler.isCompleted("m"));
}

TEST(MessageChunkerTest, DuplicatesNeverCountTwice) {
	MessageChunker chunker(4);
	std::vector<ChunkedChatPayload> fragments = chunker.split("d", "abcdefgh");
	ASSERT_EQ(fragments.size(), 2u);

	MessageReassembler reassembler;
	std::string assembled;
	EXPECT_EQ(reassembler.addFragment(fragments[0], assembled), MessageReassembler::Result::ACCEPTED);
	EXPECT_EQ(reassembler.addFragment(fragments[0], assembled), MessageReassembler::Result::DUPLICATE);
	EXPECT_EQ(reassembler.addFragment(fragments[1], assembled), MessageReassembler::Result::COMPLETED);
	EXPECT_EQ(assembled, "abcdefgh");

	// The whole message again, e.g. relayed twice
	EXPECT_EQ(reassembler.addFragment(fragments[0], assembled), MessageReassembler::Result::DUPLICATE);
	EXPECT_EQ(reassembler.addFragment(fragments[1], assembled), MessageReassembler::Result::DUPLICATE);
	EXPECT_EQ(reassembler.pendingCount(), 0u);
}

TEST(MessageChunkerTest, InvalidFragmentsAreRefused) {
	MessageReassembler reassembler;
	std::string assembled;

	ChunkedChatPayload fragment;
	fragment.message_id = "x";
	fragment.index = 2;
	fragment.total = 2;
	EXPECT_EQ(reassembler.addFragment(fragment, assembled), MessageReassembler::Result::INVALID);

	fragment.index = 0;
	fragment.total = 0;
	EXPECT_EQ(reassembler.addFragment(fragment, assembled), MessageReassembler::Result::INVALID);

	fragment.message_id.clear();
	fragment.total = 1;
	EXPECT_EQ(reassembler.addFragment(fragment, assembled), MessageReassembler::Result::INVALID);

	// Total disagrees with what the first fragment announced
	fragment.message_id = "y";
	fragment.index = 0;
	fragment.total = 3;
	fragment.fragment = "a";
	EXPECT_EQ(reassembler.addFragment(fragment, assembled), MessageReassembler::Result::ACCEPTED);
	fragment.index = 1;
	fragment.total = 4;
	EXPECT_EQ(reassembler.addFragment(fragment, assembled), MessageReassembler::Result::INVALID);
}

TEST(MessageChunkerTest, InterleavedMessagesStayApart) {
	MessageChunker chunker(5);
	std::vector<ChunkedChatPayload> first = chunker.split("one", "aaaaabbbbb");
	std::vector<ChunkedChatPayload> second = chunker.split("two", "cccccddddd");

	MessageReassembler reassembler;
	std::string assembled;
	reassembler.addFragment(first[0], assembled);
	reassembler.addFragment(second[0], assembled);
	EXPECT_EQ(reassembler.addFragment(second[1], assembled), MessageReassembler::Result::COMPLETED);
	EXPECT_EQ(assembled, "cccccddddd");
	EXPECT_EQ(reassembler.addFragment(first[1], assembled), MessageReassembler::Result::COMPLETED);
	EXPECT_EQ(assembled, "aaaaabbbbb");
}
