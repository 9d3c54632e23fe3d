#include <gtest/gtest.h>

#include "memory.hpp"

using eliza::MemoryQueue;

TEST(MemoryQueue, RecallsInArrivalOrder) {
	MemoryQueue q;
	q.store("first");
	q.store("second");
	q.store("third");

	EXPECT_EQ(q.recall(), "first");
	EXPECT_EQ(q.recall(), "second");
	EXPECT_EQ(q.recall(), "third");
	EXPECT_FALSE(q.recall().has_value());
}

TEST(MemoryQueue, EvictsOldestBeyondCapacity) {
	MemoryQueue q(3);
	for (int i = 0; i < 4; i++) q.store("entry " + std::to_string(i));

	ASSERT_EQ(q.size(), 3u);
	auto kept = q.entries();
	EXPECT_EQ(kept.front(), "entry 1");
	EXPECT_EQ(kept.back(), "entry 3");
}

TEST(MemoryQueue, PeekLeavesEntryQueued) {
	MemoryQueue q;
	q.store("your cat is fluffy");
	EXPECT_EQ(q.recall(false), "your cat is fluffy");
	EXPECT_EQ(q.size(), 1u);
	EXPECT_EQ(q.recall(true), "your cat is fluffy");
	EXPECT_TRUE(q.empty());
}

TEST(MemoryQueue, IgnoresBlankEntries) {
	MemoryQueue q;
	q.store("");
	q.store("   \t");
	q.store("  padded  ");
	ASSERT_EQ(q.size(), 1u);
	EXPECT_EQ(q.recall(), "padded");
}

TEST(MemoryQueue, CutsLongEntries) {
	MemoryQueue q(5, 16);
	q.store("your cat is very fluffy indeed today");
	EXPECT_EQ(q.recall(), "your cat is very");

	MemoryQueue defaults;
	defaults.store("your " + std::string(100000, 'x'));
	EXPECT_EQ(defaults.recall()->size(), eliza::kMaxEntryChars);
}

TEST(MemoryQueue, ZeroCapacityHoldsOne) {
	MemoryQueue q(0);
	EXPECT_EQ(q.capacity(), 1u);
	q.store("a");
	q.store("b");
	EXPECT_EQ(q.recall(), "b");
}

TEST(MemoryAdaptation, GerundOnlyAfterAbout) {
	EXPECT_TRUE(eliza::templateWantsGerund("Can we talk more about {0}?"));
	EXPECT_FALSE(eliza::templateWantsGerund("Let's discuss further why {0}."));

	EXPECT_EQ(eliza::adaptForTemplate("your cat is fluffy", "Can we talk more about {0}?"), "your cat being fluffy");
	EXPECT_EQ(eliza::adaptForTemplate("your cat is fluffy", "Earlier you said {0}."), "your cat is fluffy");
}

TEST(MemoryAdaptation, VerbsAndObjectPronoun) {
	const std::string templ = "Tell me about {0}";
	EXPECT_EQ(eliza::adaptForTemplate("your boss hates me", templ), "your boss hating you");
	EXPECT_EQ(eliza::adaptForTemplate("you feel tired", templ), "you feeling tired");
	EXPECT_EQ(eliza::adaptForTemplate("you were sad, you want rest", templ), "you being sad, you wanting rest");
}
