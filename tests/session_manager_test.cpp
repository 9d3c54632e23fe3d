#include <gtest/gtest.h>

#include <string>

#include "session_manager.hpp"

using namespace eliza;

namespace {

SessionManager::EngineFactory sharedRulesFactory() {
	auto rules = builtinRuleSet();
	return [rules]() {
		EngineOptions options;
		options.pick = [](std::size_t) { return std::size_t(0); };
		return Engine(rules, options);
	};
}

} // namespace

TEST(SessionManager, EnsureCreatesAndReuses) {
	SessionManager sessions(sharedRulesFactory());
	auto a = sessions.ensure("");
	ASSERT_TRUE(a);
	EXPECT_EQ(a->id.size(), 16u);
	EXPECT_EQ(a->count, 1);

	auto again = sessions.ensure(a->id);
	EXPECT_EQ(again.get(), a.get());
	EXPECT_EQ(again->count, 2);

	auto b = sessions.ensure("unknown-id");
	EXPECT_NE(b->id, a->id);
	EXPECT_EQ(sessions.size(), 2u);
}

TEST(SessionManager, ConversationsHaveSeparateMemory) {
	SessionManager sessions(sharedRulesFactory());
	auto a = sessions.ensure("");
	auto b = sessions.ensure("");
	a->engine.respond("my mother is kind");
	EXPECT_EQ(a->engine.memory().size(), 1u);
	EXPECT_TRUE(b->engine.memory().empty());
	EXPECT_EQ(&a->engine.rules(), &b->engine.rules());
}

TEST(SessionManager, ResetClearsMemory) {
	SessionManager sessions(sharedRulesFactory());
	auto s = sessions.ensure("");
	s->engine.respond("my father works late");
	ASSERT_FALSE(s->engine.memory().empty());
	EXPECT_TRUE(sessions.reset(s->id));
	EXPECT_TRUE(s->engine.memory().empty());
	EXPECT_FALSE(sessions.reset("missing"));
}

TEST(SessionManager, RemoveAndFind) {
	SessionManager sessions(sharedRulesFactory());
	auto s = sessions.ensure("");
	EXPECT_EQ(sessions.find(s->id), s);
	EXPECT_TRUE(sessions.remove(s->id));
	EXPECT_FALSE(sessions.remove(s->id));
	EXPECT_EQ(sessions.find(s->id), nullptr);
}

TEST(SessionManager, ExpiresIdleSessions) {
	SessionManager sessions(sharedRulesFactory(), 1000);
	auto s = sessions.ensure("");
	EXPECT_EQ(sessions.expireIdle(s->lastActivity + 500), 0);
	EXPECT_EQ(sessions.expireIdle(s->lastActivity + 5000), 1);
	EXPECT_EQ(sessions.size(), 0u);
}

TEST(SessionManager, CapsSessionCount) {
	SessionManager sessions(sharedRulesFactory(), 60000, 2);
	auto first = sessions.ensure("");
	first->lastActivity -= 10000;
	auto second = sessions.ensure("");
	auto third = sessions.ensure("");
	EXPECT_EQ(sessions.size(), 2u);
	EXPECT_EQ(sessions.find(first->id), nullptr);
	EXPECT_NE(sessions.find(second->id), nullptr);
	EXPECT_NE(sessions.find(third->id), nullptr);
}

TEST(SessionManager, ExportListsSessions) {
	SessionManager sessions(sharedRulesFactory());
	auto s = sessions.ensure("");
	auto listed = sessions.exportSessions();
	ASSERT_TRUE(listed.is_array());
	ASSERT_EQ(listed.size(), 1u);
	EXPECT_EQ(listed[0]["id"], s->id);
	EXPECT_EQ(listed[0]["count"], 1);
}
