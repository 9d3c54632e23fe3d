#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "rule_loader.hpp"

using namespace eliza;

namespace {

const char *kSmallScript = R"json({
  "keywords": [
    {"word": "Sorry", "rank": 0, "decomposition": [{"pattern": ".*", "reassembly": ["No need to apologize."]}]},
    {"word": "dream", "rank": 3, "decomposition": [{"pattern": ".*i dreamt (.*)", "reassembly": ["Really, {0}?"]}]}
  ],
  "links": {"nightmare": "dream", "vision": "dream"},
  "synon": {"dream": ["dreams", "dreamed"]},
  "post": [["i", "you"]],
  "memory": {"size": 2, "decomposition": [{"pattern": "(.*)", "reassembly": ["Earlier: {0}."]}]},
  "default": ["Go on."],
  "initial": ["Hi."],
  "quit": ["Farewell"]
})json";

} // namespace

TEST(RuleLoader, ParsesEveryField) {
	RuleSet rs;
	std::string error;
	std::vector<std::string> warnings;
	ASSERT_TRUE(parseRuleSet(kSmallScript, rs, &error, &warnings)) << error;
	EXPECT_TRUE(warnings.empty());

	ASSERT_EQ(rs.keywords.size(), 2u);
	EXPECT_EQ(rs.keywords[0].word, "sorry");
	EXPECT_EQ(rs.keywords[1].rank, 3);
	EXPECT_EQ(rs.dispatchOrder.front(), 1u);

	ASSERT_EQ(rs.links.size(), 2u);
	EXPECT_EQ(rs.links[0].first, "nightmare");
	EXPECT_EQ(rs.links[1].first, "vision");

	ASSERT_EQ(rs.postTransforms.size(), 1u);
	EXPECT_EQ(rs.postTransforms[0].first, "\\bi\\b");

	EXPECT_EQ(rs.memory.capacity, 2u);
	ASSERT_EQ(rs.memory.decomposition.size(), 1u);
	EXPECT_EQ(rs.defaults, std::vector<std::string>{"Go on."});
	EXPECT_EQ(rs.initialPrompts, std::vector<std::string>{"Hi."});
	EXPECT_EQ(rs.quitWords, std::vector<std::string>{"farewell"});
}

TEST(RuleLoader, MissingFieldsUseBuiltins) {
	RuleSet rs;
	ASSERT_TRUE(parseRuleSet(R"({"default": ["Only this."]})", rs));
	auto builtin = builtinRuleSet();
	EXPECT_EQ(rs.keywords.size(), builtin->keywords.size());
	EXPECT_EQ(rs.preTransforms, builtin->preTransforms);
	EXPECT_EQ(rs.postTransforms, builtin->postTransforms);
	EXPECT_EQ(rs.links, builtin->links);
	EXPECT_EQ(rs.quitWords, builtin->quitWords);
	EXPECT_EQ(rs.defaults.size(), 1u);
	EXPECT_FALSE(rs.memory.decomposition.empty());
}

TEST(RuleLoader, SkipsMalformedEntriesWithWarnings) {
	const char *text = R"({
	  "keywords": [
	    {"rank": 2},
	    {"word": "x", "rank": "high", "decomposition": [{"pattern": "(bad", "reassembly": ["?"]}, {"reassembly": ["?"]}]}
	  ],
	  "links": {"foo": 3},
	  "pre": [["only one"], ["ok", "fine"]],
	  "memory": {"size": -1}
	})";
	RuleSet rs;
	std::vector<std::string> warnings;
	ASSERT_TRUE(parseRuleSet(text, rs, nullptr, &warnings));
	ASSERT_EQ(rs.keywords.size(), 1u);
	EXPECT_EQ(rs.keywords[0].rank, 0);
	EXPECT_TRUE(rs.keywords[0].decomposition.empty());
	EXPECT_TRUE(rs.links.empty());
	EXPECT_EQ(rs.preTransforms.size(), 1u);
	EXPECT_EQ(rs.memory.capacity, 5u);
	EXPECT_GE(warnings.size(), 6u);
}

TEST(RuleLoader, RejectsNonObjectAndBadJson) {
	RuleSet rs;
	std::string error;
	EXPECT_FALSE(parseRuleSet("[1, 2]", rs, &error));
	EXPECT_FALSE(error.empty());
	error.clear();
	EXPECT_FALSE(parseRuleSet("{ not json", rs, &error));
	EXPECT_EQ(error, "invalid json");
}

TEST(RuleLoader, MissingFileFallsBackToBuiltin) {
	RuleSet rs;
	std::string error;
	EXPECT_FALSE(loadRuleSet("/nonexistent/eliza/script.json", rs, &error));
	EXPECT_NE(error.find("cannot open"), std::string::npos);

	auto rules = loadRuleSetOrBuiltin("/nonexistent/eliza/script.json");
	ASSERT_TRUE(rules);
	EXPECT_NE(rules->findKeyword("hello"), nullptr);
	EXPECT_NE(rules->findKeyword("need"), nullptr);
	EXPECT_EQ(loadRuleSetOrBuiltin("")->keywords.size(), rules->keywords.size());
}

TEST(RuleLoader, LoadsBundledDoctorScript) {
	std::filesystem::path script = std::filesystem::path(ELIZA_SCRIPTS_DIR) / "doctor.json";
	RuleSet rs;
	std::string error;
	std::vector<std::string> warnings;
	ASSERT_TRUE(loadRuleSet(script, rs, &error, &warnings)) << error;
	EXPECT_TRUE(warnings.empty());
	EXPECT_NE(rs.findKeyword("computer"), nullptr);
	EXPECT_EQ(rs.keywords[rs.dispatchOrder.front()].word, "computer");
	EXPECT_EQ(rs.memory.decomposition.size(), 2u);
}
