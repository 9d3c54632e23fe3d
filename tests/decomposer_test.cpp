#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "decomposer.hpp"
#include "rule_set.hpp"

using namespace eliza;

namespace {

DecompositionRule rule(const std::string &pattern, std::vector<std::string> reassembly) {
	DecompositionRule r;
	EXPECT_TRUE(makeDecompositionRule(pattern, std::move(reassembly), r));
	return r;
}

Picker fixedPick(std::size_t index) {
	return [index](std::size_t) { return index; };
}

} // namespace

TEST(FillTemplate, SubstitutesPositionalPlaceholders) {
	EXPECT_EQ(fillTemplate("{1} then {0}", {"a", "b"}), "b then a");
	EXPECT_EQ(fillTemplate("no placeholders", {}), "no placeholders");
	EXPECT_EQ(fillTemplate("{0}{0}", {"x"}), "xx");
}

TEST(FillTemplate, LeavesOtherBracesAlone) {
	EXPECT_EQ(fillTemplate("{name} and {0}", {"x"}), "{name} and x");
	EXPECT_EQ(fillTemplate("open {", {}), "open {");
	EXPECT_EQ(fillTemplate("{}", {}), "{}");
}

TEST(FillTemplate, MissingCaptureFails) {
	EXPECT_FALSE(fillTemplate("Why {0} and {1}?", {"only one"}).has_value());
	EXPECT_FALSE(fillTemplate("{0}", {}).has_value());
}

TEST(Decomposer, FirstMatchingRuleWins) {
	std::vector<DecompositionRule> rules = {
		rule(".*i am not (.*)", {"negated {0}"}),
		rule(".*i am (.*)", {"general {0}"}),
	};
	Decomposer d(fixedPick(0), nullptr);
	EXPECT_EQ(d.apply("i am not tired", rules, "am"), "negated tired");
	EXPECT_EQ(d.apply("i am tired", rules, "am"), "general tired");
	EXPECT_FALSE(d.apply("you are tired", rules, "am").has_value());
}

TEST(Decomposer, MatchIsUnanchoredAndCaseInsensitive) {
	std::vector<DecompositionRule> rules = {rule("i want (\\w+)", {"want {0}"})};
	Decomposer d(fixedPick(0), nullptr);
	EXPECT_EQ(d.apply("well I WANT cake now", rules, "want"), "want cake");
}

TEST(Decomposer, PickerChoosesTemplate) {
	std::vector<DecompositionRule> rules = {rule("(.*)", {"a {0}", "b {0}", "c {0}"})};
	EXPECT_EQ(Decomposer(fixedPick(2), nullptr).apply("x", rules, "k"), "c x");
	EXPECT_EQ(Decomposer(fixedPick(7), nullptr).apply("x", rules, "k"), "b x");
}

TEST(Decomposer, SkipsUnfillableRuleAndReportsIt) {
	std::vector<DecompositionRule> rules = {
		rule(".*i am (.*)", {"Why {0} and {3}?"}),
		rule(".*", {"fallback"}),
	};
	std::vector<std::string> messages;
	Decomposer d(fixedPick(0), [&](const std::string &msg) { messages.push_back(msg); });
	EXPECT_EQ(d.apply("i am tired", rules, "am"), "fallback");
	ASSERT_EQ(messages.size(), 1u);
	EXPECT_NE(messages[0].find("am#0"), std::string::npos);
}

TEST(Decomposer, SkipsRuleWithoutReassembly) {
	std::vector<DecompositionRule> rules = {rule(".*", {})};
	Decomposer d(fixedPick(0), nullptr);
	EXPECT_FALSE(d.apply("anything", rules, "k").has_value());
}

TEST(Decomposer, AdapterRewritesCaptures) {
	std::vector<DecompositionRule> rules = {rule("(.*)", {"about {0}"})};
	Decomposer d(fixedPick(0), nullptr);
	auto out = d.apply("x", rules, "memory", [](const std::string &cap, const std::string &templ) {
		return templ + ":" + cap;
	});
	EXPECT_EQ(out, "about about {0}:x");
}

TEST(MakeDecompositionRule, RejectsInvalidPattern) {
	DecompositionRule r;
	std::string error;
	EXPECT_FALSE(makeDecompositionRule("(unclosed", {"x"}, r, &error));
	EXPECT_NE(error.find("(unclosed"), std::string::npos);
}
