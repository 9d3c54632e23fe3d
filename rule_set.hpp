#pragma once

#include <cstddef>
#include <memory>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace eliza {

struct DecompositionRule {
	std::string pattern;
	std::regex compiled;
	std::vector<std::string> reassembly;
};

struct KeywordRule {
	std::string word;
	int rank{0};
	std::vector<DecompositionRule> decomposition;
};

struct MemoryRules {
	std::size_t capacity{5};
	std::vector<DecompositionRule> decomposition;
};

using TransformPair = std::pair<std::string, std::string>;

// Read-only once built. Engines share it through std::shared_ptr<const RuleSet>.
struct RuleSet {
	std::vector<KeywordRule> keywords;
	std::vector<std::pair<std::string, std::string>> links;
	std::vector<std::pair<std::string, std::vector<std::string>>> synonyms;
	std::vector<TransformPair> preTransforms;
	std::vector<TransformPair> postTransforms;
	MemoryRules memory;
	std::vector<std::string> defaults;
	std::vector<std::string> initialPrompts;
	std::vector<std::string> quitWords;

	// Indices into keywords, descending rank, declaration order on ties.
	std::vector<std::size_t> dispatchOrder;

	const KeywordRule *findKeyword(const std::string &word) const;
	void buildDispatchOrder();
};

// Compiles pattern case-insensitively. Returns false and fills error when the
// pattern is not a valid ECMAScript expression.
bool makeDecompositionRule(const std::string &pattern,
						   std::vector<std::string> reassembly,
						   DecompositionRule &out,
						   std::string *error = nullptr);

std::vector<TransformPair> defaultPreTransforms();
std::vector<TransformPair> defaultPostTransforms();
std::vector<std::pair<std::string, std::vector<std::string>>> defaultSynonyms();
std::vector<std::pair<std::string, std::string>> defaultLinks();
MemoryRules defaultMemoryRules();
std::vector<std::string> defaultResponses();
std::vector<std::string> defaultInitialPrompts();
std::vector<std::string> defaultQuitWords();

// The fallback rule set: keywords hello, mother, father, am, feel, think,
// want, need plus every default table above. Never throws.
std::shared_ptr<const RuleSet> builtinRuleSet();

} // namespace eliza
