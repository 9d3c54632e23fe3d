#pragma once

#include <cstddef>
#include <functional>
#include <regex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "rule_set.hpp"

namespace eliza {

using DebugHook = std::function<void(const std::string &)>;

std::string lowerAscii(const std::string &s);
std::string trimCopy(const std::string &s);
std::vector<std::string> splitWords(const std::string &text);
std::string joinWords(const std::vector<std::string> &words);

// Cuts text to at most maxChars, at the last whitespace when that keeps at
// least half of the budget, otherwise mid-word. maxChars == 0 means no limit.
std::string truncateAtWord(const std::string &text, std::size_t maxChars);

// Keeps only [A-Za-z0-9_], the "bare" form used for table lookups.
std::string bareWord(const std::string &token);

// True when word occurs in text as a whole word (or a whole phrase for
// multi-word entries). Both sides are expected in lower case.
bool containsWord(const std::string &text, const std::string &word);

// Lowercases, expands contractions and maps synonyms onto their canonical
// form. Keyword triggers and link words are never rewritten.
class Normalizer {
public:
	explicit Normalizer(const RuleSet &rules, const DebugHook &onDebug = nullptr);

	std::string normalize(const std::string &text) const;
	bool isPreserved(const std::string &bare) const { return preserved_.count(bare) > 0; }

private:
	std::vector<std::pair<std::regex, std::string>> pre_;
	std::unordered_map<std::string, std::string> canonical_;
	std::unordered_set<std::string> preserved_;
};

class Finalizer {
public:
	explicit Finalizer(const RuleSet &rules, const DebugHook &onDebug = nullptr);

	// Person switching only (I -> you, my -> your, am -> are, ...).
	std::string switchPerson(const std::string &text) const;
	// switchPerson plus an upper-cased first character.
	std::string finalize(const std::string &text) const;

private:
	std::vector<std::pair<std::regex, std::string>> post_;
};

} // namespace eliza
