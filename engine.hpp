#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "decomposer.hpp"
#include "keyword_resolver.hpp"
#include "memory.hpp"
#include "rule_set.hpp"
#include "text_transform.hpp"

namespace eliza {

struct EngineOptions {
	// 0 keeps the capacity declared by the rule set.
	std::size_t memoryCapacity{0};
	// 0 seeds from std::random_device.
	std::uint32_t seed{0};
	// Overrides the seeded generator when set.
	Picker pick;
	// Receives skipped rules, load warnings and per-turn traces.
	DebugHook onDebug;
	// Longer utterances are cut at a word boundary before normalization.
	// std::regex matching recurses per character, so this also bounds stack use.
	// 0 keeps kMaxEntryChars.
	std::size_t maxInputChars{kMaxEntryChars};
};

enum class Stage { None, Keyword, Link, Memory, Default };

const char *stageName(Stage stage);

struct TurnTrace {
	Stage stage{Stage::None};
	std::string normalized;
	std::string keyword;
	std::string trigger;
	bool stored{false};
};

// One conversation. The rule set is shared and read-only; the memory queue is
// owned by this instance and is not thread-safe.
class Engine {
public:
	explicit Engine(std::shared_ptr<const RuleSet> rules = nullptr, EngineOptions options = {});

	// Reads a rule set file. Any failure falls back to builtinRuleSet().
	static Engine fromSource(const std::string &path, EngineOptions options = {});

	std::string respond(const std::string &utterance);
	std::string initialPrompt();
	bool isQuitWord(const std::string &text) const;

	const RuleSet &rules() const { return *rules_; }
	const MemoryQueue &memory() const { return memory_; }
	void clearMemory() { memory_.clear(); }
	const TurnTrace &lastTrace() const { return trace_; }
	std::size_t maxInputChars() const { return maxInputChars_; }

private:
	std::shared_ptr<const RuleSet> rules_;
	DebugHook onDebug_;
	Picker pick_;
	Normalizer normalizer_;
	Finalizer finalizer_;
	KeywordResolver resolver_;
	Decomposer decomposer_;
	std::size_t maxInputChars_{kMaxEntryChars};
	MemoryQueue memory_;
	// Generic fallback used when the rule set declares no memory rules.
	std::vector<DecompositionRule> memoryRules_;
	TurnTrace trace_;

	std::string turn(const std::string &utterance);
	std::optional<std::string> fromMemory();
	std::string pickDefault();
	void debug(const std::string &msg) const;
};

} // namespace eliza
