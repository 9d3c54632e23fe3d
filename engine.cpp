#include "engine.hpp"

#include <random>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "rule_loader.hpp"

namespace eliza {

namespace {

const char *kFallbackReply = "Please go on.";
const char *kFallbackPrompt = "How do you do. Please tell me your problem.";

// Short confirmations prefer a default reply and must not consume memory.
static const std::unordered_set<std::string> &acknowledgments() {
	static const std::unordered_set<std::string> words = {
		"yes", "no", "ok", "okay", "sure", "right", "yeah", "yep", "nope", "yea"
	};
	return words;
}

static Picker seededPicker(std::uint32_t seed) {
	auto rng = std::make_shared<std::mt19937>(seed ? seed : std::random_device{}());
	return [rng](std::size_t n) -> std::size_t {
		std::uniform_int_distribution<std::size_t> dist(0, n - 1);
		return dist(*rng);
	};
}

static std::shared_ptr<const RuleSet> orBuiltin(std::shared_ptr<const RuleSet> rules) {
	if (rules) return rules;
	return builtinRuleSet();
}

} // namespace

const char *stageName(Stage stage) {
	switch (stage) {
	case Stage::Keyword: return "keyword";
	case Stage::Link: return "link";
	case Stage::Memory: return "memory";
	case Stage::Default: return "default";
	default: return "none";
	}
}

Engine::Engine(std::shared_ptr<const RuleSet> rules, EngineOptions options)
	: rules_(orBuiltin(std::move(rules))),
	  onDebug_(std::move(options.onDebug)),
	  pick_(options.pick ? std::move(options.pick) : seededPicker(options.seed)),
	  normalizer_(*rules_, onDebug_),
	  finalizer_(*rules_, onDebug_),
	  resolver_(*rules_),
	  decomposer_(pick_, onDebug_),
	  maxInputChars_(options.maxInputChars ? options.maxInputChars : kMaxEntryChars),
	  memory_(options.memoryCapacity ? options.memoryCapacity : rules_->memory.capacity, maxInputChars_) {
	if (rules_->memory.decomposition.empty()) memoryRules_ = defaultMemoryRules().decomposition;
	if (rules_->dispatchOrder.size() != rules_->keywords.size()) {
		debug("dispatch order covers " + std::to_string(rules_->dispatchOrder.size()) + " of " +
			  std::to_string(rules_->keywords.size()) + " keyword(s); call RuleSet::buildDispatchOrder()");
	}
}

Engine Engine::fromSource(const std::string &path, EngineOptions options) {
	return Engine(loadRuleSetOrBuiltin(path), std::move(options));
}

std::string Engine::respond(const std::string &utterance) {
	try {
		return turn(utterance);
	} catch (const std::exception &e) {
		debug(std::string("turn failed: ") + e.what());
		trace_.stage = Stage::Default;
		return pickDefault();
	}
}

std::string Engine::turn(const std::string &utterance) {
	trace_ = TurnTrace{};
	std::string input = utterance;
	if (input.size() > maxInputChars_) {
		debug("input of " + std::to_string(input.size()) + " chars cut to " + std::to_string(maxInputChars_));
		input = truncateAtWord(input, maxInputChars_);
	}
	// Contraction expansion can grow the text again.
	std::string normalized = truncateAtWord(normalizer_.normalize(input), maxInputChars_);
	trace_.normalized = normalized;
	auto words = splitWords(normalized);

	// Stored before dispatch, whether or not a keyword answers this turn.
	for (const auto &w : words) {
		if (bareWord(w) != "my") continue;
		memory_.store(finalizer_.switchPerson(normalized));
		trace_.stored = true;
		break;
	}

	auto res = resolver_.resolve(normalized);
	if (res) {
		trace_.keyword = res.rule->word;
		trace_.trigger = res.trigger;
		auto drafted = decomposer_.apply(normalized, res.rule->decomposition, res.rule->word);
		if (drafted && !trimCopy(*drafted).empty()) {
			trace_.stage = res.viaLink ? Stage::Link : Stage::Keyword;
			return finalizer_.finalize(*drafted);
		}
		debug("keyword '" + res.rule->word + "' had no usable decomposition for '" + normalized + "'");
	}

	// An entry stored this turn is only recalled on a later one.
	bool onlyFresh = trace_.stored && memory_.size() == 1;
	if (!onlyFresh && !words.empty() && !acknowledgments().count(bareWord(words.front()))) {
		auto recalled = fromMemory();
		if (recalled) {
			trace_.stage = Stage::Memory;
			return *recalled;
		}
	}

	trace_.stage = Stage::Default;
	return pickDefault();
}

std::optional<std::string> Engine::fromMemory() {
	auto recalled = memory_.recall(false);
	if (!recalled) return std::nullopt;
	const auto &rules = memoryRules_.empty() ? rules_->memory.decomposition : memoryRules_;
	auto drafted = decomposer_.apply(*recalled, rules, "memory", adaptForTemplate);
	if (!drafted || trimCopy(*drafted).empty()) {
		debug("no memory template fits '" + *recalled + "'");
		return std::nullopt;
	}
	memory_.recall(true);
	return finalizer_.finalize(*drafted);
}

std::string Engine::pickDefault() {
	const auto &defaults = rules_->defaults;
	if (defaults.empty()) return kFallbackReply;
	const auto &reply = defaults[pick_(defaults.size()) % defaults.size()];
	return trimCopy(reply).empty() ? std::string(kFallbackReply) : reply;
}

std::string Engine::initialPrompt() {
	const auto &prompts = rules_->initialPrompts;
	if (prompts.empty()) return kFallbackPrompt;
	const auto &prompt = prompts[pick_(prompts.size()) % prompts.size()];
	return trimCopy(prompt).empty() ? std::string(kFallbackPrompt) : prompt;
}

bool Engine::isQuitWord(const std::string &text) const {
	std::string t = lowerAscii(trimCopy(text));
	if (t.empty()) return false;
	std::string bare = bareWord(t);
	for (const auto &q : rules_->quitWords) {
		if (t == q || (!bare.empty() && bare == bareWord(q))) return true;
	}
	return false;
}

void Engine::debug(const std::string &msg) const {
	if (onDebug_) onDebug_(msg);
}

} // namespace eliza
