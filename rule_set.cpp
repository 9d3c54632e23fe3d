#include "rule_set.hpp"

#include <algorithm>

namespace eliza {

namespace {

struct KeywordSeed {
	const char *word;
	int rank;
	std::vector<std::pair<const char *, std::vector<std::string>>> rules;
};

static std::vector<KeywordSeed> builtinKeywordSeeds() {
	return {
		{"hello", 0, {
			{".*hello.*", {
				"Hello. How are you feeling today?",
				"Hi there. What brings you here?",
				"Hello. Please tell me what's on your mind."
			}}
		}},
		{"mother", 10, {
			{".*mother.*", {
				"Tell me more about your family.",
				"Who else in your family comes to mind?",
				"What about your family?"
			}}
		}},
		{"father", 10, {
			{".*father.*", {
				"Tell me more about your family.",
				"Who else in your family comes to mind?",
				"What about your family?"
			}}
		}},
		{"am", 5, {
			{".*i am not (.*)", {
				"Why are you not {0}?",
				"Would you like to be {0}?",
				"How long have you not been {0}?"
			}},
			{".*i am (.*)", {
				"Why are you {0}?",
				"How long have you been {0}?",
				"Do you enjoy being {0}?"
			}}
		}},
		{"feel", 5, {
			{".*i feel (.*)", {
				"Do you often feel {0}?",
				"What makes you feel {0}?",
				"Can you tell me more about feeling {0}?"
			}}
		}},
		{"think", 5, {
			{".*i think (.*)", {
				"What makes you think {0}?",
				"Do you really think {0}?",
				"Can you elaborate on why you think {0}?"
			}},
			{".*", {
				"Do you doubt that?",
				"What makes you say that?",
				"Why do you think so?"
			}}
		}},
		{"want", 5, {
			{".*i want (.*)", {
				"Why do you want {0}?",
				"What would it mean to you if you had {0}?",
				"Tell me more about wanting {0}."
			}}
		}},
		{"need", 5, {
			{".*i need (.*)", {
				"Why do you need {0}?",
				"What would happen if you didn't have {0}?",
				"Tell me more about needing {0}."
			}}
		}},
	};
}

} // namespace

const KeywordRule *RuleSet::findKeyword(const std::string &word) const {
	for (const auto &kw : keywords) {
		if (kw.word == word) return &kw;
	}
	return nullptr;
}

void RuleSet::buildDispatchOrder() {
	dispatchOrder.clear();
	dispatchOrder.reserve(keywords.size());
	for (std::size_t i = 0; i < keywords.size(); i++) dispatchOrder.push_back(i);
	std::stable_sort(dispatchOrder.begin(), dispatchOrder.end(), [this](std::size_t a, std::size_t b) {
		return keywords[a].rank > keywords[b].rank;
	});
}

bool makeDecompositionRule(const std::string &pattern,
						   std::vector<std::string> reassembly,
						   DecompositionRule &out,
						   std::string *error) {
	try {
		out.compiled = std::regex(pattern, std::regex::ECMAScript | std::regex::icase);
	} catch (const std::regex_error &e) {
		if (error) *error = "invalid pattern '" + pattern + "': " + e.what();
		return false;
	}
	out.pattern = pattern;
	out.reassembly = std::move(reassembly);
	return true;
}

std::vector<TransformPair> defaultPreTransforms() {
	return {
		{"\\bi'm\\b", "i am"},
		{"\\byou're\\b", "you are"},
		{"\\bhe's\\b", "he is"},
		{"\\bshe's\\b", "she is"},
		{"\\bit's\\b", "it is"},
		{"\\bwe're\\b", "we are"},
		{"\\bthey're\\b", "they are"},
		{"\\bi've\\b", "i have"},
		{"\\byou've\\b", "you have"},
		{"\\bwe've\\b", "we have"},
		{"\\bthey've\\b", "they have"},
		{"\\bi'll\\b", "i will"},
		{"\\byou'll\\b", "you will"},
		{"\\bhe'll\\b", "he will"},
		{"\\bshe'll\\b", "she will"},
		{"\\bwe'll\\b", "we will"},
		{"\\bthey'll\\b", "they will"},
		{"\\bi'd\\b", "i would"},
		{"\\byou'd\\b", "you would"},
		{"\\bhe'd\\b", "he would"},
		{"\\bshe'd\\b", "she would"},
		{"\\bwe'd\\b", "we would"},
		{"\\bthey'd\\b", "they would"},
		{"\\bdon't\\b", "do not"},
		{"\\bdoesn't\\b", "does not"},
		{"\\bdidn't\\b", "did not"},
		{"\\bwon't\\b", "will not"},
		{"\\bwouldn't\\b", "would not"},
		{"\\bcan't\\b", "cannot"},
		{"\\bcannot\\b", "can not"},
		{"\\bcouldn't\\b", "could not"},
		{"\\bshouldn't\\b", "should not"},
		{"\\bmustn't\\b", "must not"},
		{"\\bisn't\\b", "is not"},
		{"\\baren't\\b", "are not"},
		{"\\bwasn't\\b", "was not"},
		{"\\bweren't\\b", "were not"},
		{"\\bhaven't\\b", "have not"},
		{"\\bhasn't\\b", "has not"},
		{"\\bhadn't\\b", "had not"},
		{"\\blet's\\b", "let us"},
		{"\\bthat's\\b", "that is"},
		{"\\bwhat's\\b", "what is"},
		{"\\bwho's\\b", "who is"},
		{"\\bwhere's\\b", "where is"},
		{"\\bwhen's\\b", "when is"},
		{"\\bwhy's\\b", "why is"},
		{"\\bhow's\\b", "how is"},
		{"\\bthere's\\b", "there is"},
		{"\\bhere's\\b", "here is"},
	};
}

// Order matters: "me" is guarded so phrases like "tell me more" survive.
std::vector<TransformPair> defaultPostTransforms() {
	return {
		{"\\bam\\b", "are"},
		{"\\bis\\b", "are"},
		{"\\bwas\\b", "were"},
		{"\\bi\\b", "you"},
		{"\\bmy\\b", "your"},
		{"\\bmyself\\b", "yourself"},
		{"\\bme\\b(?!\\s+(?:more|about|how|what|why|when|where)\\b)", "you"},
		{"\\bmine\\b", "yours"},
	};
}

std::vector<std::pair<std::string, std::vector<std::string>>> defaultSynonyms() {
	return {
		{"feel", {"felt"}},
		{"think", {"thought"}},
		{"want", {"wanted"}},
		{"need", {"needed"}},
		{"like", {"liking", "liked", "enjoy", "enjoying", "enjoyed"}},
		{"hate", {"hating", "hated"}},
		{"love", {"loving", "loved"}},
		{"sad", {"sadness", "saddened", "unhappy", "depressed", "depression"}},
		{"happy", {"happiness", "glad", "gladness", "joyful", "cheerful"}},
		{"angry", {"anger", "mad", "furious", "annoyed"}},
		{"afraid", {"fear", "fearful", "scared", "frightened"}},
		{"mother", {"mom", "mommy", "mama", "mum", "mummy"}},
		{"father", {"dad", "daddy", "papa", "pop"}},
		{"family", {"families", "relatives"}},
	};
}

std::vector<std::pair<std::string, std::string>> defaultLinks() {
	return {
		{"believe", "think"},
		{"suppose", "think"},
		{"desire", "want"},
		{"wish", "want"},
		{"crave", "want"},
		{"require", "need"},
		{"sense", "feel"},
		{"perceive", "feel"},
	};
}

MemoryRules defaultMemoryRules() {
	MemoryRules m;
	DecompositionRule rule;
	if (makeDecompositionRule("(.*)", {
			"Earlier you said {0}.",
			"Does that have anything to do with the fact that {0}?",
			"Let's discuss further why {0}.",
			"Can we talk more about {0}?",
			"But {0}."
		}, rule)) {
		m.decomposition.push_back(std::move(rule));
	}
	return m;
}

std::vector<std::string> defaultResponses() {
	return {
		"I see.",
		"Tell me more.",
		"Go on.",
		"I understand.",
		"Can you elaborate on that?",
		"What does that suggest to you?",
		"How does that make you feel?"
	};
}

std::vector<std::string> defaultInitialPrompts() {
	return {
		"How do you do. Please tell me your problem.",
		"Hello. What would you like to talk about today?",
		"Please tell me what's been bothering you."
	};
}

std::vector<std::string> defaultQuitWords() {
	return {"bye", "goodbye", "quit", "exit"};
}

std::shared_ptr<const RuleSet> builtinRuleSet() {
	auto rs = std::make_shared<RuleSet>();
	for (const auto &seed : builtinKeywordSeeds()) {
		KeywordRule kw;
		kw.word = seed.word;
		kw.rank = seed.rank;
		for (const auto &r : seed.rules) {
			DecompositionRule rule;
			if (makeDecompositionRule(r.first, r.second, rule)) kw.decomposition.push_back(std::move(rule));
		}
		rs->keywords.push_back(std::move(kw));
	}
	rs->links = defaultLinks();
	rs->synonyms = defaultSynonyms();
	rs->preTransforms = defaultPreTransforms();
	rs->postTransforms = defaultPostTransforms();
	rs->memory = defaultMemoryRules();
	rs->defaults = defaultResponses();
	rs->initialPrompts = defaultInitialPrompts();
	rs->quitWords = defaultQuitWords();
	rs->buildDispatchOrder();
	return rs;
}

} // namespace eliza
