#include "rule_loader.hpp"

#include <fstream>
#include <iostream>
#include <regex>
#include <sstream>
#include <utility>

#include "text_transform.hpp"

namespace eliza {

namespace {

static void warn(std::vector<std::string> *warnings, const std::string &msg) {
	if (warnings) warnings->push_back(msg);
}

static std::vector<std::string> stringList(const ordered_json &v, const std::string &field, std::vector<std::string> *warnings) {
	std::vector<std::string> out;
	if (!v.is_array()) {
		warn(warnings, field + ": expected an array");
		return out;
	}
	for (const auto &item : v) {
		if (item.is_string()) out.push_back(item.get<std::string>());
		else warn(warnings, field + ": non-string entry skipped");
	}
	return out;
}

static std::vector<DecompositionRule> decompositionList(const ordered_json &v, const std::string &owner,
														std::vector<std::string> *warnings) {
	std::vector<DecompositionRule> out;
	if (!v.is_array()) {
		warn(warnings, owner + ": decomposition must be an array");
		return out;
	}
	for (const auto &item : v) {
		if (!item.is_object() || !item.contains("pattern") || !item["pattern"].is_string()) {
			warn(warnings, owner + ": decomposition entry without a pattern skipped");
			continue;
		}
		std::vector<std::string> reassembly;
		if (item.contains("reassembly")) reassembly = stringList(item["reassembly"], owner + ".reassembly", warnings);
		DecompositionRule rule;
		std::string err;
		if (!makeDecompositionRule(item["pattern"].get<std::string>(), std::move(reassembly), rule, &err)) {
			warn(warnings, owner + ": " + err);
			continue;
		}
		out.push_back(std::move(rule));
	}
	return out;
}

static std::vector<TransformPair> transformList(const ordered_json &v, const std::string &field, bool wholeWord,
												std::vector<std::string> *warnings) {
	std::vector<TransformPair> out;
	if (!v.is_array()) {
		warn(warnings, field + ": expected an array of [pattern, replacement]");
		return out;
	}
	for (const auto &item : v) {
		if (!item.is_array() || item.size() != 2 || !item[0].is_string() || !item[1].is_string()) {
			warn(warnings, field + ": malformed pair skipped");
			continue;
		}
		std::string pattern = item[0].get<std::string>();
		if (wholeWord) pattern = "\\b" + pattern + "\\b";
		try {
			std::regex probe(pattern, std::regex::ECMAScript | std::regex::icase);
		} catch (const std::regex_error &e) {
			warn(warnings, field + ": invalid pattern '" + pattern + "': " + e.what());
			continue;
		}
		out.emplace_back(std::move(pattern), item[1].get<std::string>());
	}
	return out;
}

static std::vector<KeywordRule> keywordList(const ordered_json &v, std::vector<std::string> *warnings) {
	std::vector<KeywordRule> out;
	if (!v.is_array()) {
		warn(warnings, "keywords: expected an array");
		return out;
	}
	for (const auto &item : v) {
		if (!item.is_object() || !item.contains("word") || !item["word"].is_string()) {
			warn(warnings, "keywords: entry without a word skipped");
			continue;
		}
		KeywordRule kw;
		kw.word = lowerAscii(trimCopy(item["word"].get<std::string>()));
		if (kw.word.empty()) {
			warn(warnings, "keywords: empty word skipped");
			continue;
		}
		if (item.contains("rank")) {
			if (item["rank"].is_number_integer()) kw.rank = item["rank"].get<int>();
			else warn(warnings, "keywords." + kw.word + ": rank must be an integer, using 0");
		}
		if (item.contains("decomposition")) {
			kw.decomposition = decompositionList(item["decomposition"], "keywords." + kw.word, warnings);
		}
		out.push_back(std::move(kw));
	}
	return out;
}

} // namespace

bool ruleSetFromJson(const ordered_json &doc, RuleSet &out, std::string *error, std::vector<std::string> *warnings) {
	if (!doc.is_object()) {
		if (error) *error = "rule set must be a JSON object";
		return false;
	}
	auto builtin = builtinRuleSet();
	RuleSet rs;

	rs.keywords = doc.contains("keywords") ? keywordList(doc["keywords"], warnings) : builtin->keywords;

	if (doc.contains("links") && doc["links"].is_object()) {
		for (auto it = doc["links"].begin(); it != doc["links"].end(); ++it) {
			if (!it.value().is_string()) {
				warn(warnings, "links." + it.key() + ": target must be a string");
				continue;
			}
			rs.links.emplace_back(lowerAscii(it.key()), lowerAscii(it.value().get<std::string>()));
		}
	} else {
		if (doc.contains("links")) warn(warnings, "links: expected an object, using defaults");
		rs.links = builtin->links;
	}

	if (doc.contains("synon") && doc["synon"].is_object()) {
		for (auto it = doc["synon"].begin(); it != doc["synon"].end(); ++it) {
			rs.synonyms.emplace_back(lowerAscii(it.key()), stringList(it.value(), "synon." + it.key(), warnings));
		}
	} else {
		if (doc.contains("synon")) warn(warnings, "synon: expected an object, using defaults");
		rs.synonyms = builtin->synonyms;
	}

	rs.preTransforms = doc.contains("pre") ? transformList(doc["pre"], "pre", false, warnings) : builtin->preTransforms;
	rs.postTransforms = doc.contains("post") ? transformList(doc["post"], "post", true, warnings) : builtin->postTransforms;

	rs.memory = builtin->memory;
	if (doc.contains("memory")) {
		const auto &mem = doc["memory"];
		if (!mem.is_object()) {
			warn(warnings, "memory: expected an object, using defaults");
		} else {
			const char *sizeKey = mem.contains("size") ? "size" : "capacity";
			if (mem.contains(sizeKey)) {
				if (mem[sizeKey].is_number_integer() && mem[sizeKey].get<int>() > 0) rs.memory.capacity = mem[sizeKey].get<std::size_t>();
				else warn(warnings, std::string("memory.") + sizeKey + ": must be a positive integer");
			}
			if (mem.contains("decomposition")) {
				auto rules = decompositionList(mem["decomposition"], "memory", warnings);
				if (!rules.empty()) rs.memory.decomposition = std::move(rules);
				else warn(warnings, "memory: no usable decomposition, using generic fallback");
			}
		}
	}

	rs.defaults = doc.contains("default") ? stringList(doc["default"], "default", warnings) : builtin->defaults;
	rs.initialPrompts = doc.contains("initial") ? stringList(doc["initial"], "initial", warnings) : builtin->initialPrompts;
	rs.quitWords = doc.contains("quit") ? stringList(doc["quit"], "quit", warnings) : builtin->quitWords;
	for (auto &q : rs.quitWords) q = lowerAscii(trimCopy(q));

	rs.buildDispatchOrder();
	out = std::move(rs);
	return true;
}

bool parseRuleSet(const std::string &text, RuleSet &out, std::string *error, std::vector<std::string> *warnings) {
	auto doc = ordered_json::parse(text, nullptr, false);
	if (doc.is_discarded()) {
		if (error) *error = "invalid json";
		return false;
	}
	return ruleSetFromJson(doc, out, error, warnings);
}

bool loadRuleSet(const std::filesystem::path &file, RuleSet &out, std::string *error, std::vector<std::string> *warnings) {
	std::ifstream in(file, std::ios::binary);
	if (!in) {
		if (error) *error = "cannot open " + file.string();
		return false;
	}
	std::ostringstream ss;
	ss << in.rdbuf();
	std::string local;
	if (!parseRuleSet(ss.str(), out, &local, warnings)) {
		if (error) *error = file.string() + ": " + local;
		return false;
	}
	return true;
}

std::shared_ptr<const RuleSet> loadRuleSetOrBuiltin(const std::filesystem::path &file) {
	if (file.empty()) return builtinRuleSet();
	try {
		auto loaded = std::make_shared<RuleSet>();
		std::string error;
		std::vector<std::string> warnings;
		if (loadRuleSet(file, *loaded, &error, &warnings)) {
			for (const auto &w : warnings) std::cerr << "[RuleLoader] " << w << std::endl;
			return loaded;
		}
		std::cerr << "[RuleLoader] " << error << ", using built-in rules" << std::endl;
	} catch (const std::exception &e) {
		std::cerr << "[RuleLoader] " << file.string() << ": " << e.what() << ", using built-in rules" << std::endl;
	}
	return builtinRuleSet();
}

} // namespace eliza
