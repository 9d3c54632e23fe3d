#include "text_transform.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace eliza {

namespace {

static bool isWordChar(char c) {
	return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static std::vector<std::pair<std::regex, std::string>> compileTransforms(const std::vector<TransformPair> &list,
																		 const char *what,
																		 const DebugHook &onDebug) {
	std::vector<std::pair<std::regex, std::string>> out;
	out.reserve(list.size());
	for (const auto &t : list) {
		try {
			out.emplace_back(std::regex(t.first, std::regex::ECMAScript | std::regex::icase), t.second);
		} catch (const std::regex_error &e) {
			if (onDebug) onDebug(std::string("skip ") + what + " transform '" + t.first + "': " + e.what());
		}
	}
	return out;
}

} // namespace

std::string lowerAscii(const std::string &s) {
	std::string out = s;
	std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return (char)std::tolower(c); });
	return out;
}

std::string trimCopy(const std::string &s) {
	auto start = s.find_first_not_of(" \t\r\n");
	if (start == std::string::npos) return "";
	auto end = s.find_last_not_of(" \t\r\n");
	return s.substr(start, end - start + 1);
}

std::vector<std::string> splitWords(const std::string &text) {
	std::vector<std::string> out;
	std::istringstream ss(text);
	std::string w;
	while (ss >> w) out.push_back(w);
	return out;
}

std::string joinWords(const std::vector<std::string> &words) {
	std::string out;
	for (const auto &w : words) {
		if (!out.empty()) out.push_back(' ');
		out += w;
	}
	return out;
}

std::string truncateAtWord(const std::string &text, std::size_t maxChars) {
	if (maxChars == 0 || text.size() <= maxChars) return text;
	auto cut = text.find_last_of(" \t\r\n", maxChars);
	if (cut == std::string::npos || cut < maxChars / 2) cut = maxChars;
	return trimCopy(text.substr(0, cut));
}

std::string bareWord(const std::string &token) {
	std::string out;
	out.reserve(token.size());
	for (char c : token) {
		if (isWordChar(c)) out.push_back(c);
	}
	return out;
}

bool containsWord(const std::string &text, const std::string &word) {
	if (word.empty()) return false;
	size_t pos = text.find(word);
	while (pos != std::string::npos) {
		size_t end = pos + word.size();
		bool leftOk = pos == 0 || !isWordChar(text[pos - 1]);
		bool rightOk = end >= text.size() || !isWordChar(text[end]);
		if (leftOk && rightOk) return true;
		pos = text.find(word, pos + 1);
	}
	return false;
}

Normalizer::Normalizer(const RuleSet &rules, const DebugHook &onDebug)
	: pre_(compileTransforms(rules.preTransforms, "pre", onDebug)) {
	for (const auto &syn : rules.synonyms) {
		canonical_.emplace(syn.first, syn.first);
		for (const auto &variant : syn.second) canonical_.emplace(variant, syn.first);
	}
	for (const auto &kw : rules.keywords) preserved_.insert(kw.word);
	for (const auto &link : rules.links) preserved_.insert(link.first);
}

std::string Normalizer::normalize(const std::string &text) const {
	std::string normalized = trimCopy(lowerAscii(text));
	for (const auto &p : pre_) {
		normalized = std::regex_replace(normalized, p.first, p.second);
	}

	auto words = splitWords(normalized);
	for (auto &word : words) {
		std::string bare = bareWord(word);
		if (bare.empty() || preserved_.count(bare)) continue;
		auto it = canonical_.find(bare);
		if (it == canonical_.end() || it->second == bare) continue;
		auto pos = word.find(bare);
		if (pos != std::string::npos) word.replace(pos, bare.size(), it->second);
	}
	return joinWords(words);
}

Finalizer::Finalizer(const RuleSet &rules, const DebugHook &onDebug)
	: post_(compileTransforms(rules.postTransforms, "post", onDebug)) {}

std::string Finalizer::switchPerson(const std::string &text) const {
	std::string out = text;
	for (const auto &p : post_) {
		out = std::regex_replace(out, p.first, p.second);
	}
	return out;
}

std::string Finalizer::finalize(const std::string &text) const {
	std::string out = switchPerson(text);
	if (!out.empty()) out[0] = (char)std::toupper(static_cast<unsigned char>(out[0]));
	return out;
}

} // namespace eliza
