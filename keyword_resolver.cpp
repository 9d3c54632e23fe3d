#include "keyword_resolver.hpp"

#include "text_transform.hpp"

namespace eliza {

Resolution KeywordResolver::resolve(const std::string &normalized) const {
	Resolution viaLink = resolveLink(normalized);
	if (viaLink) return viaLink;
	return resolveByRank(normalized);
}

Resolution KeywordResolver::resolveLink(const std::string &normalized) const {
	Resolution res;
	if (normalized.empty()) return res;
	for (const auto &link : rules_.links) {
		if (!containsWord(normalized, link.first)) continue;
		const KeywordRule *target = rules_.findKeyword(link.second);
		if (!target) continue;
		res.rule = target;
		res.viaLink = true;
		res.trigger = link.first;
		return res;
	}
	return res;
}

Resolution KeywordResolver::resolveByRank(const std::string &normalized) const {
	Resolution res;
	if (normalized.empty()) return res;
	for (auto idx : rules_.dispatchOrder) {
		if (idx >= rules_.keywords.size()) continue;
		const auto &kw = rules_.keywords[idx];
		if (kw.word.empty() || normalized.find(kw.word) == std::string::npos) continue;
		res.rule = &kw;
		res.trigger = kw.word;
		return res;
	}
	return res;
}

} // namespace eliza
