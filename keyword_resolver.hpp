#pragma once

#include <string>

#include "rule_set.hpp"

namespace eliza {

struct Resolution {
	const KeywordRule *rule{nullptr};
	bool viaLink{false};
	// The text fragment that triggered the selection: link word or keyword.
	std::string trigger;

	explicit operator bool() const { return rule != nullptr; }
};

// Link words are checked first in declaration order (whole-word match). The
// first link whose target exists wins outright. Otherwise the highest-ranked
// keyword contained in the text is chosen, earliest declaration on ties.
class KeywordResolver {
public:
	explicit KeywordResolver(const RuleSet &rules) : rules_(rules) {}

	Resolution resolve(const std::string &normalized) const;
	Resolution resolveLink(const std::string &normalized) const;
	Resolution resolveByRank(const std::string &normalized) const;

private:
	const RuleSet &rules_;
};

} // namespace eliza
