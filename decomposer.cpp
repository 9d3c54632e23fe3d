#include "decomposer.hpp"

#include <cctype>
#include <stdexcept>

namespace eliza {

std::optional<std::string> fillTemplate(const std::string &templ, const std::vector<std::string> &captures) {
	std::string out;
	out.reserve(templ.size() + 32);
	size_t i = 0;
	while (i < templ.size()) {
		char c = templ[i];
		if (c != '{') { out.push_back(c); i++; continue; }
		size_t j = i + 1;
		while (j < templ.size() && std::isdigit(static_cast<unsigned char>(templ[j]))) j++;
		if (j == i + 1 || j >= templ.size() || templ[j] != '}') {
			out.push_back(c);
			i++;
			continue;
		}
		size_t idx = 0;
		try {
			idx = std::stoul(templ.substr(i + 1, j - i - 1));
		} catch (const std::exception &) {
			return std::nullopt;
		}
		if (idx >= captures.size()) return std::nullopt;
		out += captures[idx];
		i = j + 1;
	}
	return out;
}

std::vector<std::string> captureGroups(const std::smatch &m) {
	std::vector<std::string> out;
	for (size_t g = 1; g < m.size(); g++) {
		out.push_back(m[g].matched ? m[g].str() : std::string());
	}
	return out;
}

std::optional<std::string> Decomposer::apply(const std::string &text, const std::vector<DecompositionRule> &rules,
											 const std::string &owner, const CaptureAdapter &adapt) const {
	for (size_t r = 0; r < rules.size(); r++) {
		const auto &rule = rules[r];
		std::smatch m;
		if (!std::regex_search(text, m, rule.compiled)) continue;
		if (rule.reassembly.empty()) {
			if (onDebug_) onDebug_("rule " + owner + "#" + std::to_string(r) + " has no reassembly, skipped");
			continue;
		}
		auto captures = captureGroups(m);
		const std::string &templ = rule.reassembly[pick_(rule.reassembly.size()) % rule.reassembly.size()];
		if (adapt) {
			for (auto &cap : captures) cap = adapt(cap, templ);
		}
		auto filled = fillTemplate(templ, captures);
		if (!filled) {
			if (onDebug_) {
				onDebug_("rule " + owner + "#" + std::to_string(r) + " template '" + templ + "' needs more than " +
						 std::to_string(captures.size()) + " capture(s), skipped");
			}
			continue;
		}
		return filled;
	}
	return std::nullopt;
}

} // namespace eliza
