#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

#include "rule_set.hpp"
#include "text_transform.hpp"

namespace eliza {

// Returns an index in [0, n). Only called with n > 0.
using Picker = std::function<std::size_t(std::size_t)>;

// Rewrites one capture for the template it is about to be placed in.
using CaptureAdapter = std::function<std::string(const std::string &capture, const std::string &templ)>;

// Replaces {0}, {1}, ... with the matching capture. Any other brace text is
// copied as-is. Returns nullopt when an index has no capture.
std::optional<std::string> fillTemplate(const std::string &templ, const std::vector<std::string> &captures);

std::vector<std::string> captureGroups(const std::smatch &m);

class Decomposer {
public:
	Decomposer(Picker pick, DebugHook onDebug) : pick_(std::move(pick)), onDebug_(std::move(onDebug)) {}

	// First structurally matching rule wins; a rule whose chosen template
	// cannot be filled is skipped and matching continues with the next rule.
	std::optional<std::string> apply(const std::string &text, const std::vector<DecompositionRule> &rules,
									 const std::string &owner, const CaptureAdapter &adapt = nullptr) const;

private:
	Picker pick_;
	DebugHook onDebug_;
};

} // namespace eliza
