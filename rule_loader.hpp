#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "rule_set.hpp"

namespace eliza {

using ordered_json = nlohmann::ordered_json;

// Builds a rule set from a parsed script document. Fields that are absent fall
// back to the built-in table for that field; malformed entries are skipped and
// described in warnings. Fails only when the document is not a JSON object.
bool ruleSetFromJson(const ordered_json &doc, RuleSet &out, std::string *error = nullptr,
					 std::vector<std::string> *warnings = nullptr);

bool parseRuleSet(const std::string &text, RuleSet &out, std::string *error = nullptr,
				  std::vector<std::string> *warnings = nullptr);

bool loadRuleSet(const std::filesystem::path &file, RuleSet &out, std::string *error = nullptr,
				 std::vector<std::string> *warnings = nullptr);

// Never fails: an empty path, an unreadable file or a parse error yields
// builtinRuleSet(). Problems are logged to std::cerr.
std::shared_ptr<const RuleSet> loadRuleSetOrBuiltin(const std::filesystem::path &file);

} // namespace eliza
