#include "memory.hpp"

#include <unordered_map>
#include <utility>

#include "text_transform.hpp"

namespace eliza {

namespace {

static const std::unordered_map<std::string, std::string> &gerundTable() {
	static const std::unordered_map<std::string, std::string> table = {
		{"is", "being"}, {"are", "being"}, {"was", "being"}, {"were", "being"},
		{"feel", "feeling"}, {"feels", "feeling"},
		{"think", "thinking"}, {"thinks", "thinking"},
		{"want", "wanting"}, {"wants", "wanting"},
		{"need", "needing"}, {"needs", "needing"},
		{"hate", "hating"}, {"hates", "hating"},
		{"me", "you"},
	};
	return table;
}

} // namespace

void MemoryQueue::store(const std::string &entry) {
	std::string item = trimCopy(truncateAtWord(entry, maxEntryChars_));
	if (item.empty()) return;
	entries_.push_back(std::move(item));
	while (entries_.size() > capacity_) entries_.pop_front();
}

std::optional<std::string> MemoryQueue::recall(bool remove) {
	if (entries_.empty()) return std::nullopt;
	std::string front = entries_.front();
	if (remove) entries_.pop_front();
	return front;
}

bool templateWantsGerund(const std::string &templ) {
	return lowerAscii(templ).find("about") != std::string::npos;
}

std::string adaptForTemplate(const std::string &recalled, const std::string &templ) {
	if (!templateWantsGerund(templ)) return recalled;
	const auto &table = gerundTable();
	auto words = splitWords(recalled);
	for (auto &word : words) {
		std::string bare = bareWord(word);
		auto it = table.find(lowerAscii(bare));
		if (it == table.end()) continue;
		auto pos = word.find(bare);
		if (pos != std::string::npos) word.replace(pos, bare.size(), it->second);
	}
	return joinWords(words);
}

} // namespace eliza
