#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace eliza {

constexpr std::size_t kMaxEntryChars = 4096;

// Bounded FIFO of earlier (person-switched) utterances. Oldest entries are
// evicted once capacity is exceeded; each entry is cut to maxEntryChars.
class MemoryQueue {
public:
	explicit MemoryQueue(std::size_t capacity = 5, std::size_t maxEntryChars = kMaxEntryChars)
		: capacity_(capacity == 0 ? 1 : capacity), maxEntryChars_(maxEntryChars == 0 ? kMaxEntryChars : maxEntryChars) {}

	void store(const std::string &entry);
	// Oldest entry first. With remove == false the entry stays queued.
	std::optional<std::string> recall(bool remove = true);
	void clear() { entries_.clear(); }

	bool empty() const { return entries_.empty(); }
	std::size_t size() const { return entries_.size(); }
	std::size_t capacity() const { return capacity_; }
	std::size_t maxEntryChars() const { return maxEntryChars_; }
	std::vector<std::string> entries() const { return {entries_.begin(), entries_.end()}; }

private:
	std::size_t capacity_{5};
	std::size_t maxEntryChars_{kMaxEntryChars};
	std::deque<std::string> entries_;
};

// Words that should turn a recalled sentence into a gerund phrase when it is
// placed after "about" ("your cat is fluffy" -> "your cat being fluffy").
bool templateWantsGerund(const std::string &templ);
std::string adaptForTemplate(const std::string &recalled, const std::string &templ);

} // namespace eliza
