#include "session_manager.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>

namespace eliza {

namespace {

static std::string randomHex(size_t bytes) {
	std::random_device rd;
	std::uniform_int_distribution<int> dist(0, 255);
	std::ostringstream oss;
	oss << std::hex << std::setfill('0');
	for (size_t i = 0; i < bytes; i++) {
		int v = dist(rd);
		oss << std::setw(2) << (v & 0xff);
	}
	return oss.str();
}

} // namespace

std::int64_t SessionManager::nowMs() {
	return (std::int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
		std::chrono::system_clock::now().time_since_epoch()).count();
}

std::shared_ptr<Session> SessionManager::ensure(const std::string &sessionId) {
	std::lock_guard<std::mutex> lock(mu_);
	auto now = nowMs();
	if (!sessionId.empty()) {
		auto it = active_.find(sessionId);
		if (it != active_.end()) {
			it->second->lastActivity = now;
			it->second->count++;
			return it->second;
		}
	}
	std::string id = newId();
	while (active_.count(id)) id = newId();
	auto session = std::make_shared<Session>(id, factory_());
	session->createdAt = now;
	session->lastActivity = now;
	session->count = 1;
	active_[id] = session;
	order_.push_back(id);
	if ((int)active_.size() > maxSessions_) truncate();
	return session;
}

std::shared_ptr<Session> SessionManager::find(const std::string &sessionId) const {
	std::lock_guard<std::mutex> lock(mu_);
	auto it = active_.find(sessionId);
	return it == active_.end() ? nullptr : it->second;
}

bool SessionManager::reset(const std::string &sessionId) {
	auto session = find(sessionId);
	if (!session) return false;
	std::lock_guard<std::mutex> lock(session->mu);
	session->engine.clearMemory();
	return true;
}

bool SessionManager::remove(const std::string &sessionId) {
	std::lock_guard<std::mutex> lock(mu_);
	if (!active_.count(sessionId)) return false;
	forget(sessionId);
	return true;
}

int SessionManager::expireIdle(std::int64_t now) {
	std::lock_guard<std::mutex> lock(mu_);
	std::vector<std::string> stale;
	for (const auto &kv : active_) {
		if (now - kv.second->lastActivity > idleMs_) stale.push_back(kv.first);
	}
	for (const auto &id : stale) forget(id);
	return (int)stale.size();
}

std::size_t SessionManager::size() const {
	std::lock_guard<std::mutex> lock(mu_);
	return active_.size();
}

json SessionManager::exportSessions() const {
	std::lock_guard<std::mutex> lock(mu_);
	json out = json::array();
	for (const auto &id : order_) {
		auto it = active_.find(id);
		if (it == active_.end()) continue;
		const auto &s = *it->second;
		out.push_back(json{{"id", s.id}, {"createdAt", s.createdAt}, {"lastActivity", s.lastActivity}, {"count", s.count}});
	}
	return out;
}

std::string SessionManager::newId() const {
	return randomHex(8);
}

void SessionManager::truncate() {
	if ((int)active_.size() <= maxSessions_) return;
	// Newest arrivals first so that equal activity keeps the newer session.
	std::vector<std::shared_ptr<Session>> items;
	items.reserve(active_.size());
	for (auto it = order_.rbegin(); it != order_.rend(); ++it) {
		auto found = active_.find(*it);
		if (found != active_.end()) items.push_back(found->second);
	}
	std::stable_sort(items.begin(), items.end(), [](const std::shared_ptr<Session> &a, const std::shared_ptr<Session> &b) {
		return a->lastActivity > b->lastActivity;
	});
	std::vector<std::string> drop;
	for (size_t i = (size_t)maxSessions_; i < items.size(); i++) drop.push_back(items[i]->id);
	for (const auto &id : drop) forget(id);
}

void SessionManager::forget(const std::string &sessionId) {
	active_.erase(sessionId);
	order_.erase(std::remove(order_.begin(), order_.end(), sessionId), order_.end());
}

} // namespace eliza
