#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "engine.hpp"

namespace eliza {

using json = nlohmann::json;

// One conversation. Lock mu around every call into engine.
struct Session {
	Session(std::string sid, Engine e) : id(std::move(sid)), engine(std::move(e)) {}

	const std::string id;
	Engine engine;
	std::mutex mu;
	std::int64_t createdAt{0};
	std::int64_t lastActivity{0};
	int count{0};
};

class SessionManager {
public:
	using EngineFactory = std::function<Engine()>;

	SessionManager(EngineFactory factory, int idleMs = 10 * 60 * 1000, int maxSessions = 200)
		: factory_(std::move(factory)), idleMs_(idleMs), maxSessions_(std::max(1, maxSessions)) {}

	// Returns the live session for sessionId, or a fresh one (with a new id
	// when sessionId is empty or unknown).
	std::shared_ptr<Session> ensure(const std::string &sessionId);
	std::shared_ptr<Session> find(const std::string &sessionId) const;
	bool reset(const std::string &sessionId);
	bool remove(const std::string &sessionId);

	// Drops sessions idle for longer than idleMs at time now. Returns how many.
	int expireIdle(std::int64_t now);
	std::size_t size() const;
	json exportSessions() const;

	static std::int64_t nowMs();

private:
	EngineFactory factory_;
	int idleMs_{10 * 60 * 1000};
	int maxSessions_{200};
	mutable std::mutex mu_;
	std::unordered_map<std::string, std::shared_ptr<Session>> active_;
	std::vector<std::string> order_;

	std::string newId() const;
	void truncate();
	void forget(const std::string &sessionId);
};

} // namespace eliza
