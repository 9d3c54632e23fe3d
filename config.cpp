#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>

namespace eliza {

std::string getEnv(const std::string &key, const std::string &fallback) {
	const char *v = std::getenv(key.c_str());
	if (!v) return fallback;
	return std::string(v);
}

bool boolFrom(const std::string &value, bool fallback) {
	std::string v = value;
	std::transform(v.begin(), v.end(), v.begin(), ::tolower);
	if (v.empty()) return fallback;
	return !(v == "0" || v == "false" || v == "off" || v == "no");
}

double numberOr(const std::string &s, double fallback) {
	if (s.empty()) return fallback;
	char *end = nullptr;
	double v = std::strtod(s.c_str(), &end);
	if (end == s.c_str() || *end != '\0') return fallback;
	if (!std::isfinite(v)) return fallback;
	return v;
}

int intIn(double v, int lo, int hi) {
	if (!(v >= lo)) return lo;
	if (v > hi) return hi;
	return (int)v;
}

std::map<std::string, std::string> parseArgs(int argc, char **argv) {
	std::map<std::string, std::string> out;
	for (int i = 1; i < argc; i++) {
		std::string item = argv[i];
		if (item.rfind("--", 0) != 0) continue;
		auto pos = item.find('=');
		if (pos == std::string::npos) {
			out[item.substr(2)] = "true";
		} else {
			out[item.substr(2, pos - 2)] = item.substr(pos + 1);
		}
	}
	return out;
}

Config loadConfig(int argc, char **argv) {
	const auto args = parseArgs(argc, argv);
	auto argOrEnv = [&](const std::string &argKey, const std::string &env, const std::string &def = "") {
		auto it = args.find(argKey);
		if (it != args.end() && !it->second.empty()) return it->second;
		std::string v = getEnv(env);
		if (!v.empty()) return v;
		return def;
	};

	Config c;
	std::string script = argOrEnv("script", "ELIZA_SCRIPT", "");
	if (!script.empty()) c.scriptPath = std::filesystem::absolute(script);
	double seed = numberOr(argOrEnv("seed", "ELIZA_SEED", "0"), 0);
	c.seed = seed <= 0 ? 0u : seed >= (double)UINT32_MAX ? UINT32_MAX : (std::uint32_t)seed;
	c.memorySize = intIn(numberOr(argOrEnv("memory-size", "ELIZA_MEMORY_SIZE", "0"), 0), 0, 100000);
	c.maxInputChars = intIn(numberOr(argOrEnv("max-input", "ELIZA_MAX_INPUT", "4096"), 4096), 16, 16384);
	c.debug = boolFrom(argOrEnv("debug", "ELIZA_DEBUG", "false"), false);
	c.host = argOrEnv("host", "ELIZA_HOST", "127.0.0.1");
	c.port = intIn(numberOr(argOrEnv("port", "ELIZA_PORT", "5080"), 5080), 1, 65535);
	c.threads = intIn(numberOr(argOrEnv("threads", "ELIZA_THREADS", "1"), 1), 1, 256);
	c.sessionIdleMs = intIn(numberOr(argOrEnv("session-idle-ms", "ELIZA_SESSION_IDLE_MS", "600000"), 600000), 1000, INT32_MAX);
	c.maxSessions = intIn(numberOr(argOrEnv("max-sessions", "ELIZA_MAX_SESSIONS", "200"), 200), 1, 1000000);
	return c;
}

} // namespace eliza
