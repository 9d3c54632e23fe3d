#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace eliza {

struct Config {
	std::filesystem::path scriptPath;
	std::uint32_t seed{0};
	int memorySize{0};
	int maxInputChars{4096};
	bool debug{false};
	std::string host{"127.0.0.1"};
	int port{5080};
	int threads{1};
	int sessionIdleMs{10 * 60 * 1000};
	int maxSessions{200};
};

std::string getEnv(const std::string &key, const std::string &fallback = "");
bool boolFrom(const std::string &value, bool fallback = true);
double numberOr(const std::string &s, double fallback);
// Clamps before converting, so out-of-range values never reach the cast.
int intIn(double v, int lo, int hi);
std::map<std::string, std::string> parseArgs(int argc, char **argv);

// --key=value arguments first, then ELIZA_* environment variables, then
// defaults. An empty script path means the built-in rule set.
Config loadConfig(int argc, char **argv);

} // namespace eliza
