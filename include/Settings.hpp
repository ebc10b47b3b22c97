#ifndef ET_SETTINGS_HPP
#define ET_SETTINGS_HPP

#include "common.hpp"
#include "LogLevel.hpp"
#include <absl/container/flat_hash_map.h>
#include <string>
#include <vector>

class Settings
{
public:
	struct LogTags
	{
		bool info{ false };
		bool timer{ false };
		bool loop{ false };
	};

public:
	// Firing policy run by the easytimer program.
	enum class Policy : uint8_t
	{
		DELAY = 0,
		INTERVAL,
		DELAYED_INTERVAL
	};

public:
	// Struct holding the configuration.
	struct Configuration
	{
		LogLevel logLevel{ LogLevel::LOG_ERROR };
		struct LogTags logTags;
		Policy policy{ Policy::DELAY };
		double duration{ 1.0 };
		uint32_t fires{ 3u };
	};

public:
	static void SetConfiguration(int argc, char* argv[]);
	static void PrintConfiguration();
	static void SetLogLevel(std::string& level);
	static void SetLogTags(const std::vector<std::string>& tags);

private:
	static void SetPolicy(std::string& policy);

public:
	thread_local static struct Configuration configuration;

private:
	static absl::flat_hash_map<std::string, LogLevel> String2LogLevel; // NOLINT(readability-identifier-naming)
	static absl::flat_hash_map<LogLevel, std::string> LogLevel2String; // NOLINT(readability-identifier-naming)
	static absl::flat_hash_map<std::string, Policy> String2Policy;     // NOLINT(readability-identifier-naming)
	static absl::flat_hash_map<Policy, std::string> Policy2String;     // NOLINT(readability-identifier-naming)
};

#endif
