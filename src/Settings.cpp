#define ET_CLASS "Settings"
// #define ET_LOG_DEV_LEVEL 3

#include "Settings.hpp"
#include "EasyTimerErrors.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <cctype>   // isprint()
#include <iterator> // std::ostream_iterator
#include <mutex>
#include <sstream> // std::ostringstream
#include <stdexcept>
extern "C"
{
#include <getopt.h>
}

/* Static. */

static std::mutex GlobalSyncMutex;

/* Class variables. */

thread_local struct Settings::Configuration Settings::configuration;
// clang-format off
absl::flat_hash_map<std::string, LogLevel> Settings::String2LogLevel =
{
	{ "debug", LogLevel::LOG_DEBUG },
	{ "warn",  LogLevel::LOG_WARN  },
	{ "error", LogLevel::LOG_ERROR },
	{ "none",  LogLevel::LOG_NONE  }
};
absl::flat_hash_map<LogLevel, std::string> Settings::LogLevel2String =
{
	{ LogLevel::LOG_DEBUG, "debug" },
	{ LogLevel::LOG_WARN,  "warn"  },
	{ LogLevel::LOG_ERROR, "error" },
	{ LogLevel::LOG_NONE,  "none"  }
};
absl::flat_hash_map<std::string, Settings::Policy> Settings::String2Policy =
{
	{ "delay",           Settings::Policy::DELAY            },
	{ "interval",        Settings::Policy::INTERVAL         },
	{ "delayedinterval", Settings::Policy::DELAYED_INTERVAL }
};
absl::flat_hash_map<Settings::Policy, std::string> Settings::Policy2String =
{
	{ Settings::Policy::DELAY,            "delay"           },
	{ Settings::Policy::INTERVAL,         "interval"        },
	{ Settings::Policy::DELAYED_INTERVAL, "delayedInterval" }
};
// clang-format on

/* Class methods. */

void Settings::SetConfiguration(int argc, char* argv[])
{
	ET_TRACE();

	/* Variables for getopt. */

	int c;
	int optionIdx{ 0 };
	// clang-format off
	struct option options[] =
	{
		{ "logLevel", optional_argument, nullptr, 'l' },
		{ "logTags",  optional_argument, nullptr, 't' },
		{ "policy",   optional_argument, nullptr, 'p' },
		{ "duration", optional_argument, nullptr, 'd' },
		{ "fires",    optional_argument, nullptr, 'f' },
		{ nullptr,    0,                 nullptr,  0  }
	};
	// clang-format on
	std::string stringValue;
	std::vector<std::string> logTags;

	/* Parse command line options. */

	// getopt_long_only() is not thread-safe
	const std::lock_guard<std::mutex> lock(GlobalSyncMutex);

	optind = 1; // Set explicitly, otherwise subsequent runs will fail.
	opterr = 0; // Don't allow getopt to print error messages.

	while ((c = getopt_long_only(argc, argv, "", options, &optionIdx)) != -1)
	{
		if (!optarg && c != '?' && c != ':')
		{
			ET_THROW_TYPE_ERROR("missing value in command line argument in option '%c'", c);
		}

		switch (c)
		{
			case 'l':
			{
				stringValue = std::string(optarg);
				SetLogLevel(stringValue);

				break;
			}

			case 't':
			{
				stringValue = std::string(optarg);
				logTags.push_back(stringValue);

				break;
			}

			case 'p':
			{
				stringValue = std::string(optarg);
				SetPolicy(stringValue);

				break;
			}

			case 'd':
			{
				double duration{ 0 };

				try
				{
					size_t parsed{ 0 };

					stringValue = std::string(optarg);
					duration    = std::stod(stringValue, &parsed);

					if (parsed != stringValue.size())
					{
						ET_THROW_TYPE_ERROR("invalid value '%s' for duration", optarg);
					}
				}
				catch (const std::logic_error& error)
				{
					ET_THROW_TYPE_ERROR("invalid value '%s' for duration: %s", optarg, error.what());
				}

				if (!Utils::Time::IsValidDuration(duration))
				{
					ET_THROW_TYPE_ERROR("duration must be a finite non negative number of seconds");
				}

				Settings::configuration.duration = duration;

				break;
			}

			case 'f':
			{
				unsigned long fires{ 0u };

				try
				{
					fires = std::stoul(optarg);
				}
				catch (const std::logic_error& error)
				{
					ET_THROW_TYPE_ERROR("invalid value '%s' for fires: %s", optarg, error.what());
				}

				if (fires == 0u || fires > UINT32_MAX)
				{
					ET_THROW_TYPE_ERROR("fires must be between 1 and %" PRIu32, UINT32_MAX);
				}

				Settings::configuration.fires = static_cast<uint32_t>(fires);

				break;
			}

			// Invalid option.
			case '?':
			{
				if (isprint(optopt) != 0)
				{
					ET_THROW_TYPE_ERROR("invalid option '-%c'", (char)optopt);
				}
				else
				{
					ET_THROW_TYPE_ERROR("unknown long option given as argument");
				}
			}

			// Valid option, but it requires and argument that is not given.
			case ':':
			{
				ET_THROW_TYPE_ERROR("option '%c' requires an argument", (char)optopt);
			}

			// This should never happen.
			default:
			{
				ET_THROW_TYPE_ERROR("'default' should never happen");
			}
		}
	}

	/* Post configuration. */

	// Set logTags.
	if (!logTags.empty())
	{
		Settings::SetLogTags(logTags);
	}
}

void Settings::PrintConfiguration()
{
	ET_TRACE();

	std::vector<std::string> logTags;
	std::ostringstream logTagsStream;

	if (Settings::configuration.logTags.info)
	{
		logTags.emplace_back("info");
	}
	if (Settings::configuration.logTags.timer)
	{
		logTags.emplace_back("timer");
	}
	if (Settings::configuration.logTags.loop)
	{
		logTags.emplace_back("loop");
	}

	if (!logTags.empty())
	{
		std::copy(
		  logTags.begin(), logTags.end() - 1, std::ostream_iterator<std::string>(logTagsStream, ","));
		logTagsStream << logTags.back();
	}

	ET_DEBUG_TAG(info, "<configuration>");

	ET_DEBUG_TAG(
	  info, "  logLevel: %s", Settings::LogLevel2String[Settings::configuration.logLevel].c_str());
	ET_DEBUG_TAG(info, "  logTags: %s", logTagsStream.str().c_str());
	ET_DEBUG_TAG(
	  info, "  policy: %s", Settings::Policy2String[Settings::configuration.policy].c_str());
	ET_DEBUG_TAG(info, "  duration: %.3f", Settings::configuration.duration);
	ET_DEBUG_TAG(info, "  fires: %" PRIu32, Settings::configuration.fires);

	ET_DEBUG_TAG(info, "</configuration>");
}

void Settings::SetLogLevel(std::string& level)
{
	ET_TRACE();

	// Lowcase given level.
	Utils::String::ToLowerCase(level);

	if (Settings::String2LogLevel.find(level) == Settings::String2LogLevel.end())
	{
		ET_THROW_TYPE_ERROR("invalid value '%s' for logLevel", level.c_str());
	}

	Settings::configuration.logLevel = Settings::String2LogLevel[level];
}

void Settings::SetLogTags(const std::vector<std::string>& tags)
{
	ET_TRACE();

	// Reset logTags.
	struct LogTags newLogTags;

	for (const auto& tag : tags)
	{
		if (tag == "info")
		{
			newLogTags.info = true;
		}
		else if (tag == "timer")
		{
			newLogTags.timer = true;
		}
		else if (tag == "loop")
		{
			newLogTags.loop = true;
		}
	}

	Settings::configuration.logTags = newLogTags;
}

void Settings::SetPolicy(std::string& policy)
{
	ET_TRACE();

	Utils::String::ToLowerCase(policy);

	auto it = Settings::String2Policy.find(policy);

	if (it == Settings::String2Policy.end())
	{
		ET_THROW_TYPE_ERROR("invalid value '%s' for policy", policy.c_str());
	}

	Settings::configuration.policy = it->second;
}
