#include "common.hpp"
#include "EasyTimerErrors.hpp"
#include "Logger.hpp"
#include "Settings.hpp"
#include "TimerFactory.hpp"
#include <catch2/catch.hpp>
#include <string>
#include <vector>

class LoggerListener : public Logger::Listener
{
public:
	void OnLog(const char* line, size_t len) override
	{
		this->lines.emplace_back(line, len);
	}

	bool HasLine(char level, const std::string& text) const
	{
		for (const auto& line : this->lines)
		{
			if (line[0] == level && line.find(text) != std::string::npos)
			{
				return true;
			}
		}

		return false;
	}

public:
	std::vector<std::string> lines;
};

SCENARIO("Logger", "[logger]")
{
	const auto savedConfiguration = Settings::configuration;
	LoggerListener listener;

	Logger::ClassInit(&listener);

	SECTION("debug lines need the debug level and their tag")
	{
		Settings::configuration.logLevel      = LogLevel::LOG_DEBUG;
		Settings::configuration.logTags       = Settings::LogTags();
		Settings::configuration.logTags.timer = true;

		auto timer = TimerFactory::BuildTimer(0.1, false, true, []() {});

		REQUIRE(listener.HasLine('D', "TimerFactory::BuildTimer() | building timer [interval:100"));

		listener.lines.clear();
		Settings::configuration.logTags.timer = false;

		timer = TimerFactory::BuildTimer(0.1, false, true, []() {});

		REQUIRE(listener.lines.empty());

		Settings::configuration.logTags.timer = true;
		Settings::configuration.logLevel      = LogLevel::LOG_WARN;

		timer = TimerFactory::BuildTimer(0.1, false, true, []() {});

		REQUIRE(listener.lines.empty());
	}

	SECTION("thrown errors are logged at the error level")
	{
		Settings::configuration.logLevel = LogLevel::LOG_ERROR;

		REQUIRE_THROWS_AS(TimerFactory::BuildTimer(-1, false, true, []() {}), EasyTimerTypeError);
		REQUIRE(listener.HasLine('E', "throwing EasyTimerTypeError: invalid duration"));

		listener.lines.clear();
		Settings::configuration.logLevel = LogLevel::LOG_NONE;

		REQUIRE_THROWS_AS(TimerFactory::BuildTimer(-1, false, true, []() {}), EasyTimerTypeError);
		REQUIRE(listener.lines.empty());
	}

	SECTION("configuration is printed under the info tag")
	{
		Settings::configuration.logLevel = LogLevel::LOG_NONE;

		Settings::PrintConfiguration();

		// Configuration lines are debug lines.
		REQUIRE(listener.lines.empty());

		Settings::configuration.logLevel     = LogLevel::LOG_DEBUG;
		Settings::configuration.logTags.info = true;

		Settings::PrintConfiguration();

		REQUIRE(listener.HasLine('D', "<configuration>"));
		REQUIRE(listener.HasLine('D', "logLevel: debug"));
	}

	Logger::ClassInit(nullptr);
	Settings::configuration = savedConfiguration;
}
