#define ET_CLASS "easytimer"
// #define ET_LOG_DEV_LEVEL 3

#include "common.hpp"
#include "DepLibUV.hpp"
#include "EasyTimerErrors.hpp"
#include "Logger.hpp"
#include "RunLoop.hpp"
#include "Settings.hpp"
#include "TimerFactory.hpp"
#include "Utils.hpp"

static std::shared_ptr<Timer> scheduleTimer(RunLoop* loop, uint64_t startTimeMs);

int main(int argc, char* argv[])
{
	DepLibUV::ClassInit();

	try
	{
		Settings::SetConfiguration(argc, argv);
	}
	catch (const EasyTimerTypeError& error)
	{
		ET_ERROR_STD("settings error: %s", error.what());

		DepLibUV::ClassDestroy();

		// 42 is a custom exit code to notify "settings error".
		return 42;
	}

	Settings::PrintConfiguration();
	DepLibUV::PrintVersion();

	try
	{
		RunLoop::ClassInit();

		auto* loop = RunLoop::GetCurrent();
		auto timer = scheduleTimer(loop, DepLibUV::GetTimeMs());

		loop->Run();

		ET_DEBUG_TAG(info, "loop ended [fireCount:%" PRIu64 "]", timer->GetFireCount());

		RunLoop::ClassDestroy();
		DepLibUV::ClassDestroy();

		return 0;
	}
	catch (const EasyTimerError& error)
	{
		ET_ERROR_STD("failure exit: %s", error.what());

		RunLoop::ClassDestroy();
		DepLibUV::ClassDestroy();

		// 40 is a custom exit code to notify "unknown error".
		return 40;
	}
}

static std::shared_ptr<Timer> scheduleTimer(RunLoop* loop, uint64_t startTimeMs)
{
	const double duration = Settings::configuration.duration;
	const uint32_t fires  = Settings::configuration.fires;
	// Includes the synchronous call of the interval policy.
	auto calls = std::make_shared<uint32_t>(0u);

	Timer::Callback callback = [loop, fires, calls, startTimeMs](Timer* timer) {
		++(*calls);

		ET_DUMP(
		  "call %" PRIu32 " at +%.3fs",
		  *calls,
		  Utils::Time::Ms2Seconds(DepLibUV::GetTimeMs() - startTimeMs));

		if (*calls >= fires)
		{
			timer->Stop(loop);
		}
	};

	switch (Settings::configuration.policy)
	{
		case Settings::Policy::DELAY:
		{
			return TimerFactory::Delay(duration, callback, loop);
		}

		case Settings::Policy::INTERVAL:
		{
			return TimerFactory::Interval(duration, callback, loop);
		}

		case Settings::Policy::DELAYED_INTERVAL:
		{
			return TimerFactory::DelayedInterval(duration, callback, loop);
		}
	}

	ET_THROW_ERROR("unknown policy");
}
