#define ET_CLASS "TimerFactory"
// #define ET_LOG_DEV_LEVEL 3

#include "TimerFactory.hpp"
#include "DepLibUV.hpp"
#include "EasyTimerErrors.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

/* Class methods. */

std::shared_ptr<Timer> TimerFactory::BuildTimer(
  double duration, bool repeats, bool delays, const Callback& callback)
{
	ET_TRACE();

	// This may throw.
	const uint64_t interval = Utils::Time::Seconds2Ms(duration);

	if (!callback)
	{
		ET_THROW_TYPE_ERROR("empty callback");
	}

	// The timer does not exist yet, so its first fire is measured from the
	// end of this call.
	if (!delays)
	{
		ET_DEBUG_TAG(timer, "invoking callback before scheduling");

		callback();
	}

	ET_DEBUG_TAG(
	  timer,
	  "building timer [interval:%" PRIu64 ", repeats:%s, delays:%s]",
	  interval,
	  repeats ? "true" : "false",
	  delays ? "true" : "false");

	return std::make_shared<Timer>(
	  DepLibUV::GetTimeMsCeil() + interval, interval, repeats, [callback](Timer* /*timer*/) {
		  callback();
	  });
}

std::shared_ptr<Timer> TimerFactory::BuildTimer(
  double duration, bool repeats, bool delays, const Timer::Callback& callback)
{
	ET_TRACE();

	// This may throw.
	const uint64_t interval = Utils::Time::Seconds2Ms(duration);

	if (!callback)
	{
		ET_THROW_TYPE_ERROR("empty callback");
	}

	ET_DEBUG_TAG(
	  timer,
	  "building timer [interval:%" PRIu64 ", repeats:%s, delays:%s]",
	  interval,
	  repeats ? "true" : "false",
	  delays ? "true" : "false");

	auto timer =
	  std::make_shared<Timer>(DepLibUV::GetTimeMsCeil() + interval, interval, repeats, callback);

	// The callback gets the timer, so it may stop it right away.
	if (!delays)
	{
		ET_DEBUG_TAG(timer, "invoking callback before scheduling");

		callback(timer.get());
	}

	return timer;
}

std::shared_ptr<Timer> TimerFactory::Delay(double duration, const Callback& callback, RunLoop* loop)
{
	ET_TRACE();

	return BuildAndStart(duration, false, true, callback, loop);
}

std::shared_ptr<Timer> TimerFactory::Delay(
  double duration, const Timer::Callback& callback, RunLoop* loop)
{
	ET_TRACE();

	return BuildAndStart(duration, false, true, callback, loop);
}

std::shared_ptr<Timer> TimerFactory::Interval(double duration, const Callback& callback, RunLoop* loop)
{
	ET_TRACE();

	return BuildAndStart(duration, true, false, callback, loop);
}

std::shared_ptr<Timer> TimerFactory::Interval(
  double duration, const Timer::Callback& callback, RunLoop* loop)
{
	ET_TRACE();

	return BuildAndStart(duration, true, false, callback, loop);
}

std::shared_ptr<Timer> TimerFactory::DelayedInterval(
  double duration, const Callback& callback, RunLoop* loop)
{
	ET_TRACE();

	return BuildAndStart(duration, true, true, callback, loop);
}

std::shared_ptr<Timer> TimerFactory::DelayedInterval(
  double duration, const Timer::Callback& callback, RunLoop* loop)
{
	ET_TRACE();

	return BuildAndStart(duration, true, true, callback, loop);
}

std::shared_ptr<Timer> TimerFactory::BuildAndStart(
  double duration, bool repeats, bool delays, const Callback& callback, RunLoop* loop)
{
	ET_TRACE();

	// Check it before the callback may be invoked.
	if (loop == nullptr)
	{
		ET_THROW_TYPE_ERROR("loop cannot be null");
	}

	auto timer = BuildTimer(duration, repeats, delays, callback);

	timer->Start(loop);

	return timer;
}

std::shared_ptr<Timer> TimerFactory::BuildAndStart(
  double duration, bool repeats, bool delays, const Timer::Callback& callback, RunLoop* loop)
{
	ET_TRACE();

	// Check it before the callback may be invoked.
	if (loop == nullptr)
	{
		ET_THROW_TYPE_ERROR("loop cannot be null");
	}

	auto timer = BuildTimer(duration, repeats, delays, callback);

	timer->Start(loop);

	return timer;
}
