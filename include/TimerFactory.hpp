#ifndef ET_TIMER_FACTORY_HPP
#define ET_TIMER_FACTORY_HPP

#include "common.hpp"
#include "RunLoop.hpp"
#include "Timer.hpp"

/**
 * Builds timers out of a duration (in seconds), a firing policy and a
 * callback.
 *
 * Delay(), Interval() and DelayedInterval() return timers that are already
 * started. Every operation comes in two flavors: a callback taking no
 * arguments and a callback receiving the Timer itself (so it can stop it).
 *
 * Invalid durations (negative, infinite or NaN) and empty callbacks throw
 * EasyTimerTypeError before anything is invoked or scheduled.
 */
class TimerFactory
{
public:
	using Callback = std::function<void()>;

public:
	/**
	 * Creates a timer (not started) firing `duration` seconds from now, and
	 * every `duration` seconds after that if `repeats` is true.
	 *
	 * If `delays` is false the callback is also invoked synchronously, before
	 * this method returns. With repeats=false and delays=false this means the
	 * callback runs now and once more after `duration`.
	 */
	static std::shared_ptr<Timer> BuildTimer(
	  double duration, bool repeats, bool delays, const Callback& callback);
	static std::shared_ptr<Timer> BuildTimer(
	  double duration, bool repeats, bool delays, const Timer::Callback& callback);

	// Fires once after `duration`.
	static std::shared_ptr<Timer> Delay(double duration, const Callback& callback, RunLoop* loop);
	static std::shared_ptr<Timer> Delay(
	  double duration, const Timer::Callback& callback, RunLoop* loop);
	static std::shared_ptr<Timer> Delay(double duration, const Callback& callback)
	{
		return Delay(duration, callback, RunLoop::GetCurrent());
	}
	static std::shared_ptr<Timer> Delay(double duration, const Timer::Callback& callback)
	{
		return Delay(duration, callback, RunLoop::GetCurrent());
	}

	// Fires now (synchronously) and then every `duration`.
	static std::shared_ptr<Timer> Interval(double duration, const Callback& callback, RunLoop* loop);
	static std::shared_ptr<Timer> Interval(
	  double duration, const Timer::Callback& callback, RunLoop* loop);
	static std::shared_ptr<Timer> Interval(double duration, const Callback& callback)
	{
		return Interval(duration, callback, RunLoop::GetCurrent());
	}
	static std::shared_ptr<Timer> Interval(double duration, const Timer::Callback& callback)
	{
		return Interval(duration, callback, RunLoop::GetCurrent());
	}

	// Fires every `duration`, the first time after `duration`.
	static std::shared_ptr<Timer> DelayedInterval(
	  double duration, const Callback& callback, RunLoop* loop);
	static std::shared_ptr<Timer> DelayedInterval(
	  double duration, const Timer::Callback& callback, RunLoop* loop);
	static std::shared_ptr<Timer> DelayedInterval(double duration, const Callback& callback)
	{
		return DelayedInterval(duration, callback, RunLoop::GetCurrent());
	}
	static std::shared_ptr<Timer> DelayedInterval(double duration, const Timer::Callback& callback)
	{
		return DelayedInterval(duration, callback, RunLoop::GetCurrent());
	}

private:
	static std::shared_ptr<Timer> BuildAndStart(
	  double duration, bool repeats, bool delays, const Callback& callback, RunLoop* loop);
	static std::shared_ptr<Timer> BuildAndStart(
	  double duration, bool repeats, bool delays, const Timer::Callback& callback, RunLoop* loop);
};

#endif
