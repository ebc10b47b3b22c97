#define ET_CLASS "Timer"
// #define ET_LOG_DEV_LEVEL 3

#include "Timer.hpp"
#include "DepLibUV.hpp"
#include "EasyTimerErrors.hpp"
#include "Logger.hpp"
#include "RunLoop.hpp"
#include <stdexcept>

/* Instance methods. */

Timer::Timer(uint64_t fireTime, uint64_t interval, bool repeats, Callback callback)
  : callback(std::move(callback)), fireTime(fireTime), interval(interval), repeats(repeats)
{
	ET_TRACE();

	if (!this->callback)
	{
		ET_THROW_TYPE_ERROR("empty callback");
	}
}

Timer::~Timer()
{
	ET_TRACE();
}

void Timer::Start(RunLoop* loop)
{
	ET_TRACE();

	if (loop == nullptr)
	{
		ET_THROW_TYPE_ERROR("loop cannot be null");
	}

	if (!this->valid)
	{
		ET_DEBUG_TAG(timer, "timer already invalidated, ignoring start");

		return;
	}

	loop->AddTimer(shared_from_this(), RunLoop::Mode::DEFAULT);
}

void Timer::Start()
{
	ET_TRACE();

	Start(RunLoop::GetCurrent());
}

void Timer::Stop(RunLoop* loop)
{
	ET_TRACE();

	if (loop == nullptr)
	{
		ET_THROW_TYPE_ERROR("loop cannot be null");
	}

	Invalidate();

	loop->RemoveTimer(this, RunLoop::Mode::DEFAULT);
}

void Timer::Stop()
{
	ET_TRACE();

	Stop(RunLoop::GetCurrent());
}

void Timer::Invalidate()
{
	ET_TRACE();

	if (!this->valid)
	{
		return;
	}

	ET_DEBUG_TAG(timer, "invalidating timer [fireCount:%" PRIu64 "]", this->fireCount);

	this->valid = false;
}

void Timer::Fire()
{
	ET_TRACE();

	if (!this->valid)
	{
		return;
	}

	this->fireCount++;

	ET_DEBUG_TAG(
	  timer,
	  "firing [fireTime:%" PRIu64 ", fireCount:%" PRIu64 ", repeating:%s]",
	  this->fireTime,
	  this->fireCount,
	  IsRepeating() ? "true" : "false");

	try
	{
		this->callback(this);
	}
	catch (const std::exception& /*error*/)
	{
		// Advance the schedule before propagating.
		ScheduleNextFire();

		throw;
	}

	ScheduleNextFire();
}

void Timer::ScheduleNextFire()
{
	ET_TRACE();

	// Stopped from within the callback.
	if (!this->valid)
	{
		return;
	}

	if (!IsRepeating())
	{
		Invalidate();

		return;
	}

	const uint64_t now = DepLibUV::GetTimeMs();

	// Period pacing: next fire is relative to the previous fire time, not to
	// the time the callback ran.
	this->fireTime += this->interval;

	if (this->fireTime < now)
	{
		const uint64_t missed = (now - this->fireTime + this->interval - 1) / this->interval;

		this->fireTime += missed * this->interval;

		ET_WARN_TAG(timer, "loop fell behind, %" PRIu64 " fires skipped", missed);
	}
}
