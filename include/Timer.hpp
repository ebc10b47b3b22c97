#ifndef ET_TIMER_HPP
#define ET_TIMER_HPP

#include "common.hpp"

class RunLoop;

/**
 * A callback scheduled on a RunLoop, once or at a fixed period.
 *
 * Timers are created by TimerFactory and must be owned by a std::shared_ptr.
 * A RunLoop only keeps a weak reference to the timers attached to it, so
 * releasing the last owner stops the timer as well.
 *
 * Not thread safe. A timer must be started, stopped and fired in the thread
 * running the loop it is attached to.
 */
class Timer : public std::enable_shared_from_this<Timer>
{
public:
	using Callback = std::function<void(Timer* timer)>;

public:
	Timer(uint64_t fireTime, uint64_t interval, bool repeats, Callback callback);
	Timer& operator=(const Timer&) = delete;
	Timer(const Timer&)            = delete;
	~Timer();

public:
	// Attaches the timer to the given loop (default mode). No-op if the timer
	// is already attached to it or if it has been invalidated.
	void Start(RunLoop* loop);
	// Attaches the timer to the current thread's loop.
	void Start();
	// Invalidates the timer and detaches it from the given loop. Can be called
	// from within the timer callback. No-op if already stopped.
	void Stop(RunLoop* loop);
	// Invalidates the timer and detaches it from the current thread's loop.
	void Stop();
	void Invalidate();
	// Invokes the callback and schedules the next fire (if any). Called by the
	// RunLoop once the fire time is reached.
	void Fire();
	bool IsValid() const
	{
		return this->valid;
	}
	bool IsRepeating() const
	{
		// A zero interval means no repetition.
		return this->repeats && this->interval != 0u;
	}
	uint64_t GetFireTime() const
	{
		return this->fireTime;
	}
	uint64_t GetInterval() const
	{
		return this->interval;
	}
	uint64_t GetFireCount() const
	{
		return this->fireCount;
	}

private:
	void ScheduleNextFire();

private:
	// Passed by argument.
	Callback callback;
	// Absolute time (DepLibUV::GetTimeMs()) of the next fire.
	uint64_t fireTime{ 0u };
	uint64_t interval{ 0u };
	bool repeats{ false };
	// Others.
	bool valid{ true };
	uint64_t fireCount{ 0u };
};

#endif
