#ifndef ET_TIMER_HANDLE_HPP
#define ET_TIMER_HANDLE_HPP

#include "common.hpp"
#include <uv.h>

// Single native libuv timer bound to a given loop. It is always armed as a
// one-shot timer; repetition is driven by the owner re-arming it.
class TimerHandle
{
public:
	class Listener
	{
	public:
		virtual ~Listener() = default;

	public:
		virtual void OnTimer(TimerHandle* timerHandle) = 0;
	};

public:
	TimerHandle(Listener* listener, uv_loop_t* loop);
	TimerHandle& operator=(const TimerHandle&) = delete;
	TimerHandle(const TimerHandle&)            = delete;
	~TimerHandle();

public:
	void Close();
	void Start(uint64_t timeout);
	void Stop();
	void SetReferenced(bool referenced);
	uint64_t GetTimeout() const
	{
		return this->timeout;
	}
	bool IsActive() const
	{
		return !this->closed && uv_is_active(reinterpret_cast<uv_handle_t*>(this->uvHandle)) != 0;
	}
	bool IsReferenced() const
	{
		return !this->closed && uv_has_ref(reinterpret_cast<uv_handle_t*>(this->uvHandle)) != 0;
	}

	/* Callbacks fired by UV events. */
public:
	void OnUvTimer();

private:
	// Passed by argument.
	Listener* listener{ nullptr };
	// Allocated by this.
	uv_timer_t* uvHandle{ nullptr };
	// Others.
	bool closed{ false };
	uint64_t timeout{ 0u };
};

#endif
