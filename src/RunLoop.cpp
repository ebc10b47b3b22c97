#define ET_CLASS "RunLoop"
// #define ET_LOG_DEV_LEVEL 3

#include "RunLoop.hpp"
#include "DepLibUV.hpp"
#include "EasyTimerErrors.hpp"
#include "Logger.hpp"
#include <stdexcept>

/* Class variables. */

thread_local RunLoop* RunLoop::current{ nullptr };

/* Registration methods. */

RunLoop::Registration::Registration(RunLoop* runLoop, const std::shared_ptr<Timer>& timer)
  : runLoop(runLoop), key(timer.get()), timer(timer)
{
	ET_TRACE();

	this->timerHandle = new TimerHandle(this, runLoop->uvLoop);
}

RunLoop::Registration::~Registration()
{
	ET_TRACE();

	delete this->timerHandle;
}

inline void RunLoop::Registration::OnTimer(TimerHandle* timerHandle)
{
	ET_TRACE();

	if (timerHandle == this->timerHandle)
		this->runLoop->OnRegistrationTimer(this);
}

/* Class methods. */

void RunLoop::ClassInit()
{
	ET_TRACE();

	if (RunLoop::current != nullptr)
	{
		ET_THROW_ERROR("RunLoop already initialized in this thread");
	}

	RunLoop::current = new RunLoop(DepLibUV::GetLoop());
}

void RunLoop::ClassDestroy()
{
	ET_TRACE();

	delete RunLoop::current;
	RunLoop::current = nullptr;
}

RunLoop* RunLoop::GetCurrent()
{
	if (RunLoop::current == nullptr)
	{
		ET_THROW_ERROR("no RunLoop in this thread, RunLoop::ClassInit() not called");
	}

	return RunLoop::current;
}

/* Instance methods. */

RunLoop::RunLoop(uv_loop_t* uvLoop) : uvLoop(uvLoop)
{
	ET_TRACE();

	if (this->uvLoop == nullptr)
	{
		ET_THROW_TYPE_ERROR("uvLoop cannot be null");
	}
}

RunLoop::~RunLoop()
{
	ET_TRACE();

	for (auto& kv : this->registrations)
	{
		auto* registration = kv.second;

		delete registration;
	}
	this->registrations.clear();
}

void RunLoop::AddTimer(const std::shared_ptr<Timer>& timer, Mode mode)
{
	ET_TRACE();

	if (!timer)
	{
		ET_THROW_TYPE_ERROR("timer cannot be null");
	}

	if (!timer->IsValid())
	{
		ET_DEBUG_TAG(loop, "timer is invalidated, not adding it");

		return;
	}

	auto it = this->registrations.find(timer.get());

	// A previous timer that lived at the same address and was released by its
	// owner before its registration noticed it.
	if (it != this->registrations.end() && it->second->timer.expired())
	{
		Release(timer.get());

		it = this->registrations.end();
	}

	Registration* registration;
	const bool isNew = it == this->registrations.end();

	if (isNew)
	{
		registration = new Registration(this, timer);

		this->registrations[timer.get()] = registration;
	}
	else
	{
		registration = it->second;
	}

	bool& modeFlag = registration->GetModeFlag(mode);

	if (modeFlag)
	{
		ET_DEBUG_TAG(loop, "timer already added for this mode");

		return;
	}

	modeFlag = true;

	registration->timerHandle->SetReferenced(registration->defaultMode);

	if (isNew)
	{
		Arm(registration, timer.get());
	}

	ET_DEBUG_TAG(
	  loop,
	  "timer added [mode:%s, fireTime:%" PRIu64 ", interval:%" PRIu64 "]",
	  mode == Mode::DEFAULT ? "default" : "background",
	  timer->GetFireTime(),
	  timer->GetInterval());
}

void RunLoop::RemoveTimer(const Timer* timer, Mode mode)
{
	ET_TRACE();

	auto it = this->registrations.find(timer);

	if (it == this->registrations.end())
	{
		ET_DEBUG_TAG(loop, "timer not added, nothing to remove");

		return;
	}

	auto* registration = it->second;

	registration->GetModeFlag(mode) = false;

	if (!registration->IsAttached() || !timer->IsValid())
	{
		Release(timer);

		return;
	}

	registration->timerHandle->SetReferenced(registration->defaultMode);
}

bool RunLoop::ContainsTimer(const Timer* timer, Mode mode) const
{
	auto it = this->registrations.find(timer);

	if (it == this->registrations.end())
	{
		return false;
	}

	auto* registration = it->second;

	return mode == Mode::DEFAULT ? registration->defaultMode : registration->backgroundMode;
}

void RunLoop::Run()
{
	ET_TRACE();

	ET_DEBUG_TAG(loop, "running loop [timers:%zu]", this->registrations.size());

	const int ret = uv_run(this->uvLoop, UV_RUN_DEFAULT);

	ET_DEBUG_TAG(loop, "loop ended [ret:%d, timers:%zu]", ret, this->registrations.size());
}

void RunLoop::Arm(Registration* registration, const Timer* timer)
{
	ET_TRACE();

	const uint64_t now      = DepLibUV::GetTimeMs();
	const uint64_t fireTime = timer->GetFireTime();
	const uint64_t timeout  = fireTime > now ? fireTime - now : 0u;

	ET_DEBUG_DEV("arming timer [timeout:%" PRIu64 "]", timeout);

	registration->timerHandle->Start(timeout);
}

void RunLoop::Release(const Timer* timer)
{
	ET_TRACE();

	auto it = this->registrations.find(timer);

	if (it == this->registrations.end())
	{
		return;
	}

	auto* registration = it->second;

	this->registrations.erase(it);

	// Closes the TimerHandle.
	delete registration;
}

inline void RunLoop::OnRegistrationTimer(Registration* registration)
{
	ET_TRACE();

	const Timer* key = registration->key;
	// Keep the timer alive while it fires, even if its owner releases it from
	// within the callback.
	auto timer = registration->timer.lock();

	if (!timer)
	{
		ET_DEBUG_TAG(loop, "timer released by its owner, removing it");

		Release(key);

		return;
	}

	if (!timer->IsValid())
	{
		ET_DEBUG_TAG(loop, "timer invalidated, removing it");

		Release(key);

		return;
	}

	// libuv measures timeouts against its cached loop time, which may lag
	// behind our clock.
	if (DepLibUV::GetTimeMs() < timer->GetFireTime())
	{
		ET_DEBUG_DEV("woke up before fire time, re-arming");

		Arm(registration, timer.get());

		return;
	}

	try
	{
		timer->Fire();
	}
	catch (const std::exception& error)
	{
		ET_ERROR("timer callback threw: %s", error.what());
	}

	// The callback may have removed the timer (and deleted the registration).
	auto it = this->registrations.find(key);

	if (it == this->registrations.end())
	{
		return;
	}

	if (!timer->IsValid())
	{
		Release(key);

		return;
	}

	Arm(it->second, timer.get());
}
