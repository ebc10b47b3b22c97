#define ET_CLASS "TimerHandle"
// #define ET_LOG_DEV_LEVEL 3

#include "handles/TimerHandle.hpp"
#include "EasyTimerErrors.hpp"
#include "Logger.hpp"

/* Static methods for UV callbacks. */

inline static void onTimer(uv_timer_t* handle)
{
	static_cast<TimerHandle*>(handle->data)->OnUvTimer();
}

inline static void onCloseTimer(uv_handle_t* handle)
{
	delete reinterpret_cast<uv_timer_t*>(handle);
}

/* Instance methods. */

TimerHandle::TimerHandle(Listener* listener, uv_loop_t* loop)
  : listener(listener), uvHandle(new uv_timer_t)
{
	ET_TRACE();

	this->uvHandle->data = static_cast<void*>(this);

	const int err = uv_timer_init(loop, this->uvHandle);

	if (err != 0)
	{
		delete this->uvHandle;
		this->uvHandle = nullptr;

		ET_THROW_ERROR("uv_timer_init() failed: %s", uv_strerror(err));
	}
}

TimerHandle::~TimerHandle()
{
	ET_TRACE();

	if (!this->closed)
	{
		Close();
	}
}

void TimerHandle::Close()
{
	ET_TRACE();

	if (this->closed)
	{
		return;
	}

	this->closed = true;

	uv_close(reinterpret_cast<uv_handle_t*>(this->uvHandle), static_cast<uv_close_cb>(onCloseTimer));
}

void TimerHandle::Start(uint64_t timeout)
{
	ET_TRACE();

	if (this->closed)
	{
		ET_THROW_ERROR("closed");
	}

	this->timeout = timeout;

	if (uv_is_active(reinterpret_cast<uv_handle_t*>(this->uvHandle)) != 0)
	{
		Stop();
	}

	const int err = uv_timer_start(this->uvHandle, static_cast<uv_timer_cb>(onTimer), timeout, 0u);

	if (err != 0)
	{
		ET_THROW_ERROR("uv_timer_start() failed: %s", uv_strerror(err));
	}
}

void TimerHandle::Stop()
{
	ET_TRACE();

	if (this->closed)
	{
		ET_THROW_ERROR("closed");
	}

	const int err = uv_timer_stop(this->uvHandle);

	if (err != 0)
	{
		ET_THROW_ERROR("uv_timer_stop() failed: %s", uv_strerror(err));
	}
}

void TimerHandle::SetReferenced(bool referenced)
{
	ET_TRACE();

	if (this->closed)
	{
		ET_THROW_ERROR("closed");
	}

	if (referenced)
	{
		uv_ref(reinterpret_cast<uv_handle_t*>(this->uvHandle));
	}
	else
	{
		uv_unref(reinterpret_cast<uv_handle_t*>(this->uvHandle));
	}
}

inline void TimerHandle::OnUvTimer()
{
	ET_TRACE();

	// Notify the listener.
	this->listener->OnTimer(this);
}
