#define ET_CLASS "DepLibUV"
// #define ET_LOG_DEV_LEVEL 3

#include "DepLibUV.hpp"
#include "Logger.hpp"

/* Static variables. */

thread_local uv_loop_t* DepLibUV::loop{ nullptr };

/* Static methods for UV callbacks. */

inline static void onClose(uv_handle_t* handle)
{
	delete handle;
}

inline static void onWalk(uv_handle_t* handle, void* /*arg*/)
{
	ET_ERROR_STD(
	  "alive UV handle found (this shouldn't happen) [type:%s, active:%d, closing:%d, has_ref:%d]",
	  uv_handle_type_name(handle->type),
	  uv_is_active(handle),
	  uv_is_closing(handle),
	  uv_has_ref(handle));

	if (!uv_is_closing(handle))
		uv_close(handle, onClose);
}

/* Static methods. */

void DepLibUV::ClassInit()
{
	ET_TRACE();

	DepLibUV::loop = new uv_loop_t;

	int err = uv_loop_init(DepLibUV::loop);

	if (err != 0)
		ET_ABORT("libuv loop initialization failed: %s", uv_strerror(err));
}

void DepLibUV::ClassDestroy()
{
	ET_TRACE();

	// Every timer handle must have been closed by RunLoop::ClassDestroy() at
	// this point. Pending close callbacks are run by the loop below.

	int err;

	uv_stop(DepLibUV::loop);

	// Let pending close callbacks run before looking for leaked handles.
	uv_run(DepLibUV::loop, UV_RUN_NOWAIT);
	uv_walk(DepLibUV::loop, onWalk, nullptr);

	while (true)
	{
		err = uv_loop_close(DepLibUV::loop);

		if (err != UV_EBUSY)
			break;

		uv_run(DepLibUV::loop, UV_RUN_NOWAIT);
	}

	if (err != 0)
		ET_ERROR_STD("failed to close libuv loop: %s", uv_err_name(err));

	delete DepLibUV::loop;
	DepLibUV::loop = nullptr;
}

void DepLibUV::PrintVersion()
{
	ET_TRACE();

	ET_DEBUG_TAG(info, "libuv version: \"%s\"", uv_version_string());
}
