#ifndef ET_DEP_LIBUV_HPP
#define ET_DEP_LIBUV_HPP

#include "common.hpp"
#include <uv.h>

class DepLibUV
{
public:
	static void ClassInit();
	static void ClassDestroy();
	static void PrintVersion();
	static uv_loop_t* GetLoop()
	{
		return DepLibUV::loop;
	}
	// Monotonic clock all timer fire times are expressed in.
	static uint64_t GetTimeMs()
	{
		return static_cast<uint64_t>(uv_hrtime() / 1000000u);
	}
	// Rounded up. A fire time of GetTimeMsCeil() + interval is never reached
	// (GetTimeMs() >= fire time) before interval ms have elapsed.
	static uint64_t GetTimeMsCeil()
	{
		return static_cast<uint64_t>((uv_hrtime() + 999999u) / 1000000u);
	}
	static uint64_t GetTimeUs()
	{
		return static_cast<uint64_t>(uv_hrtime() / 1000u);
	}

private:
	thread_local static uv_loop_t* loop;
};

#endif
