#include "common.hpp"
#include "DepLibUV.hpp"
#include "EasyTimerErrors.hpp"
#include "RunLoop.hpp"
#include "Timer.hpp"
#include "TimerFactory.hpp"
#include "helpers.hpp"
#include <catch2/catch.hpp>
#include <stdexcept>

SCENARIO("Timer lifecycle", "[timer]")
{
	auto* loop = RunLoop::GetCurrent();
	helpers::CallRecorder recorder;

	SECTION("stopping twice is the same as stopping once")
	{
		auto timer = TimerFactory::DelayedInterval(0.02, [&]() { recorder.Record(); }, loop);

		timer->Stop(loop);

		REQUIRE(!timer->IsValid());
		REQUIRE(!loop->ContainsTimer(timer.get()));

		REQUIRE_NOTHROW(timer->Stop(loop));
		REQUIRE(!timer->IsValid());
		REQUIRE(!loop->ContainsTimer(timer.get()));

		loop->Run();

		REQUIRE(recorder.GetCount() == 0);
	}

	SECTION("stopping a timer never started is a no-op")
	{
		auto timer = TimerFactory::BuildTimer(0.02, true, true, [&]() { recorder.Record(); });

		REQUIRE_NOTHROW(timer->Stop(loop));
		REQUIRE(!timer->IsValid());
	}

	SECTION("starting a stopped timer does not attach it")
	{
		auto timer = TimerFactory::BuildTimer(0.01, false, true, [&]() { recorder.Record(); });

		timer->Stop(loop);
		timer->Start(loop);

		REQUIRE(!loop->ContainsTimer(timer.get()));

		loop->Run();

		REQUIRE(recorder.GetCount() == 0);
	}

	SECTION("starting twice attaches the timer once")
	{
		auto timer = TimerFactory::BuildTimer(0.02, false, true, [&]() { recorder.Record(); });
		auto timerCount = loop->GetTimerCount();

		timer->Start(loop);
		timer->Start(loop);

		REQUIRE(loop->GetTimerCount() == timerCount + 1);

		loop->Run();

		REQUIRE(recorder.GetCount() == 1);
	}

	SECTION("Start() and Stop() use the current loop")
	{
		auto timer = TimerFactory::BuildTimer(0.02, true, true, [&]() { recorder.Record(); });

		timer->Start();

		REQUIRE(RunLoop::GetCurrent()->ContainsTimer(timer.get(), RunLoop::Mode::DEFAULT));

		timer->Stop();

		REQUIRE(!RunLoop::GetCurrent()->ContainsTimer(timer.get()));
	}

	SECTION("invalidated timer is dropped by the loop on its next fire time")
	{
		auto timer = TimerFactory::DelayedInterval(0.02, [&]() { recorder.Record(); }, loop);

		timer->Invalidate();

		REQUIRE(loop->ContainsTimer(timer.get()));

		loop->Run();

		REQUIRE(recorder.GetCount() == 0);
		REQUIRE(!loop->ContainsTimer(timer.get()));
	}

	SECTION("releasing the last owner stops the timer")
	{
		auto timer = TimerFactory::DelayedInterval(0.02, [&]() { recorder.Record(); }, loop);
		const Timer* key = timer.get();

		timer.reset();

		loop->Run();

		REQUIRE(recorder.GetCount() == 0);
		REQUIRE(!loop->ContainsTimer(key));
	}

	SECTION("null loop throws")
	{
		auto timer = TimerFactory::BuildTimer(0.02, true, true, [&]() { recorder.Record(); });

		REQUIRE_THROWS_AS(timer->Start(nullptr), EasyTimerTypeError);
		REQUIRE_THROWS_AS(timer->Stop(nullptr), EasyTimerTypeError);
	}
}

SCENARIO("Timer::Fire()", "[timer]")
{
	size_t calls{ 0 };

	SECTION("repeating timer on time moves one period forward")
	{
		const uint64_t fireTime = DepLibUV::GetTimeMs() + 1000;
		auto timer = std::make_shared<Timer>(fireTime, 100, true, [&](Timer* /*t*/) { ++calls; });

		timer->Fire();

		REQUIRE(calls == 1);
		REQUIRE(timer->IsValid());
		REQUIRE(timer->GetFireTime() == fireTime + 100);
	}

	SECTION("repeating timer behind schedule skips missed periods")
	{
		const uint64_t fireTime = DepLibUV::GetTimeMs() - 350;
		auto timer = std::make_shared<Timer>(fireTime, 100, true, [&](Timer* /*t*/) { ++calls; });

		timer->Fire();

		// A single call, next fire time on the first period boundary ahead.
		REQUIRE(calls == 1);
		REQUIRE(timer->GetFireTime() == fireTime + 400);
		REQUIRE(timer->GetFireCount() == 1);
	}

	SECTION("non repeating timer is invalidated after firing")
	{
		auto timer =
		  std::make_shared<Timer>(DepLibUV::GetTimeMs(), 100, false, [&](Timer* /*t*/) { ++calls; });

		timer->Fire();
		timer->Fire();

		REQUIRE(calls == 1);
		REQUIRE(!timer->IsValid());
	}

	SECTION("throwing callback propagates and the schedule still moves on")
	{
		auto timer = std::make_shared<Timer>(
		  DepLibUV::GetTimeMs(), 100, false, [&](Timer* /*t*/) { throw std::runtime_error("boom"); });

		REQUIRE_THROWS_AS(timer->Fire(), std::runtime_error);
		REQUIRE(!timer->IsValid());
	}

	SECTION("empty callback throws")
	{
		REQUIRE_THROWS_AS(
		  std::make_shared<Timer>(DepLibUV::GetTimeMs(), 100, false, Timer::Callback()),
		  EasyTimerTypeError);
	}
}

SCENARIO("Timer callback throwing inside the loop", "[timer][loop]")
{
	auto* loop = RunLoop::GetCurrent();
	size_t calls{ 0 };

	auto timer = TimerFactory::DelayedInterval(
	  0.02,
	  [&](Timer* t) {
		  ++calls;

		  if (calls == 1)
			  throw std::runtime_error("first call fails");

		  if (calls == 3)
			  t->Stop(loop);
	  },
	  loop);

	loop->Run();

	REQUIRE(calls == 3);
	REQUIRE(!timer->IsValid());
}
