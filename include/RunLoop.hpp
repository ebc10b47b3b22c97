#ifndef ET_RUN_LOOP_HPP
#define ET_RUN_LOOP_HPP

#include "common.hpp"
#include "Timer.hpp"
#include "handles/TimerHandle.hpp"
#include <absl/container/flat_hash_map.h>
#include <uv.h>

/**
 * Delivers timer fires from a libuv loop.
 *
 * The loop holds weak references to the attached timers: it invokes them but
 * never keeps them alive. Each attached timer gets its own native TimerHandle,
 * armed as a one-shot for the timer's next fire time.
 */
class RunLoop
{
public:
	enum class Mode : uint8_t
	{
		// The timer keeps the libuv loop alive.
		DEFAULT = 0,
		// The timer fires while the loop runs but does not keep it alive.
		BACKGROUND
	};

private:
	class Registration : public TimerHandle::Listener
	{
	public:
		Registration(RunLoop* runLoop, const std::shared_ptr<Timer>& timer);
		Registration& operator=(const Registration&) = delete;
		Registration(const Registration&)            = delete;
		~Registration() override;

		bool IsAttached() const
		{
			return this->defaultMode || this->backgroundMode;
		}
		bool& GetModeFlag(Mode mode)
		{
			return mode == Mode::DEFAULT ? this->defaultMode : this->backgroundMode;
		}

		/* Pure virtual methods inherited from TimerHandle::Listener. */
	public:
		void OnTimer(TimerHandle* timerHandle) override;

	public:
		// Passed by argument.
		RunLoop* runLoop{ nullptr };
		const Timer* key{ nullptr };
		std::weak_ptr<Timer> timer;
		// Allocated by this.
		TimerHandle* timerHandle{ nullptr };
		// Others.
		bool defaultMode{ false };
		bool backgroundMode{ false };
	};

public:
	static void ClassInit();
	static void ClassDestroy();
	static RunLoop* GetCurrent();

public:
	explicit RunLoop(uv_loop_t* uvLoop);
	RunLoop& operator=(const RunLoop&) = delete;
	RunLoop(const RunLoop&)            = delete;
	~RunLoop();

public:
	void AddTimer(const std::shared_ptr<Timer>& timer, Mode mode);
	void RemoveTimer(const Timer* timer, Mode mode);
	bool ContainsTimer(const Timer* timer) const
	{
		return this->registrations.find(timer) != this->registrations.end();
	}
	bool ContainsTimer(const Timer* timer, Mode mode) const;
	size_t GetTimerCount() const
	{
		return this->registrations.size();
	}
	// Runs the libuv loop until no referenced handle is left.
	void Run();
	uv_loop_t* GetUvLoop() const
	{
		return this->uvLoop;
	}

private:
	void Arm(Registration* registration, const Timer* timer);
	void Release(const Timer* timer);
	void OnRegistrationTimer(Registration* registration);

private:
	// Passed by argument.
	uv_loop_t* uvLoop{ nullptr };
	// Allocated by this.
	absl::flat_hash_map<const Timer*, Registration*> registrations;

private:
	thread_local static RunLoop* current;
};

#endif
