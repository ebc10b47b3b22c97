#define ET_CLASS "Logger"
// #define ET_LOG_DEV_LEVEL 3

#include "Logger.hpp"

/* Class variables. */

thread_local Logger::Listener* Logger::listener{ nullptr };
thread_local char Logger::buffer[Logger::bufferSize];

/* Class methods. */

void Logger::ClassInit(Listener* listener)
{
	Logger::listener = listener;

	ET_TRACE();
}

void Logger::SendLog(int written)
{
	if (written <= 0)
	{
		return;
	}

	// snprintf() returns the length it would have written, not the truncated one.
	auto len = std::min(static_cast<size_t>(written), Logger::bufferSize - 1);

	if (Logger::listener != nullptr)
	{
		Logger::listener->OnLog(Logger::buffer, len);

		return;
	}

	FILE* stream = (Logger::buffer[0] == 'W' || Logger::buffer[0] == 'E') ? stderr : stdout;

	std::fprintf(stream, "%.*s\n", static_cast<int>(len), Logger::buffer);
	std::fflush(stream);
}
