/**
 * Logger facility.
 *
 * This include file defines logging macros for source files (.cpp). Each
 * source file including Logger.hpp MUST define its own ET_CLASS macro. Include
 * files (.hpp) MUST NOT include Logger.hpp.
 *
 * All the logging macros use the same format as printf(). Log lines are
 * delivered to the Logger::Listener given to Logger::ClassInit() or, if none,
 * written to stdout (debug and dump lines) or stderr (warn and error lines).
 * The XXX_STD() version of a macro always writes to stdout/stderr. Some macros
 * such as ET_ABORT() and ET_ASSERT() always log to stderr.
 *
 * If the macro ET_LOG_FILE_LINE is defined, all the logging macros print more
 * verbose information, including current file and line.
 *
 * ET_TRACE()
 *
 *   Logs the current method/function if ET_LOG_TRACE macro is defined and the
 *   current log level is "debug".
 *
 * ET_HAS_DEBUG_TAG(tag)
 * ET_HAS_WARN_TAG(tag)
 *
 *   True if the current log level is satisfied and the given tag is enabled.
 *
 * ET_DEBUG_TAG(tag, ...)
 * ET_WARN_TAG(tag, ...)
 *
 *   Logs if the current log level is satisfied and the given tag is enabled.
 *
 *   Example:
 *     ET_WARN_TAG(loop, "timer woke up early");
 *
 * ET_DEBUG_DEV(...)
 *
 * 	 Logs if the current source file defines the ET_LOG_DEV_LEVEL macro with
 * 	 value 3.
 *
 * 	 Example:
 * 	   ET_DEBUG_DEV("timeout:%" PRIu64, timeout);
 *
 * ET_WARN_DEV(...)
 *
 * 	 Logs if the current source file defines the ET_LOG_DEV_LEVEL macro with
 * 	 value >= 2.
 *
 * ET_DUMP(...)
 *
 * 	 Logs always. Useful for Dump() methods.
 *
 * ET_ERROR(...)
 *
 *   Logs an error if the current log level is satisfied (or if the current
 *   source file defines the ET_LOG_DEV_LEVEL macro with value >= 1). Must just
 *   be used for internal errors that should not happen.
 *
 * ET_ABORT(...)
 *
 *   Logs the given error to stderr and aborts the process.
 *
 * ET_ASSERT(condition, ...)
 *
 *   If the condition is not satisfied, it calls ET_ABORT().
 */

#ifndef ET_LOGGER_HPP
#define ET_LOGGER_HPP

#include "common.hpp"
#include "LogLevel.hpp"
#include "Settings.hpp"
#include <cstdio>  // std::snprintf(), std::fprintf(), stdout, stderr
#include <cstdlib> // std::abort()
#include <cstring>

// clang-format off

#define _ET_TAG_ENABLED(tag) Settings::configuration.logTags.tag

#if !defined(ET_LOG_DEV_LEVEL)
	#define ET_LOG_DEV_LEVEL 0
#elif ET_LOG_DEV_LEVEL < 0 || ET_LOG_DEV_LEVEL > 3
	#error "invalid ET_LOG_DEV_LEVEL macro value"
#endif

class Logger
{
public:
	class Listener
	{
	public:
		virtual ~Listener() = default;

	public:
		// The first char of the line is the level: 'D', 'W', 'E' or 'X'.
		virtual void OnLog(const char* line, size_t len) = 0;
	};

public:
	static void ClassInit(Listener* listener);
	static void SendLog(int written);

public:
	thread_local static Listener* listener;
	static const size_t bufferSize {50000};
	thread_local static char buffer[];
};

/* Logging macros. */

#define _ET_LOG_SEPARATOR_CHAR_STD "\n"

#ifdef ET_LOG_FILE_LINE
	#define _ET_LOG_STR "%s:%d | %s::%s()"
	#define _ET_LOG_STR_DESC _ET_LOG_STR " | "
	#define _ET_FILE (std::strchr(__FILE__, '/') ? std::strchr(__FILE__, '/') + 1 : __FILE__)
	#define _ET_LOG_ARG _ET_FILE, __LINE__, ET_CLASS, __FUNCTION__
#else
	#define _ET_LOG_STR "%s::%s()"
	#define _ET_LOG_STR_DESC _ET_LOG_STR " | "
	#define _ET_LOG_ARG ET_CLASS, __FUNCTION__
#endif

#ifdef ET_LOG_TRACE
	#define ET_TRACE() \
		do \
		{ \
			if (Settings::configuration.logLevel == LogLevel::LOG_DEBUG) \
			{ \
				int loggerWritten = std::snprintf(Logger::buffer, Logger::bufferSize, "D(trace) " _ET_LOG_STR, _ET_LOG_ARG); \
				Logger::SendLog(loggerWritten); \
			} \
		} \
		while (false)
#else
	#define ET_TRACE() {}
#endif

#define ET_HAS_DEBUG_TAG(tag) \
	(Settings::configuration.logLevel == LogLevel::LOG_DEBUG && _ET_TAG_ENABLED(tag))

#define ET_HAS_WARN_TAG(tag) \
	(Settings::configuration.logLevel >= LogLevel::LOG_WARN && _ET_TAG_ENABLED(tag))

#define ET_DEBUG_TAG(tag, desc, ...) \
	do \
	{ \
		if (Settings::configuration.logLevel == LogLevel::LOG_DEBUG && _ET_TAG_ENABLED(tag)) \
		{ \
			int loggerWritten = std::snprintf(Logger::buffer, Logger::bufferSize, "D" _ET_LOG_STR_DESC desc, _ET_LOG_ARG, ##__VA_ARGS__); \
			Logger::SendLog(loggerWritten); \
		} \
	} \
	while (false)

#define ET_DEBUG_TAG_STD(tag, desc, ...) \
	do \
	{ \
		if (Settings::configuration.logLevel == LogLevel::LOG_DEBUG && _ET_TAG_ENABLED(tag)) \
		{ \
			std::fprintf(stdout, _ET_LOG_STR_DESC desc _ET_LOG_SEPARATOR_CHAR_STD, _ET_LOG_ARG, ##__VA_ARGS__); \
			std::fflush(stdout); \
		} \
	} \
	while (false)

#define ET_WARN_TAG(tag, desc, ...) \
	do \
	{ \
		if (Settings::configuration.logLevel >= LogLevel::LOG_WARN && _ET_TAG_ENABLED(tag)) \
		{ \
			int loggerWritten = std::snprintf(Logger::buffer, Logger::bufferSize, "W" _ET_LOG_STR_DESC desc, _ET_LOG_ARG, ##__VA_ARGS__); \
			Logger::SendLog(loggerWritten); \
		} \
	} \
	while (false)

#if ET_LOG_DEV_LEVEL == 3
	#define ET_DEBUG_DEV(desc, ...) \
		do \
		{ \
			int loggerWritten = std::snprintf(Logger::buffer, Logger::bufferSize, "D" _ET_LOG_STR_DESC desc, _ET_LOG_ARG, ##__VA_ARGS__); \
			Logger::SendLog(loggerWritten); \
		} \
		while (false)
#else
	#define ET_DEBUG_DEV(desc, ...) {}
#endif

#if ET_LOG_DEV_LEVEL >= 2
	#define ET_WARN_DEV(desc, ...) \
		do \
		{ \
			int loggerWritten = std::snprintf(Logger::buffer, Logger::bufferSize, "W" _ET_LOG_STR_DESC desc, _ET_LOG_ARG, ##__VA_ARGS__); \
			Logger::SendLog(loggerWritten); \
		} \
		while (false)
#else
	#define ET_WARN_DEV(desc, ...) {}
#endif

#define ET_DUMP(desc, ...) \
	do \
	{ \
		int loggerWritten = std::snprintf(Logger::buffer, Logger::bufferSize, "X" _ET_LOG_STR_DESC desc, _ET_LOG_ARG, ##__VA_ARGS__); \
		Logger::SendLog(loggerWritten); \
	} \
	while (false)

#define ET_ERROR(desc, ...) \
	do \
	{ \
		if (Settings::configuration.logLevel >= LogLevel::LOG_ERROR || ET_LOG_DEV_LEVEL >= 1) \
		{ \
			int loggerWritten = std::snprintf(Logger::buffer, Logger::bufferSize, "E" _ET_LOG_STR_DESC desc, _ET_LOG_ARG, ##__VA_ARGS__); \
			Logger::SendLog(loggerWritten); \
		} \
	} \
	while (false)

#define ET_ERROR_STD(desc, ...) \
	do \
	{ \
		if (Settings::configuration.logLevel >= LogLevel::LOG_ERROR || ET_LOG_DEV_LEVEL >= 1) \
		{ \
			std::fprintf(stderr, _ET_LOG_STR_DESC desc _ET_LOG_SEPARATOR_CHAR_STD, _ET_LOG_ARG, ##__VA_ARGS__); \
			std::fflush(stderr); \
		} \
	} \
	while (false)

#define ET_ABORT(desc, ...) \
	do \
	{ \
		std::fprintf(stderr, "(ABORT) " _ET_LOG_STR_DESC desc _ET_LOG_SEPARATOR_CHAR_STD, _ET_LOG_ARG, ##__VA_ARGS__); \
		std::fflush(stderr); \
		std::abort(); \
	} \
	while (false)

#define ET_ASSERT(condition, desc, ...) \
	if (!(condition)) \
	{ \
		ET_ABORT("failed assertion `%s': " desc, #condition, ##__VA_ARGS__); \
	}

// clang-format on

#endif
