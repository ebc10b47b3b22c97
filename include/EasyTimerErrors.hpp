#ifndef ET_EASY_TIMER_ERRORS_HPP
#define ET_EASY_TIMER_ERRORS_HPP

#include "Logger.hpp"
#include <cstdio> // std::snprintf()
#include <stdexcept>

class EasyTimerError : public std::runtime_error
{
public:
	explicit EasyTimerError(const char* description) : std::runtime_error(description)
	{
	}

public:
	static const size_t bufferSize{ 2000 };
	thread_local static char buffer[];
};

class EasyTimerTypeError : public EasyTimerError
{
public:
	explicit EasyTimerTypeError(const char* description) : EasyTimerError(description)
	{
	}
};

// clang-format off
#define ET_THROW_ERROR(desc, ...) \
	do \
	{ \
		ET_ERROR("throwing EasyTimerError: " desc, ##__VA_ARGS__); \
		std::snprintf(EasyTimerError::buffer, EasyTimerError::bufferSize, desc, ##__VA_ARGS__); \
		throw EasyTimerError(EasyTimerError::buffer); \
	} while (false)

#define ET_THROW_TYPE_ERROR(desc, ...) \
	do \
	{ \
		ET_ERROR("throwing EasyTimerTypeError: " desc, ##__VA_ARGS__); \
		std::snprintf(EasyTimerError::buffer, EasyTimerError::bufferSize, desc, ##__VA_ARGS__); \
		throw EasyTimerTypeError(EasyTimerError::buffer); \
	} while (false)
// clang-format on

#endif
