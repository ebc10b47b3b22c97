#ifndef ET_UTILS_HPP
#define ET_UTILS_HPP

#include "common.hpp"
#include <cctype> // ::tolower()
#include <cmath>
#include <limits>
#include <string>

namespace Utils
{
	class String
	{
	public:
		static void ToLowerCase(std::string& str)
		{
			std::transform(str.begin(), str.end(), str.begin(), ::tolower);
		}
	};

	class Time
	{
		// Longest duration accepted, in milliseconds. Keeps absolute fire times
		// (now + duration) far away from uint64_t overflow.
		static constexpr double MaxDurationMs{ static_cast<double>(
			std::numeric_limits<int64_t>::max()) };

	public:
		static bool IsValidDuration(double seconds)
		{
			return std::isfinite(seconds) && seconds >= 0 && seconds * 1000 < MaxDurationMs;
		}

		/**
		 * Converts a duration in seconds into whole milliseconds, rounding up so
		 * a timer never fires earlier than requested.
		 *
		 * Throws EasyTimerTypeError if the duration is negative, not finite or
		 * too large.
		 */
		static uint64_t Seconds2Ms(double seconds);

		static double Ms2Seconds(uint64_t ms)
		{
			return static_cast<double>(ms) / 1000;
		}
	};
} // namespace Utils

#endif
