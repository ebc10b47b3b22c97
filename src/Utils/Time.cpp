#define ET_CLASS "Utils::Time"
// #define ET_LOG_DEV_LEVEL 3

#include "EasyTimerErrors.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

namespace Utils
{
	uint64_t Time::Seconds2Ms(double seconds)
	{
		ET_TRACE();

		if (!Time::IsValidDuration(seconds))
		{
			ET_THROW_TYPE_ERROR("invalid duration %f (must be finite and non negative)", seconds);
		}

		// Tolerate binary floating point noise (1.1 * 1000 is 1100.0000000000002).
		const double ms = std::ceil((seconds * 1000) - 1e-6);

		return ms > 0 ? static_cast<uint64_t>(ms) : 0u;
	}
} // namespace Utils
