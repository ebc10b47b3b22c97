#include "common.hpp"
#include "EasyTimerErrors.hpp"
#include "Utils.hpp"
#include <catch2/catch.hpp>
#include <limits>

using namespace Utils;

SCENARIO("Time::Seconds2Ms()")
{
	REQUIRE(Time::Seconds2Ms(0) == 0);
	REQUIRE(Time::Seconds2Ms(0.1) == 100);
	REQUIRE(Time::Seconds2Ms(1) == 1000);
	REQUIRE(Time::Seconds2Ms(1.1) == 1100);
	REQUIRE(Time::Seconds2Ms(2.345) == 2345);
	// Sub millisecond durations are rounded up.
	REQUIRE(Time::Seconds2Ms(0.0005) == 1);
	REQUIRE(Time::Seconds2Ms(0.0101) == 11);

	REQUIRE_THROWS_AS(Time::Seconds2Ms(-0.001), EasyTimerTypeError);
	REQUIRE_THROWS_AS(Time::Seconds2Ms(std::numeric_limits<double>::infinity()), EasyTimerTypeError);
	REQUIRE_THROWS_AS(Time::Seconds2Ms(std::numeric_limits<double>::quiet_NaN()), EasyTimerTypeError);
	REQUIRE_THROWS_AS(Time::Seconds2Ms(std::numeric_limits<double>::max()), EasyTimerTypeError);
}

SCENARIO("Time::IsValidDuration()")
{
	REQUIRE(Time::IsValidDuration(0));
	REQUIRE(Time::IsValidDuration(0.5));
	REQUIRE(Time::IsValidDuration(86400 * 365));
	REQUIRE(!Time::IsValidDuration(-1));
	REQUIRE(!Time::IsValidDuration(-std::numeric_limits<double>::infinity()));
	REQUIRE(!Time::IsValidDuration(std::numeric_limits<double>::infinity()));
	REQUIRE(!Time::IsValidDuration(std::numeric_limits<double>::quiet_NaN()));
	REQUIRE(!Time::IsValidDuration(1e300));
}

SCENARIO("Time::Ms2Seconds()")
{
	REQUIRE(Time::Ms2Seconds(0) == 0);
	REQUIRE(Time::Ms2Seconds(1500) == Approx(1.5));
	REQUIRE(Time::Ms2Seconds(Time::Seconds2Ms(0.25)) == Approx(0.25));
}
