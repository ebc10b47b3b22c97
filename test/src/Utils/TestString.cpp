#include "common.hpp"
#include "Utils.hpp"
#include <catch2/catch.hpp>

using namespace Utils;

SCENARIO("String::ToLowerCase()")
{
	std::string str;

	str = "Foo";
	String::ToLowerCase(str);
	REQUIRE(str == "foo");

	str = "DelayedInterval";
	String::ToLowerCase(str);
	REQUIRE(str == "delayedinterval");

	str = "";
	String::ToLowerCase(str);
	REQUIRE(str.empty());
}
