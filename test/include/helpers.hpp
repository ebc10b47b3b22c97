#ifndef ET_TEST_HELPERS_HPP
#define ET_TEST_HELPERS_HPP

#include "common.hpp"
#include "DepLibUV.hpp"
#include <string>
#include <vector>

namespace helpers
{
	// Records when (in us since its creation) every callback call happened.
	class CallRecorder
	{
	public:
		CallRecorder() : startTimeUs(DepLibUV::GetTimeUs())
		{
		}

		void Record()
		{
			this->callTimesUs.push_back(DepLibUV::GetTimeUs() - this->startTimeUs);
		}
		size_t GetCount() const
		{
			return this->callTimesUs.size();
		}
		uint64_t GetCallTimeUs(size_t idx) const
		{
			return this->callTimesUs.at(idx);
		}

	private:
		uint64_t startTimeUs{ 0u };
		std::vector<uint64_t> callTimesUs;
	};

	// Builds a mutable argv out of the given arguments.
	class Argv
	{
	public:
		explicit Argv(const std::vector<std::string>& args) : args(args)
		{
			for (auto& arg : this->args)
			{
				this->argv.push_back(&arg[0]);
			}
			this->argv.push_back(nullptr);
		}

		int GetArgc() const
		{
			return static_cast<int>(this->args.size());
		}
		char** GetArgv()
		{
			return this->argv.data();
		}

	private:
		std::vector<std::string> args;
		std::vector<char*> argv;
	};
} // namespace helpers

#endif
