#include "micro.h"

#include <array>
#include <cycles.hh>
#include <platform-hal.hh>
#include <stdint.h>

using namespace CycleBench;

namespace
{
	/// Sink for results that the compiler must not discard.
	volatile uint32_t scratchWord;

	/// Four words written together, standing in for a 128-bit store.
	struct Wide
	{
		uint32_t words[4];
	};
	volatile Wide scratchWide;

	__noinline void do_nothing()
	{
		asm volatile("");
	}

	__noinline uint32_t return_argument(uint32_t argument)
	{
		asm volatile("" : "+r"(argument));
		return argument;
	}

	__noinline uint32_t return_42()
	{
		uint32_t value = 42;
		asm volatile("" : "+r"(value));
		return value;
	}

	/**
	 * Measures the cost of one full 64-bit counter read.
	 */
	int cycle_read()
	{
		Platform platform;
		uint64_t cycles = read_cycles(platform);
		scratchWord     = static_cast<uint32_t>(cycles);
		return 0;
	}

	int empty_call()
	{
		do_nothing();
		return 0;
	}

	int call_and_return()
	{
		return return_argument(42) == 42 ? 0 : 1;
	}

	int return_only()
	{
		return return_42() == 42 ? 0 : 1;
	}

	int write_u32()
	{
		scratchWord = 42;
		return scratchWord == 42 ? 0 : 1;
	}

	int write_u128()
	{
		for (auto &word : scratchWide.words)
		{
			word = UINT32_MAX;
		}
		for (auto &word : scratchWide.words)
		{
			if (word != UINT32_MAX)
			{
				return 1;
			}
		}
		return 0;
	}

	/**
	 * Bitwise CRC-32 (IEEE 802.3, reflected) of the standard check string.
	 * Returns non-zero if the digest is wrong, so that a miscompiled or
	 * faulty core is reported instead of timed.
	 */
	int crc32_check()
	{
		constexpr char     Input[]  = "123456789";
		constexpr uint32_t Expected = 0xcbf43926;
		uint32_t           crc      = 0xffffffff;
		for (size_t i = 0; i < sizeof(Input) - 1; i++)
		{
			crc ^= static_cast<uint8_t>(Input[i]);
			for (int bit = 0; bit < 8; bit++)
			{
				crc = (crc >> 1) ^ (0xedb88320 & (0 - (crc & 1)));
			}
		}
		crc ^= 0xffffffff;
		return crc == Expected ? 0 : 2;
	}

	constexpr std::array MicroBenchmarks{
	  BenchmarkDescriptor{1, "cycle_read", cycle_read, 16},
	  BenchmarkDescriptor{2, "empty_call", empty_call, 16},
	  BenchmarkDescriptor{3, "call_and_return", call_and_return, 16},
	  BenchmarkDescriptor{4, "return_only", return_only, 16},
	  BenchmarkDescriptor{5, "write_u32", write_u32, 16},
	  BenchmarkDescriptor{6, "write_u128", write_u128, 16},
	  BenchmarkDescriptor{7, "crc32", crc32_check, 8},
	};
	static_assert(benchmark_table_valid(MicroBenchmarks),
	              "Benchmark ids must be unique and names must be wire tokens");
} // namespace

std::span<const BenchmarkDescriptor> CycleBench::micro_benchmarks()
{
	return MicroBenchmarks;
}
