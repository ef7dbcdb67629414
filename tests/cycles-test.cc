// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#define TEST_NAME "Cycles"
#include "tests.hh"
#include <benchmark.hh>
#include <cycles.hh>
#include <vector>

using namespace CycleBench;

namespace
{
	/**
	 * A counter that replays fixed sequences of high and low words.
	 */
	struct ScriptedCounter
	{
		std::vector<uint32_t> highs;
		std::vector<uint32_t> lows;
		size_t                highReads = 0;
		size_t                lowReads  = 0;

		uint32_t cycle_high()
		{
			return highs.at(highReads++);
		}

		uint32_t cycle_low()
		{
			return lows.at(lowReads++);
		}
	};

	static_assert(IsSplitCycleCounter<ScriptedCounter>);

	void test_stable_read()
	{
		ScriptedCounter counter{.highs = {3, 3}, .lows = {7}};
		TEST_EQUAL(read_cycles(counter),
		           uint64_t(0x3'0000'0007),
		           "Stable counter read wrong");
		TEST_EQUAL(counter.highReads, size_t(2), "High word read count");
		TEST_EQUAL(counter.lowReads, size_t(1), "Low word read count");
	}

	void test_read_across_rollover()
	{
		// The low word wraps between the first and second reads of the high
		// word.  Combining the first high word with the old low word would
		// be almost 2^32 cycles wrong, so the read must be retried.
		ScriptedCounter counter{.highs = {0, 1, 1, 1},
		                        .lows  = {0xffff'fff0, 5}};
		TEST_EQUAL(read_cycles(counter),
		           uint64_t(0x1'0000'0005),
		           "Torn read was not retried");
		TEST_EQUAL(counter.highReads, size_t(4), "High word read count");
		TEST_EQUAL(counter.lowReads, size_t(2), "Low word read count");

		// Every consecutive pair of reads disagrees until the third attempt.
		ScriptedCounter unstable{.highs = {0, 1, 1, 2, 2, 2},
		                         .lows  = {1, 2, 3}};
		TEST_EQUAL(read_cycles(unstable),
		           uint64_t(0x2'0000'0003),
		           "Repeatedly torn read");
	}

	void test_delta()
	{
		TEST(cycle_delta(5, 10) == 5u, "Forward delta");
		TEST(cycle_delta(7, 7) == 0u, "Zero delta");
		TEST(!cycle_delta(10, 5), "A backwards counter must be reported");
		TEST(cycle_delta(0xffff'fff0, 0x1'0000'0010) == 0x20u,
		     "Delta across the low word rollover");
	}

	void test_aggregate()
	{
		SampleAggregate aggregate;
		TEST_EQUAL(aggregate.minimum(), uint64_t(0), "Empty minimum");
		aggregate.add(5);
		aggregate.add(3);
		aggregate.add(9);
		TEST_EQUAL(aggregate.count, uint32_t(3), "Count");
		TEST_EQUAL(aggregate.total, uint64_t(17), "Total");
		TEST_EQUAL(aggregate.minimum(), uint64_t(3), "Minimum");
		TEST_EQUAL(aggregate.max, uint64_t(9), "Maximum");

		SampleAggregate saturated;
		saturated.add(UINT64_MAX - 1);
		saturated.add(10);
		TEST_EQUAL(saturated.total, UINT64_MAX, "Total must saturate");
		TEST_EQUAL(saturated.max, UINT64_MAX - 1, "Saturated maximum");

		TEST_EQUAL(utils::saturating_add<uint32_t>(UINT32_MAX, 1),
		           UINT32_MAX,
		           "saturating_add overflow");
		TEST_EQUAL(utils::saturating_add<uint32_t>(2, 3),
		           uint32_t(5),
		           "saturating_add");
	}

	void test_interrupt_guard()
	{
		struct Masking
		{
			using InterruptState = int;
			int level            = 0;
			int restored         = -1;

			InterruptState interrupts_disable()
			{
				return level++;
			}

			void interrupts_restore(InterruptState state)
			{
				restored = state;
				level    = state;
			}
		} masking;
		{
			InterruptGuard<Masking> outer{masking};
			TEST_EQUAL(masking.level, 1, "Interrupts not masked");
			{
				InterruptGuard<Masking> inner{masking};
				TEST_EQUAL(masking.level, 2, "Nested guard");
			}
			TEST_EQUAL(masking.restored, 1, "Nested guard restored wrong state");
			TEST_EQUAL(masking.level, 1, "Nested guard");
		}
		TEST_EQUAL(masking.restored, 0, "Outer guard restored wrong state");
		TEST_EQUAL(masking.level, 0, "Interrupts not restored");
	}

	int nothing()
	{
		return 0;
	}

	void test_benchmark_tables()
	{
		static constexpr BenchmarkDescriptor Valid[] = {
		  {1, "a", nothing, 1},
		  {2, "b.c-d_E9", nothing, 16},
		};
		static_assert(benchmark_table_valid(Valid));
		static_assert(benchmark_table_valid({}));

		static constexpr BenchmarkDescriptor DuplicateId[] = {
		  {1, "a", nothing, 1},
		  {1, "b", nothing, 1},
		};
		static_assert(!benchmark_table_valid(DuplicateId));

		static constexpr BenchmarkDescriptor BadName[] = {
		  {1, "has space", nothing, 1},
		};
		static_assert(!benchmark_table_valid(BadName));

		static constexpr BenchmarkDescriptor EmptyName[] = {
		  {1, "", nothing, 1},
		};
		static_assert(!benchmark_table_valid(EmptyName));

		static constexpr BenchmarkDescriptor NoIterations[] = {
		  {1, "a", nothing, 0},
		};
		static_assert(!benchmark_table_valid(NoIterations));

		static constexpr BenchmarkDescriptor NoEntry[] = {
		  {1, "a", nullptr, 1},
		};
		static_assert(!benchmark_table_valid(NoEntry));

		TEST(find_benchmark(Valid, 2) == &Valid[1], "Benchmark 2 not found");
		TEST(find_benchmark(Valid, 3) == nullptr, "Found a missing benchmark");
	}
} // namespace

int test_cycles()
{
	test_stable_read();
	test_read_across_rollover();
	test_delta();
	test_aggregate();
	test_interrupt_guard();
	test_benchmark_tables();
	debug_log("All cycle counter tests passed");
	return 0;
}
