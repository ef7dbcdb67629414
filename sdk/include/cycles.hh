// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <cdefs.h>
#include <concepts>
#include <limits>
#include <optional>
#include <stdint.h>
#include <utils.hh>

namespace CycleBench
{
	/**
	 * A 64-bit cycle counter that can only be read as two 32-bit halves.
	 */
	template<typename T>
	concept IsSplitCycleCounter = requires(T &counter) {
		{ counter.cycle_high() } -> std::same_as<uint32_t>;
		{ counter.cycle_low() } -> std::same_as<uint32_t>;
	};

	/**
	 * Read the full 64-bit cycle count from a counter that exposes it as two
	 * words.  The low word may roll over between the two reads, so read high,
	 * low, high and retry until both reads of the high word agree.
	 */
	template<IsSplitCycleCounter Counter>
	__always_inline uint64_t read_cycles(Counter &counter)
	{
		uint32_t high;
		uint32_t low;
		uint32_t highAgain;
		do
		{
			high      = counter.cycle_high();
			low       = counter.cycle_low();
			highAgain = counter.cycle_high();
		} while (__predict_false(high != highAgain));
		return (static_cast<uint64_t>(high) << 32) | low;
	}

	/**
	 * Elapsed cycles between two reads.  Returns nothing if `end` is before
	 * `start`, which can only happen if the counter was read incorrectly.
	 */
	constexpr std::optional<uint64_t> cycle_delta(uint64_t start, uint64_t end)
	{
		if (end < start)
		{
			return std::nullopt;
		}
		return end - start;
	}

	/**
	 * Masks interrupts on construction and restores the previous state when
	 * destroyed.  Any platform with `interrupts_disable` and
	 * `interrupts_restore` can be used.
	 */
	template<typename Platform>
	class InterruptGuard : private utils::NoCopyNoMove
	{
		Platform                          &platform;
		typename Platform::InterruptState  saved;

		public:
		__always_inline explicit InterruptGuard(Platform &platform)
		  : platform(platform), saved(platform.interrupts_disable())
		{
		}

		__always_inline ~InterruptGuard()
		{
			platform.interrupts_restore(saved);
		}
	};

	/**
	 * Running total, minimum and maximum of a sequence of cycle counts.
	 */
	struct SampleAggregate
	{
		uint32_t count = 0;
		uint64_t total = 0;
		uint64_t min   = std::numeric_limits<uint64_t>::max();
		uint64_t max   = 0;

		void add(uint64_t sample)
		{
			count++;
			total = utils::saturating_add(total, sample);
			if (sample < min)
			{
				min = sample;
			}
			if (sample > max)
			{
				max = sample;
			}
		}

		/// The smallest sample, or zero if there were none.
		[[nodiscard]] uint64_t minimum() const
		{
			return count == 0 ? 0 : min;
		}
	};
} // namespace CycleBench
