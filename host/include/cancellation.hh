// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <atomic>
#include <chrono>
#include <utils.hh>

namespace CycleBench
{
	/**
	 * A request to abandon whatever is in progress.  Shared between the
	 * tools' signal handlers and every blocking wait, which polls it at
	 * `PollInterval`.
	 *
	 * `cancel` is async-signal-safe.
	 */
	class CancellationFlag : private utils::NoCopyNoMove
	{
		std::atomic<bool> cancelled{false};

		static_assert(std::atomic<bool>::is_always_lock_free);

		public:
		/// How often blocking waits check for cancellation.
		static constexpr std::chrono::milliseconds PollInterval{50};

		void cancel()
		{
			cancelled.store(true, std::memory_order_relaxed);
		}

		[[nodiscard]] bool is_cancelled() const
		{
			return cancelled.load(std::memory_order_relaxed);
		}
	};

	/**
	 * Returns true if `flag` is present and has been set.
	 */
	inline bool is_cancelled(const CancellationFlag *flag)
	{
		return (flag != nullptr) && flag->is_cancelled();
	}
} // namespace CycleBench
