// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <cancellation.hh>
#include <chrono>
#include <string>

namespace CycleBench
{
	/**
	 * Splits the bytes read from a non-blocking file descriptor into lines.
	 * Used for the serial port and for a backend's diagnostic output.
	 */
	class FdLineReader
	{
		/// Bytes received after the last complete line.
		std::string pending;
		/// Set once the descriptor has reported end of file.
		bool atEnd = false;
		/// Dropping the remainder of an overlong line.
		bool discarding = false;

		public:
		using Clock = std::chrono::steady_clock;

		/**
		 * The longest line that is buffered.  Anything longer is dropped up
		 * to its terminator.
		 */
		static constexpr size_t MaxLineLength = 4096;

		/**
		 * Read the next line from `fd`, waiting until `deadline`.  Carriage
		 * returns are removed.  A final unterminated line is returned when
		 * the other end closes.
		 *
		 * Returns zero on success, `-ETIMEDOUT`, `-ECANCELED` if `cancel` was
		 * set while waiting, `-ENOTCONN` at end of file (or a hang-up), or
		 * another negative errno value from `poll` or `read`.  A line longer
		 * than `MaxLineLength` is reported once, as `-EPROTO`, when its
		 * terminator arrives.
		 */
		int read_line(int                      fd,
		              std::string             &line,
		              Clock::time_point        deadline,
		              const CancellationFlag  *cancel = nullptr);

		/**
		 * Forget any partial line.
		 */
		void clear()
		{
			pending.clear();
			discarding = false;
		}
	};
} // namespace CycleBench
