// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <iosfwd>
#include <line_channel.hh>
#include <string_view>

namespace CycleBench
{
	/**
	 * Counters describing one pass of the raw console.
	 */
	struct RawConsoleReport
	{
		/// Lines forwarded to the device.
		size_t sent = 0;
		/// Lines received and echoed.
		size_t received = 0;
		/// Lines for which no response arrived in time.
		size_t timeouts = 0;
	};

	/**
	 * Manual probing mode.  Every command line of the input is sent verbatim
	 * and the next line received is written to the output verbatim, with no
	 * interpretation of either.  Device diagnostics are not responses and are
	 * not echoed.
	 */
	class RawConsole
	{
		LineChannel              &channel;
		std::chrono::milliseconds timeout;

		public:
		RawConsole(LineChannel &channel, std::chrono::milliseconds timeout)
		  : channel(channel), timeout(timeout)
		{
		}

		/**
		 * Returns true for input lines that are forwarded.  Blank lines and
		 * lines starting with `#` are comments.
		 */
		static bool is_command_line(std::string_view line);

		/**
		 * Forward `line` and echo one response.  Returns zero, `-ETIMEDOUT`
		 * if nothing came back (nothing is echoed), or another negative errno
		 * value if the channel failed.
		 */
		int exchange(std::string_view line, std::ostream &output);

		/**
		 * Process every line of `input`.  A timeout is counted and the
		 * console moves on to the next line.  Any other channel failure ends
		 * the pass and is returned.
		 */
		int run(std::istream     &input,
		        std::ostream     &output,
		        RawConsoleReport *report = nullptr);
	};
} // namespace CycleBench
