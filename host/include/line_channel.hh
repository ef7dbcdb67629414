// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace CycleBench
{
	/**
	 * A bidirectional, line-oriented connection to a device.  The session
	 * driver and the raw console are written against this so that they can be
	 * used over a serial port or an in-memory fake.
	 *
	 * All methods return zero on success or a negative errno value.
	 */
	class LineChannel
	{
		public:
		virtual ~LineChannel() = default;

		/**
		 * Send `line` followed by a newline.
		 */
		virtual int write_line(std::string_view line) = 0;

		/**
		 * Receive the next line, without its terminator or any carriage
		 * return.  Fails with `-ETIMEDOUT` if no complete line arrives within
		 * `timeout`, `-ENOTCONN` if the other end has gone away, or
		 * `-ECANCELED` if the operation was cancelled.
		 */
		virtual int read_line(std::string              &line,
		                      std::chrono::milliseconds timeout) = 0;

		/**
		 * Drop any input that has been received but not yet read.
		 */
		virtual void discard_input() = 0;
	};
} // namespace CycleBench
