// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <cancellation.hh>
#include <fd_reader.hh>
#include <line_channel.hh>
#include <string>
#include <utils.hh>

namespace CycleBench
{
	/**
	 * A serial port (or pseudo-terminal) configured for the device console:
	 * raw mode, 115200 baud, 8 data bits, no parity, one stop bit and no flow
	 * control.
	 */
	class SerialPort final : public LineChannel, private utils::NoCopyNoMove
	{
		int                     fd = -1;
		FdLineReader            reader;
		const CancellationFlag *cancel;

		public:
		/// The console baud rate.
		static constexpr unsigned BaudRate = 115200;

		explicit SerialPort(const CancellationFlag *cancel = nullptr)
		  : cancel(cancel)
		{
		}

		~SerialPort() override;

		/**
		 * Open and configure the port at `path`.  Returns zero on success or
		 * a negative errno value.
		 */
		int open(const std::string &path);

		/**
		 * Close the port.  Safe to call more than once.
		 */
		void close();

		[[nodiscard]] bool is_open() const
		{
			return fd >= 0;
		}

		int write_line(std::string_view line) override;
		int read_line(std::string              &line,
		              std::chrono::milliseconds timeout) override;
		void discard_input() override;
	};
} // namespace CycleBench
