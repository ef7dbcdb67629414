// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <iostream>
#include <line_channel.hh>

namespace CycleBench
{
	/**
	 * Echoes every line sent (`> `) and received (`< `) to a stream, for the
	 * tools' verbose mode.
	 */
	class TracingChannel final : public LineChannel
	{
		LineChannel  &inner;
		std::ostream &trace;

		public:
		TracingChannel(LineChannel &inner, std::ostream &trace)
		  : inner(inner), trace(trace)
		{
		}

		int write_line(std::string_view line) override
		{
			trace << "> " << line << std::endl;
			return inner.write_line(line);
		}

		int read_line(std::string              &line,
		              std::chrono::milliseconds timeout) override
		{
			int ret = inner.read_line(line, timeout);
			if (ret == 0)
			{
				trace << "< " << line << std::endl;
			}
			return ret;
		}

		void discard_input() override
		{
			inner.discard_input();
		}
	};
} // namespace CycleBench
