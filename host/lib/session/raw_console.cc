// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <debug.hh>
#include <errno.h>
#include <istream>
#include <ostream>
#include <raw_console.hh>
#include <response.hh>
#include <session.hh>
#include <string>

#ifndef DEBUG_SESSION
#	define DEBUG_SESSION false
#endif

using namespace CycleBench;

namespace
{
	using Debug = ConditionalDebug<DEBUG_SESSION, "Raw console">;

	std::string_view trim(std::string_view line)
	{
		constexpr std::string_view Whitespace = " \t\r";
		size_t                     start      = line.find_first_not_of(Whitespace);
		if (start == std::string_view::npos)
		{
			return {};
		}
		size_t end = line.find_last_not_of(Whitespace);
		return line.substr(start, end - start + 1);
	}
} // namespace

bool RawConsole::is_command_line(std::string_view line)
{
	line = trim(line);
	return !line.empty() && (line.front() != '#');
}

int RawConsole::exchange(std::string_view line, std::ostream &output)
{
	int ret = channel.write_line(line);
	if (ret != 0)
	{
		return ret;
	}
	std::string response;
	ret = read_response_line(
	  channel, response, std::chrono::steady_clock::now() + timeout);
	if (ret != 0)
	{
		return ret;
	}
	output << response << '\n';
	return 0;
}

int RawConsole::run(std::istream     &input,
                    std::ostream     &output,
                    RawConsoleReport *report)
{
	RawConsoleReport counts;
	int              ret = 0;
	std::string      line;
	while (std::getline(input, line))
	{
		if (!is_command_line(line))
		{
			continue;
		}
		std::string_view command = trim(line);
		counts.sent++;
		ret = exchange(command, output);
		if (ret == -ETIMEDOUT)
		{
			Debug::log("No response to '{}'", command);
			counts.timeouts++;
			ret = 0;
			continue;
		}
		if (ret != 0)
		{
			Debug::log("Channel failed after '{}': {}", command, ret);
			break;
		}
		counts.received++;
	}
	output.flush();
	if (report != nullptr)
	{
		*report = counts;
	}
	return ret;
}
