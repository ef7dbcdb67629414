// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <platform-hal.hh>
#include <string_view>

/**
 * Debug output on the device shares the console UART with the protocol.  Each
 * line is marked as a diagnostic so that the host does not mistake it for a
 * response.
 */
struct DebugOutput
{
	static constexpr const char *LinePrefix = "# ";

	static void write(std::string_view text)
	{
		for (char c : text)
		{
			CycleBench::Platform::write_byte(c);
		}
	}
};
