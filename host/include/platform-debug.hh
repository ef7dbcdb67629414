// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <errno.h>
#include <string_view>
#include <unistd.h>

/**
 * Debug output for the host tools.  Messages go to standard error, one write
 * per buffer so that lines from the harness drain thread and the caller do not
 * interleave mid-line.
 */
struct DebugOutput
{
	static constexpr const char *LinePrefix = "";

	static void write(std::string_view text)
	{
		while (!text.empty())
		{
			ssize_t written = ::write(STDERR_FILENO, text.data(), text.size());
			if (written < 0)
			{
				if (errno == EINTR)
				{
					continue;
				}
				// Nowhere left to report the failure.
				return;
			}
			text.remove_prefix(static_cast<size_t>(written));
		}
	}
};
