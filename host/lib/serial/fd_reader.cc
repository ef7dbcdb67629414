// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <errno.h>
#include <fd_reader.hh>
#include <poll.h>
#include <unistd.h>

using namespace CycleBench;

namespace
{
	void strip_carriage_returns(std::string &line)
	{
		line.erase(std::remove(line.begin(), line.end(), '\r'), line.end());
	}
} // namespace

int FdLineReader::read_line(int                     fd,
                            std::string            &line,
                            Clock::time_point       deadline,
                            const CancellationFlag *cancel)
{
	while (true)
	{
		size_t newline = pending.find('\n');
		if (newline != std::string::npos)
		{
			if (discarding)
			{
				pending.erase(0, newline + 1);
				discarding = false;
				return -EPROTO;
			}
			line.assign(pending, 0, newline);
			pending.erase(0, newline + 1);
			strip_carriage_returns(line);
			return 0;
		}
		if (pending.size() > MaxLineLength)
		{
			pending.clear();
			discarding = true;
		}
		if (atEnd)
		{
			if (discarding)
			{
				pending.clear();
				discarding = false;
				return -EPROTO;
			}
			if (pending.empty())
			{
				return -ENOTCONN;
			}
			line = std::move(pending);
			pending.clear();
			strip_carriage_returns(line);
			return 0;
		}
		if (is_cancelled(cancel))
		{
			return -ECANCELED;
		}
		auto now = Clock::now();
		if (now >= deadline)
		{
			return -ETIMEDOUT;
		}
		auto wait = std::min(
		  std::chrono::ceil<std::chrono::milliseconds>(deadline - now),
		  std::chrono::milliseconds{CancellationFlag::PollInterval});

		pollfd descriptor{fd, POLLIN, 0};
		int    ready = ::poll(&descriptor, 1, static_cast<int>(wait.count()));
		if (ready < 0)
		{
			if (errno == EINTR)
			{
				continue;
			}
			return -errno;
		}
		if (ready == 0)
		{
			continue;
		}
		if ((descriptor.revents & (POLLIN | POLLHUP)) == 0)
		{
			return -EIO;
		}
		char    buffer[512];
		ssize_t received = ::read(fd, buffer, sizeof(buffer));
		if (received > 0)
		{
			pending.append(buffer, static_cast<size_t>(received));
		}
		else if (received == 0)
		{
			atEnd = true;
		}
		else if ((errno == EAGAIN) || (errno == EINTR))
		{
			continue;
		}
		else if (errno == EIO)
		{
			// A pseudo-terminal whose other side has been closed.
			atEnd = true;
		}
		else
		{
			return -errno;
		}
	}
}
