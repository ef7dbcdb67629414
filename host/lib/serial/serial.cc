// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <debug.hh>
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <serial.hh>
#include <termios.h>
#include <unistd.h>

#ifndef DEBUG_SERIAL
#	define DEBUG_SERIAL false
#endif

using namespace CycleBench;

namespace
{
	using Debug = ConditionalDebug<DEBUG_SERIAL, "Serial">;

	/**
	 * Configure `fd` as a raw 8N1 line at 115200 baud with no flow control.
	 */
	int configure(int fd)
	{
		termios settings;
		if (tcgetattr(fd, &settings) != 0)
		{
			return -errno;
		}
		cfmakeraw(&settings);
		settings.c_cflag |= CLOCAL | CREAD | CS8;
		settings.c_cflag &= ~(CSTOPB | PARENB | CRTSCTS);
		settings.c_iflag &= ~(IXON | IXOFF | IXANY);
		settings.c_cc[VMIN]  = 0;
		settings.c_cc[VTIME] = 0;
		static_assert(SerialPort::BaudRate == 115200);
		if ((cfsetispeed(&settings, B115200) != 0) ||
		    (cfsetospeed(&settings, B115200) != 0))
		{
			return -errno;
		}
		if (tcsetattr(fd, TCSANOW, &settings) != 0)
		{
			return -errno;
		}
		return 0;
	}
} // namespace

SerialPort::~SerialPort()
{
	close();
}

int SerialPort::open(const std::string &path)
{
	close();
	int descriptor =
	  ::open(path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
	if (descriptor < 0)
	{
		int error = -errno;
		Debug::log("Failed to open {}: {}", path, error);
		return error;
	}
	int ret = configure(descriptor);
	if (ret != 0)
	{
		Debug::log("Failed to configure {}: {}", path, ret);
		::close(descriptor);
		return ret;
	}
	fd = descriptor;
	reader = FdLineReader{};
	Debug::log("Opened {}", path);
	return 0;
}

void SerialPort::close()
{
	if (fd >= 0)
	{
		::close(fd);
		fd = -1;
	}
}

int SerialPort::write_line(std::string_view line)
{
	if (fd < 0)
	{
		return -ENOTCONN;
	}
	std::string framed{line};
	framed.push_back('\n');
	std::string_view remaining{framed};
	while (!remaining.empty())
	{
		if (is_cancelled(cancel))
		{
			return -ECANCELED;
		}
		ssize_t written = ::write(fd, remaining.data(), remaining.size());
		if (written >= 0)
		{
			remaining.remove_prefix(static_cast<size_t>(written));
			continue;
		}
		if (errno == EINTR)
		{
			continue;
		}
		if (errno != EAGAIN)
		{
			return -errno;
		}
		pollfd descriptor{fd, POLLOUT, 0};
		if ((::poll(&descriptor,
		            1,
		            static_cast<int>(CancellationFlag::PollInterval.count())) <
		     0) &&
		    (errno != EINTR))
		{
			return -errno;
		}
	}
	Debug::log("> {}", line);
	return 0;
}

int SerialPort::read_line(std::string &line, std::chrono::milliseconds timeout)
{
	if (fd < 0)
	{
		return -ENOTCONN;
	}
	int ret = reader.read_line(fd, line, FdLineReader::Clock::now() + timeout, cancel);
	if (ret == 0)
	{
		Debug::log("< {}", line);
	}
	return ret;
}

void SerialPort::discard_input()
{
	reader.clear();
	if (fd < 0)
	{
		return;
	}
	if (tcflush(fd, TCIFLUSH) != 0)
	{
		Debug::log("tcflush failed: {}", -errno);
	}
	// Anything already in flight past the driver queue.
	char buffer[256];
	while (::read(fd, buffer, sizeof(buffer)) > 0) {}
}
