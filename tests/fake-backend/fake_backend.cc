// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <chrono>
#include <debug.hh>
#include <dispatcher.hh>
#include <fcntl.h>
#include <iostream>
#include <micro.h>
#include <platform-hal.hh>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <string_view>
#include <termios.h>
#include <thread>
#include <unistd.h>

/**
 * Stands in for QEMU or the Verilator model in the harness tests.  It creates
 * a pseudo-terminal, announces it on standard output the way the selected
 * backend does, and then runs the real dispatcher on it.
 *
 * Options:
 *
 *  --announce-delay <ms>  Wait before announcing.
 *  --exit-early           Print some output and exit without announcing.
 *  --silent               Never print anything, and never exit.
 *  --ignore-sigint        Ignore SIGINT, so that only SIGKILL stops it.
 *  --meminit=...          Arguments the simulator accepts.  Any of these
 *                         selects the simulator's announcement.
 *
 * Anything else (for example, QEMU's arguments) is ignored.
 */

using namespace CycleBench;

using Debug = ConditionalDebug<DEBUG_DISPATCH, "Firmware">;

namespace
{
	/**
	 * Open a pseudo-terminal.  Returns the master, or -1.  The slave is kept
	 * open in raw mode so that output written before the host connects is
	 * neither echoed nor lost.
	 */
	int open_console(std::string &slavePath)
	{
		int master = posix_openpt(O_RDWR | O_NOCTTY);
		if ((master < 0) || (grantpt(master) != 0) || (unlockpt(master) != 0))
		{
			return -1;
		}
		const char *name = ptsname(master);
		if (name == nullptr)
		{
			return -1;
		}
		slavePath = name;
		int slave = ::open(name, O_RDWR | O_NOCTTY);
		if (slave < 0)
		{
			return -1;
		}
		termios settings;
		if (tcgetattr(slave, &settings) == 0)
		{
			cfmakeraw(&settings);
			tcsetattr(slave, TCSANOW, &settings);
		}
		// The slave stays open for the life of the process.  With no slave
		// open, reads from the master fail until the host connects.
		return master;
	}
} // namespace

int main(int argc, char *argv[])
{
	std::chrono::milliseconds announceDelay{0};
	bool                      exitEarly    = false;
	bool                      silent       = false;
	bool                      ignoreSigint = false;
	bool                      simulator    = false;
	for (int i = 1; i < argc; i++)
	{
		std::string_view argument{argv[i]};
		if ((argument == "--announce-delay") && (i + 1 < argc))
		{
			announceDelay = std::chrono::milliseconds{atoi(argv[++i])};
		}
		else if (argument == "--exit-early")
		{
			exitEarly = true;
		}
		else if (argument == "--silent")
		{
			silent = true;
		}
		else if (argument == "--ignore-sigint")
		{
			ignoreSigint = true;
		}
		else if (argument.starts_with("--meminit="))
		{
			simulator = true;
		}
	}

	if (ignoreSigint)
	{
		signal(SIGINT, SIG_IGN);
	}
	if (silent)
	{
		while (true)
		{
			pause();
		}
	}
	std::cout << "fake backend starting" << std::endl;
	if (exitEarly)
	{
		std::cout << "fake backend giving up" << std::endl;
		return EXIT_FAILURE;
	}

	std::string endpoint;
	Platform::consoleFd = open_console(endpoint);
	if (Platform::consoleFd < 0)
	{
		std::cout << "cannot create a pseudo-terminal: " << strerror(errno)
		          << std::endl;
		return EXIT_FAILURE;
	}

	std::this_thread::sleep_for(announceDelay);
	if (simulator)
	{
		std::cout << "UART: Created " << endpoint
		          << " for uart0. Connect to it with any terminal program."
		          << std::endl;
	}
	else
	{
		std::cout << "char device redirected to " << endpoint
		          << " (label serial0)" << std::endl;
	}

	Platform platform;
	Debug::log("{} benchmarks resident", micro_benchmarks().size());
	Dispatcher<Platform> dispatcher{platform, micro_benchmarks()};
	dispatcher.run();
}
