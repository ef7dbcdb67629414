// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <debug.hh>
#include <dispatcher.hh>
#include <micro.h>
#include <platform-hal.hh>

using namespace CycleBench;

using Debug = ConditionalDebug<DEBUG_DISPATCH, "Firmware">;

/**
 * Firmware entry point, called from the boot code with interrupts disabled
 * and `.bss` cleared.  There is no C++ runtime: nothing here may depend on
 * static constructors.
 */
extern "C" [[noreturn]] void firmware_main()
{
	Platform platform;
	Platform::init();
	Debug::log("{} benchmarks resident", micro_benchmarks().size());
	Dispatcher<Platform> dispatcher{platform, micro_benchmarks()};
	dispatcher.run();
}
