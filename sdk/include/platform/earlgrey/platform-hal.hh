// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <cdefs.h>
#include <platform-uart.hh>
#include <platform/concepts/platform.hh>
#include <priv/riscv.h>
#include <stdint.h>

/// Base of UART0 on Earl Grey.
#ifndef UART_BASE
#	define UART_BASE 0x40000000
#endif

namespace CycleBench
{
	/**
	 * Hardware access layer for the OpenTitan Earl Grey chip.  The Ibex core
	 * does not implement the unprivileged `cycle` CSRs, so read the machine
	 * counters instead.
	 */
	struct Platform
	{
		/// The saved `mstatus` interrupt-enable bits.
		using InterruptState = size_t;

		static volatile Uart &uart()
		{
			return *reinterpret_cast<volatile Uart *>(UART_BASE);
		}

		static void init()
		{
			uart().init();
		}

		static char read_byte()
		{
			return static_cast<char>(uart().blocking_read());
		}

		static void write_byte(char c)
		{
			uart().blocking_write(static_cast<uint8_t>(c));
		}

		__always_inline static uint32_t cycle_high()
		{
			return static_cast<uint32_t>(csr_read(mcycleh));
		}

		__always_inline static uint32_t cycle_low()
		{
			return static_cast<uint32_t>(csr_read(mcycle));
		}

		__always_inline static InterruptState interrupts_disable()
		{
			return priv::intr_disable();
		}

		__always_inline static void interrupts_restore(InterruptState state)
		{
			priv::intr_restore(state);
		}

		/**
		 * Earl Grey has no way to stop the simulation from software, so park
		 * the core.  The harness stops the simulator.
		 */
		[[noreturn]] static void halt(uint32_t)
		{
			priv::intr_disable();
			while (true)
			{
				priv::wfi();
			}
		}
	};

	static_assert(IsPlatform<Platform>);
} // namespace CycleBench
