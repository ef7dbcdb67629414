// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <cdefs.h>
#include <platform-uart.hh>
#include <platform/concepts/platform.hh>
#include <priv/riscv.h>
#include <stdint.h>

/// Base of the console UART on QEMU's `virt` machine.
#ifndef UART_BASE
#	define UART_BASE 0x10000000
#endif

/// Base of the `sifive_test` finisher on QEMU's `virt` machine.
#ifndef SIFIVE_TEST_BASE
#	define SIFIVE_TEST_BASE 0x100000
#endif

namespace CycleBench
{
	/**
	 * Hardware access layer for QEMU's `virt` machine.
	 */
	struct Platform
	{
		/// Values written to the test finisher.
		enum : uint32_t
		{
			FinisherPass = 0x5555,
			FinisherFail = 0x3333,
		};

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
			return static_cast<uint32_t>(csr_read(cycleh));
		}

		__always_inline static uint32_t cycle_low()
		{
			return static_cast<uint32_t>(csr_read(cycle));
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
		 * Stop QEMU.  Zero exits successfully, anything else is reported as
		 * a failure with the code in the upper half-word.
		 */
		[[noreturn]] static void halt(uint32_t code)
		{
			auto *finisher = reinterpret_cast<volatile uint32_t *>(
			  static_cast<uintptr_t>(SIFIVE_TEST_BASE));
			*finisher = (code == 0) ? FinisherPass : ((code << 16) | FinisherFail);
			while (true)
			{
				priv::wfi();
			}
		}
	};

	static_assert(IsPlatform<Platform>);
} // namespace CycleBench
