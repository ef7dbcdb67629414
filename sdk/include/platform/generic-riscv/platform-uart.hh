// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <cdefs.h>
#include <platform/concepts/platform.hh>
#include <stdint.h>

/**
 * Generic 16550A memory-mapped register layout.
 *
 * The registers are 8 bits wide.  Some buses pad them to a 32-bit word, QEMU's
 * `virt` machine packs them at byte offsets.  The template parameter allows
 * this to be controlled.
 */
template<typename RegisterType = uint8_t>
class Uart16550
{
	public:
	/**
	 * The interface to the read/write FIFOs for this UART.
	 *
	 * This is also the low byte of the divisor when the divisor latch (bit 7 of
	 * the `lineControl`) is set.
	 */
	RegisterType data;
	/**
	 * Interrupt-enable control.  The dispatcher polls, so this is always
	 * zero.  When bit 7 of `lineControl` is set, this is instead the
	 * divisor-latch-high register.
	 */
	RegisterType intrEnable;
	/**
	 * Interrupt identification and FIFO enable/disable.
	 */
	RegisterType intrIDandFifo;
	/**
	 * Specifies properties of the line (stop bit, parity, and so on).  Bit 7
	 * is the divisor latch.
	 */
	RegisterType lineControl;
	/**
	 * Modem control.
	 */
	RegisterType modemControl;
	/**
	 * The line status word.  The bits that we care about are:
	 *
	 * 0: Receive ready
	 * 5: Transmit buffer empty
	 */
	const RegisterType LineStatus;
	/**
	 * Modem status.
	 */
	const RegisterType ModemStatus;
	/**
	 * Scratch register.  Unused.
	 */
	RegisterType scratch;

	/**
	 * Returns true if the transmit buffer is empty.
	 */
	__always_inline bool can_write() volatile
	{
		return LineStatus & (1 << 5);
	}

	/**
	 * Returns true if the receive buffer is not empty.
	 */
	__always_inline bool can_read() volatile
	{
		return LineStatus & (1 << 0);
	}

	/**
	 * Read one byte, blocking until a byte is available.
	 */
	uint8_t blocking_read() volatile
	{
		while (!can_read()) {}
		return data;
	}

	/**
	 * Write one byte, blocking until the byte is written.
	 */
	void blocking_write(uint8_t byte) volatile
	{
		while (!can_write()) {}
		data = byte;
	}

	/**
	 * Initialise the UART for 8N1 with the given divisor, interrupts off and
	 * the FIFOs enabled and cleared.
	 */
	void init(int divisor = 1) volatile
	{
		intrEnable  = 0x00;
		lineControl = 0x83;
		data        = divisor & 0xff;
		intrEnable  = (divisor >> 8) & 0xff;
		lineControl = 0x03;
		// 0 - Enable FIFOs
		// 1 - Clear receive FIFO
		// 2 - Clear send FIFO
		intrIDandFifo = 0x7;
	}
};

// A platform can provide a custom version of this.
#ifndef CYCLEBENCH_PLATFORM_CUSTOM_UART
/// The default UART type, as found on QEMU's `virt` machine.
using Uart = Uart16550<uint8_t>;
// Check that our UART matches the concept.
static_assert(IsUart<Uart>);
#endif
