// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once
#pragma push_macro("CYCLEBENCH_PLATFORM_CUSTOM_UART")
#define CYCLEBENCH_PLATFORM_CUSTOM_UART
#include_next <platform-uart.hh>
#pragma pop_macro("CYCLEBENCH_PLATFORM_CUSTOM_UART")

/// Core clock of the Earl Grey Verilator model.
#ifndef CPU_TIMER_HZ
#	define CPU_TIMER_HZ 125'000
#endif

/**
 * Console baud rate.  The Verilator model's UART DPI samples at this rate for
 * the simulated clock above.
 */
#ifndef UART_BAUD_RATE
#	define UART_BAUD_RATE 7'200
#endif

/**
 * OpenTitan UART
 *
 * Register documentation:
 * https://opentitan.org/book/hw/ip/uart/doc/registers.html
 *
 * Only the registers and fields needed for polled 8N1 operation are named.
 */
struct OpenTitanUart
{
	uint32_t interruptState;
	uint32_t interruptEnable;
	uint32_t interruptTest;
	uint32_t alertTest;
	/**
	 * Control Register.
	 */
	uint32_t control;
	/**
	 * Status Register.
	 */
	uint32_t status;
	/**
	 * UART Read Data.
	 */
	uint32_t readData;
	/**
	 * UART Write Data.
	 */
	uint32_t writeData;
	/**
	 * UART FIFO Control Register.
	 */
	uint32_t fifoCtrl;
	/**
	 * UART FIFO Status Register.
	 */
	uint32_t fifoStatus;
	uint32_t override;
	uint32_t values;
	uint32_t timeoutControl;

	/// FIFO Control Register Fields
	enum : uint32_t
	{
		/// Reset the transmit FIFO.
		FifoControlTransmitReset = 1 << 1,
		/// Reset the receive FIFO.
		FifoControlReceiveReset = 1 << 0,
	};

	/// Control Register Fields
	enum : uint32_t
	{
		/// Enable receiving bits.
		ControlReceiveEnable = 1 << 1,
		/// Enable transmitting bits.
		ControlTransmitEnable = 1 << 0,
	};

	/// Depth of the transmit FIFO.
	static constexpr uint32_t TransmitFifoDepth = 32;

	/// Clears the contents of the receive and transmit FIFOs.
	void fifos_clear() volatile
	{
		fifoCtrl = (fifoCtrl & ~0b11) | FifoControlTransmitReset |
		           FifoControlReceiveReset;
	}

	/**
	 * Set the baud rate, with interrupts disabled and both directions
	 * enabled.
	 */
	void init(unsigned baudRate = UART_BAUD_RATE) volatile
	{
		// Nco = 2^20 * baud rate / cpu frequency
		const uint32_t Nco =
		  ((static_cast<uint64_t>(baudRate) << 20) / CPU_TIMER_HZ);
		interruptEnable = 0;
		fifos_clear();
		control = (Nco << 16) | ControlTransmitEnable | ControlReceiveEnable;
	}

	[[gnu::always_inline]] uint16_t transmit_fifo_level() volatile
	{
		return fifoStatus & 0xff;
	}

	[[gnu::always_inline]] uint16_t receive_fifo_level() volatile
	{
		return ((fifoStatus >> 16) & 0xff);
	}

	bool can_write() volatile
	{
		return transmit_fifo_level() < TransmitFifoDepth;
	}

	bool can_read() volatile
	{
		return receive_fifo_level() > 0;
	}

	/**
	 * Write one byte, blocking until the byte is written.
	 */
	void blocking_write(uint8_t byte) volatile
	{
		while (!can_write()) {}
		writeData = byte;
	}

	/**
	 * Read one byte, blocking until a byte is available.
	 */
	uint8_t blocking_read() volatile
	{
		while (!can_read()) {}
		return readData;
	}
};

#ifndef CYCLEBENCH_PLATFORM_CUSTOM_UART
using Uart = OpenTitanUart;
static_assert(IsUart<Uart>);
#endif
