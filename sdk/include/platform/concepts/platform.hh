// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <concepts>
#include <cycles.hh>
#include <stdint.h>

/**
 * Concept for checking that a UART driver exposes the right interface.
 */
template<typename T>
concept IsUart = requires(volatile T *v, uint8_t byte) {
	{ v->can_write() } -> std::same_as<bool>;
	{ v->can_read() } -> std::same_as<bool>;
	{ v->blocking_read() } -> std::same_as<uint8_t>;
	{ v->blocking_write(byte) };
};

/**
 * Concept for the hardware access layer that the dispatcher runs on.  Each
 * platform directory provides one type satisfying this in
 * `platform-hal.hh`, selected by the include path.
 *
 * `halt` does not return on real hardware.  Test platforms may return from
 * it, in which case the dispatcher carries on as if the command completed.
 */
template<typename T>
concept IsPlatform =
  CycleBench::IsSplitCycleCounter<T> &&
  requires(T &platform, char c, typename T::InterruptState state, uint32_t code) {
	  { platform.read_byte() } -> std::same_as<char>;
	  { platform.write_byte(c) };
	  { platform.interrupts_disable() } -> std::same_as<typename T::InterruptState>;
	  { platform.interrupts_restore(state) };
	  { platform.halt(code) };
  };
