// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once
#include <cdefs.h>
#include <stddef.h>
#include <stdint.h>

/**
 * The kind of value, for values that have special-cased handling.
 */
enum DebugFormatArgumentKind : uint8_t
{
	/// Boolean, printed as "true" or "false".
	DebugFormatArgumentBool,
	/// Single character.
	DebugFormatArgumentCharacter,
	/// Signed 32-bit integer, printed as decimal.
	DebugFormatArgumentSignedNumber32,
	/// Unsigned 32-bit integer, printed as hexadecimal
	DebugFormatArgumentUnsignedNumber32,
	/// Signed 64-bit integer, printed as decimal.
	DebugFormatArgumentSignedNumber64,
	/// Unsigned 64-bit integer, printed as hexadecimal.
	DebugFormatArgumentUnsignedNumber64,
	/// Unsigned integer, printed as decimal.  Used for cycle counts, which
	/// are unreadable in hex.
	DebugFormatArgumentDecimal64,
	/// Pointer, printed as an address.
	DebugFormatArgumentPointer,
	/// C string, printed as-is.
	DebugFormatArgumentCString,
	/// String view, printed as-is.
	DebugFormatArgumentStringView,
	/// Custom type, printed by the callback stored alongside the value.
	DebugFormatArgumentCallback,
};

struct DebugWriter;

/**
 * Callback for custom types in debug output.  This should use the second
 * argument to write the first argument to the debug output.
 */
typedef void (*DebugCallback)(uint64_t, struct DebugWriter &);

struct DebugFormatArgument
{
	/**
	 * The value that is being written.  Wide enough for a 64-bit integer on
	 * both RV32 and the host.
	 */
	uint64_t value;
	/**
	 * The kind of value that is being written.
	 */
	enum DebugFormatArgumentKind kind;
	/**
	 * The formatter, if `kind` is `DebugFormatArgumentCallback`.
	 */
	DebugCallback callback;
};

/**
 * Library function that writes a debug message.  This prints an array of
 * debug messages with a single write to the output so that lines from
 * different sources do not interleave.  This is intended to allow a single
 * call to print multiple format strings without requiring the format strings
 * to be copied, so that the debugging APIs can wrap a user-provided format
 * string.
 */
void debug_log_message_write(const char                 *context,
                             const char                 *format,
                             struct DebugFormatArgument *messages,
                             size_t                      messageCount);

/**
 * Helper to write a debug message reporting an assertion or invariant failure.
 * This should be used only with the helper templates in `debug.hh`.
 * This takes the kind of failure (for example, assert or invariant), the file,
 * function, and line number where the failure occurred, a format string, and
 * an array of arguments to the format string.
 */
void debug_report_failure(const char                 *kind,
                          const char                 *file,
                          const char                 *function,
                          int                         line,
                          const char                 *fmt,
                          struct DebugFormatArgument *arguments,
                          size_t                      argumentCount);
