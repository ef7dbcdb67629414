// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once
#include <__debug.h>
#include <cdefs.h>
#include <concepts>
#include <cstddef>
#include <magic_enum/magic_enum.hpp>
#include <string.h>

#include <algorithm>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>

namespace DebugConcepts
{
	/// Helper concept for matching booleans
	template<typename T>
	concept IsBool = std::is_same_v<T, bool>;

	/// Helper concept for matching enumerations.
	template<typename T>
	concept IsEnum = std::is_enum_v<T>;

	template<typename T>
	concept IsPointerButNotCString =
	  std::is_pointer_v<T> && !std::is_same_v<T, const char *> &&
	  !std::is_same_v<T, char *>;

	/**
	 * Integer types that are not one of the fixed-width types with an explicit
	 * adaptor (for example, `long long` on LP64 hosts).
	 */
	template<typename T>
	concept IsOtherInteger =
	  std::integral<T> && !IsBool<T> && !std::is_same_v<T, char> &&
	  !std::is_same_v<T, int8_t> && !std::is_same_v<T, uint8_t> &&
	  !std::is_same_v<T, int16_t> && !std::is_same_v<T, uint16_t> &&
	  !std::is_same_v<T, int32_t> && !std::is_same_v<T, uint32_t> &&
	  !std::is_same_v<T, int64_t> && !std::is_same_v<T, uint64_t>;

} // namespace DebugConcepts

/**
 * Abstract class for writing debug output.  This is used for custom output.
 *
 * This may be changed in the future to provide better support for custom
 * formatting.
 */
struct DebugWriter
{
	/**
	 * Write a single character.
	 */
	virtual void write(char) = 0;
	/**
	 * Write a C string.
	 */
	virtual void write(const char *) = 0;
	/**
	 * Write a string view.
	 */
	virtual void write(std::string_view) = 0;
	/**
	 * Write a 32-bit unsigned integer.
	 */
	virtual void write(uint32_t) = 0;
	/**
	 * Write a 32-bit signed integer.
	 */
	virtual void write(int32_t) = 0;
	/**
	 * Write a 64-bit unsigned integer.
	 */
	virtual void write(uint64_t) = 0;
	/**
	 * Write a 64-bit signed integer.
	 */
	virtual void write(int64_t) = 0;
};

/**
 * Helper function for writing enumerations.  Enumerations are written using
 * magic_enum to provide a string and then a numeric value.
 */
template<typename T>
void debug_enum_helper(uint64_t value, DebugWriter &writer)
    requires DebugConcepts::IsEnum<T>
{
	writer.write(magic_enum::enum_name<T>(static_cast<T>(value)));
	writer.write('(');
	writer.write(static_cast<uint32_t>(value));
	writer.write(')');
}

/**
 * Wrapper for values that should be printed as unsigned decimal numbers,
 * rather than the default hex.  Cycle counts are the main user.
 */
struct Decimal
{
	/// The wrapped value.
	uint64_t value;
};

/**
 * Adaptor that turns an argument of type `T` into a `DebugFormatArgument`.
 *
 * Users may specialise these to provide custom formatters.  See the
 * specialisation for enumerations for an example.
 */
template<typename T>
struct DebugFormatArgumentAdaptor;

/**
 * Boolean specialisation, prints "true" or "false".
 */
template<>
struct DebugFormatArgumentAdaptor<bool>
{
	__always_inline static DebugFormatArgument construct(bool value)
	{
		return {static_cast<uint64_t>(value),
		        DebugFormatArgumentKind::DebugFormatArgumentBool,
		        nullptr};
	}
};

/**
 * Character specialisation, prints the character.
 */
template<>
struct DebugFormatArgumentAdaptor<char>
{
	__always_inline static DebugFormatArgument construct(char value)
	{
		return {static_cast<uint64_t>(static_cast<unsigned char>(value)),
		        DebugFormatArgumentKind::DebugFormatArgumentCharacter,
		        nullptr};
	}
};

/**
 * Unsigned character specialisation, prints the character as a hex number.
 */
template<>
struct DebugFormatArgumentAdaptor<uint8_t>
{
	__always_inline static DebugFormatArgument construct(uint8_t value)
	{
		return {static_cast<uint64_t>(value),
		        DebugFormatArgumentKind::DebugFormatArgumentUnsignedNumber32,
		        nullptr};
	}
};

/**
 * Unsigned 16-bit integer specialisation, prints the integer as a hex number.
 */
template<>
struct DebugFormatArgumentAdaptor<uint16_t>
{
	__always_inline static DebugFormatArgument construct(uint16_t value)
	{
		return {static_cast<uint64_t>(value),
		        DebugFormatArgumentKind::DebugFormatArgumentUnsignedNumber32,
		        nullptr};
	}
};

/**
 * Unsigned 32-bit integer specialisation, prints the integer as a hex number.
 */
template<>
struct DebugFormatArgumentAdaptor<uint32_t>
{
	__always_inline static DebugFormatArgument construct(uint32_t value)
	{
		return {static_cast<uint64_t>(value),
		        DebugFormatArgumentKind::DebugFormatArgumentUnsignedNumber32,
		        nullptr};
	}
};

/**
 * Unsigned 64-bit integer specialisation, prints the integer as a hex number.
 *
 * All smaller sizes are handled by zero extending to 32 bits.  We treat 64-bit
 * separately because it requires decomposing the two halves for printing and
 * that's redundant overhead for the majority of cases.
 */
template<>
struct DebugFormatArgumentAdaptor<uint64_t>
{
	__always_inline static DebugFormatArgument construct(uint64_t value)
	{
		return {value,
		        DebugFormatArgumentKind::DebugFormatArgumentUnsignedNumber64,
		        nullptr};
	}
};

/**
 * Signed 8-bit integer specialisations, print the integer as a decimal number.
 */
template<>
struct DebugFormatArgumentAdaptor<int8_t>
{
	__always_inline static DebugFormatArgument construct(int8_t value)
	{
		return {static_cast<uint64_t>(static_cast<int64_t>(value)),
		        DebugFormatArgumentKind::DebugFormatArgumentSignedNumber32,
		        nullptr};
	}
};

/**
 * Signed 16-bit integer specialisations, print the integer as a decimal number.
 */
template<>
struct DebugFormatArgumentAdaptor<int16_t>
{
	__always_inline static DebugFormatArgument construct(int16_t value)
	{
		return {static_cast<uint64_t>(static_cast<int64_t>(value)),
		        DebugFormatArgumentKind::DebugFormatArgumentSignedNumber32,
		        nullptr};
	}
};

/**
 * Signed 32-bit integer specialisations, print the integer as a decimal number.
 */
template<>
struct DebugFormatArgumentAdaptor<int32_t>
{
	__always_inline static DebugFormatArgument construct(int32_t value)
	{
		return {static_cast<uint64_t>(static_cast<int64_t>(value)),
		        DebugFormatArgumentKind::DebugFormatArgumentSignedNumber32,
		        nullptr};
	}
};

/**
 * Signed 64-bit integer specialisations, print the integer as a decimal number.
 *
 * All smaller sizes are handled by sign extending to 32 bits.  We treat 64-bit
 * separately because it requires 64-bit division to convert a 64-bit integer
 * to a decimal and that, in turn, requires libcalls on RV32.
 */
template<>
struct DebugFormatArgumentAdaptor<int64_t>
{
	__always_inline static DebugFormatArgument construct(int64_t value)
	{
		uint64_t fudgedValue;
		memcpy(&fudgedValue, &value, sizeof(fudgedValue));
		return {fudgedValue,
		        DebugFormatArgumentKind::DebugFormatArgumentSignedNumber64,
		        nullptr};
	}
};

/**
 * Any other integer type, widened to 64 bits.
 */
template<DebugConcepts::IsOtherInteger T>
struct DebugFormatArgumentAdaptor<T>
{
	__always_inline static DebugFormatArgument construct(T value)
	{
		if constexpr (std::is_signed_v<T>)
		{
			return DebugFormatArgumentAdaptor<int64_t>::construct(
			  static_cast<int64_t>(value));
		}
		else
		{
			return DebugFormatArgumentAdaptor<uint64_t>::construct(
			  static_cast<uint64_t>(value));
		}
	}
};

/**
 * Decimal wrapper specialisation, prints the value as an unsigned decimal.
 */
template<>
struct DebugFormatArgumentAdaptor<Decimal>
{
	__always_inline static DebugFormatArgument construct(Decimal value)
	{
		return {value.value,
		        DebugFormatArgumentKind::DebugFormatArgumentDecimal64,
		        nullptr};
	}
};

/**
 * C string specialisation, prints the string as-is.
 */
template<>
struct DebugFormatArgumentAdaptor<const char *>
{
	__always_inline static DebugFormatArgument construct(const char *value)
	{
		return {reinterpret_cast<uintptr_t>(value),
		        DebugFormatArgumentKind::DebugFormatArgumentCString,
		        nullptr};
	}
};

/**
 * Mutable C string specialisation, use the C string handler.
 */
template<>
struct DebugFormatArgumentAdaptor<char *>
{
	__always_inline static DebugFormatArgument construct(char *value)
	{
		return DebugFormatArgumentAdaptor<const char *>::construct(value);
	}
};

/**
 * String view specialisation, prints the string as-is.
 *
 * Note that this relies on the string view persisting for the duration of the
 * call.  It passes a pointer to the string-view argument.
 */
template<>
struct DebugFormatArgumentAdaptor<std::string_view>
{
	__always_inline static DebugFormatArgument
	construct(std::string_view &value)
	{
		return {reinterpret_cast<uintptr_t>(&value),
		        DebugFormatArgumentKind::DebugFormatArgumentStringView,
		        nullptr};
	}
};

/**
 * String specialisation, use the C string handler.
 */
template<>
struct DebugFormatArgumentAdaptor<std::string>
{
	__always_inline static DebugFormatArgument construct(std::string &value)
	{
		return DebugFormatArgumentAdaptor<const char *>::construct(
		  value.c_str());
	}
};

/**
 * Enum specialisation, prints the enum as a string and then the numeric value.
 *
 * This specialisation uses the generic printing facility in the library call
 * and passes a callback that will map the enumeration to a string.
 */
template<DebugConcepts::IsEnum T>
struct DebugFormatArgumentAdaptor<T>
{
	__always_inline static DebugFormatArgument construct(T value)
	{
		return {static_cast<uint64_t>(value),
		        DebugFormatArgumentKind::DebugFormatArgumentCallback,
		        &debug_enum_helper<T>};
	}
};

/**
 * Null pointer specialisation.
 */
template<>
struct DebugFormatArgumentAdaptor<std::nullptr_t>
{
	__always_inline static DebugFormatArgument construct(std::nullptr_t)
	{
		return {0, DebugFormatArgumentKind::DebugFormatArgumentPointer, nullptr};
	}
};

/**
 * Pointer specialisation, prints the pointer as an address.
 */
template<DebugConcepts::IsPointerButNotCString T>
struct DebugFormatArgumentAdaptor<T>
{
	__always_inline static DebugFormatArgument construct(T value)
	{
		return {reinterpret_cast<uintptr_t>(
		          reinterpret_cast<const volatile void *>(value)),
		        DebugFormatArgumentKind::DebugFormatArgumentPointer,
		        nullptr};
	}
};

/**
 * Recursive helper that maps from a tuple representing the arguments into a
 * type-erased array.
 */
template<size_t I>
__always_inline void map_debug_argument(DebugFormatArgument *arguments,
                                        auto &&argumentTuple)
{
	arguments[I] =
	  DebugFormatArgumentAdaptor<
	    std::remove_cvref_t<decltype(std::get<I>(argumentTuple))>>{}
	    .construct(std::get<I>(argumentTuple));
	if constexpr (I > 0)
	{
		map_debug_argument<I - 1>(arguments, argumentTuple);
	}
}

/**
 * Convert `args` into a type-erased array of `DebugFormatArgument`s in
 * `arguments`.
 */
template<typename... Args>
__always_inline void
make_debug_arguments_list(DebugFormatArgument *arguments, Args &...args)
{
	if constexpr (sizeof...(Args) > 0)
	{
		map_debug_argument<sizeof...(Args) - 1>(arguments,
		                                        std::forward_as_tuple(args...));
	}
}

namespace
{
	/**
	 * Helper class wrapping a string for use as a template argument.  This is
	 * used to describe a context for conditional debugging that will be
	 * prefixed to debug lines.
	 */
	template<size_t N>
	struct DebugContext
	{
		/**
		 * Constructor, captures the string argument.
		 */
		constexpr DebugContext(const char (&str)[N])
		{
			std::copy_n(str, N, value);
		}

		/**
		 * Implicit conversion to a C string.
		 */
		constexpr operator const char *() const
		{
			return value;
		}

		/**
		 * The captured string.  Must be public for this class to meet the
		 * requirements of a structural type for use as a template argument.
		 */
		char value[N];
	};

	/**
	 * Source location, built from the compiler builtins so that the same code
	 * works with the freestanding library used for the firmware.
	 */
	struct SourceLocation
	{
		/**
		 * Explicitly construct a source location.
		 */
		constexpr SourceLocation(int         lineNumber,
		                         const char *fileName,
		                         const char *functionName)
		  : lineNumber(lineNumber), fileName(fileName), functionName(functionName)
		{
		}

		/**
		 * Construct a source location for the caller.
		 */
		static constexpr SourceLocation __always_inline
		current(int         lineNumber   = __builtin_LINE(),
		        const char *fileName     = __builtin_FILE(),
		        const char *functionName = __builtin_FUNCTION()) noexcept
		{
			return {lineNumber, fileName, functionName};
		}

		/// Returns the line number for this source location.
		[[nodiscard]] __always_inline constexpr int line() const noexcept
		{
			return lineNumber;
		}
		/// Returns the file name for this source location.
		[[nodiscard]] __always_inline constexpr const char *
		file_name() const noexcept
		{
			return fileName;
		}
		/// Returns the function name for this source location.
		[[nodiscard]] __always_inline constexpr const char *
		function_name() const noexcept
		{
			return functionName;
		}

		private:
		/// The line number of this source location.
		int lineNumber;
		/// The file name of this source location.
		const char *fileName;
		/// The function name of this source location.
		const char *functionName;
	};

	/**
	 * A format string that captures the location of the caller.  Invariants
	 * and assertions take one of these in place of a bare `const char *` so
	 * that the location is recorded at the call site without needing a
	 * trailing defaulted parameter after the argument pack.
	 */
	struct FormatString
	{
		/**
		 * Implicit construction from a string literal, recording the location
		 * of the expression that performed the conversion.
		 */
		__always_inline FormatString(
		  const char    *format,
		  SourceLocation location = SourceLocation::current())
		  : format(format), location(location)
		{
		}

		/// The format string.
		const char *format;
		/// Where the check was written.
		SourceLocation location;
	};

	/**
	 * Conditional debug class.  Used to control conditional output and
	 * assertion checking.  Enables debug log messages and assertions if
	 * `Enabled` is true.  Uses `Context` to print additional detail on debug
	 * lines.  Each line is prefixed with the context string in magenta to make
	 * it easy to see debug output from different subsystems in the same trace.
	 *
	 * This class is expected to be used as a type alias, something like:
	 *
	 * ```c++
	 * constexpr bool DebugFoo = DEBUG_FOO;
	 * using Debug = ConditionalDebug<DebugFoo, "Foo">;
	 * ```
	 */
	template<bool Enabled, DebugContext Context>
	class ConditionalDebug
	{
		/**
		 * Helper to report failure.
		 *
		 * This must not take the `SourceLocation` directly because doing so
		 * prevents the compiler from decomposing and subsequently
		 * constant-propagating its fields in the caller.
		 */
		template<typename... Args>
		static inline void report_failure(const char *kind,
		                                  const char *file,
		                                  const char *function,
		                                  int         line,
		                                  const char *fmt,
		                                  Args... args)
		{
			DebugFormatArgument arguments[sizeof...(Args) + 1];
			make_debug_arguments_list(arguments, args...);
			debug_report_failure(
			  kind, file, function, line, fmt, arguments, sizeof...(Args));
		}

		public:
		/**
		 * Log a message.
		 *
		 * This function does nothing if the `Enabled` condition is false.
		 */
		template<typename... Args>
		static void log(const char *fmt, Args... args)
		{
			if constexpr (Enabled)
			{
				asm volatile("" ::: "memory");
				DebugFormatArgument arguments[sizeof...(Args) + 1];
				make_debug_arguments_list(arguments, args...);
				const char *context = Context;
				debug_log_message_write(
				  context, fmt, arguments, sizeof...(Args));
				asm volatile("" ::: "memory");
			}
		}

		/**
		 * Invariant check, used as:
		 *
		 * ConditionalDebug::Invariant(someCondition, "A message...", ...);
		 *
		 * Invariants are checked unconditionally but will log a verbose
		 * message only if `Enabled` is true.
		 */
		template<typename... Args>
		__always_inline static void
		Invariant(bool condition, FormatString fmt, Args... args)
		{
			if (__predict_false(!condition))
			{
				if constexpr (Enabled)
				{
					report_failure("Invariant",
					               fmt.location.file_name(),
					               fmt.location.function_name(),
					               fmt.location.line(),
					               fmt.format,
					               args...);
				}
				__builtin_trap();
			}
		}

		/**
		 * Assertion check, used as:
		 *
		 * ConditionalDebug::Assert(someCondition, "A message...", ...);
		 *
		 * Assertions are checked only if `Enabled` is true.
		 */
		template<typename... Args>
		__always_inline static void
		Assert(bool condition, FormatString fmt, Args... args)
		{
			if constexpr (Enabled)
			{
				if (__predict_false(!condition))
				{
					report_failure("Assertion",
					               fmt.location.file_name(),
					               fmt.location.function_name(),
					               fmt.location.line(),
					               fmt.format,
					               args...);
					__builtin_trap();
				}
			}
		}
	};
} // namespace
