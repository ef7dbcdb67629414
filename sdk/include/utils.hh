// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <cdefs.h>
#include <limits>
#include <stddef.h>
#include <stdint.h>
#include <type_traits>

namespace utils
{
	class NoCopyNoMove
	{
		public:
		NoCopyNoMove()                                = default;
		NoCopyNoMove(const NoCopyNoMove &)            = delete;
		NoCopyNoMove &operator=(const NoCopyNoMove &) = delete;
		NoCopyNoMove(NoCopyNoMove &&)                 = delete;
		NoCopyNoMove &operator=(NoCopyNoMove &&)      = delete;
		~NoCopyNoMove()                               = default;
	};

	/**
	 * Add two unsigned values, clamping to the maximum representable value
	 * instead of wrapping.
	 */
	template<typename T>
	constexpr T saturating_add(T a, T b)
	    requires(std::is_unsigned_v<T>)
	{
		T result;
		if (__builtin_add_overflow(a, b, &result))
		{
			return std::numeric_limits<T>::max();
		}
		return result;
	}

	/**
	 * ASCII-only upper-case conversion.  Wire tokens are plain ASCII and this
	 * must not depend on the C locale.
	 */
	constexpr char ascii_upper(char c)
	{
		return ((c >= 'a') && (c <= 'z')) ? static_cast<char>(c - 'a' + 'A')
		                                  : c;
	}

	/**
	 * Compare two characters ignoring ASCII case.
	 */
	constexpr bool ascii_equal_ignore_case(char a, char b) noexcept
	{
		return ascii_upper(a) == ascii_upper(b);
	}

} // namespace utils
