// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <cdefs.h>
#include <span>
#include <stdint.h>
#include <string_view>

namespace CycleBench
{
	/**
	 * One benchmarked operation resident in the firmware image.
	 */
	struct BenchmarkDescriptor
	{
		/// Identifier used on the wire.  Unique within an image.
		uint32_t id;
		/// Human-readable name, sent as a single wire token.
		const char *name;
		/**
		 * The operation.  Returns 0 on success or a non-zero status if the
		 * operation's own self-check failed.
		 */
		int (*entry)();
		/// Iterations used when a run does not specify a count.
		uint32_t defaultIterations;
	};

	/**
	 * Returns true if `c` may appear in a benchmark name.
	 */
	constexpr bool is_name_character(char c)
	{
		return ((c >= 'a') && (c <= 'z')) || ((c >= 'A') && (c <= 'Z')) ||
		       ((c >= '0') && (c <= '9')) || (c == '_') || (c == '.') ||
		       (c == '-');
	}

	/**
	 * Returns true if `name` is non-empty and made only of name characters.
	 */
	constexpr bool is_valid_name(const char *name)
	{
		if ((name == nullptr) || (*name == '\0'))
		{
			return false;
		}
		for (; *name != '\0'; ++name)
		{
			if (!is_name_character(*name))
			{
				return false;
			}
		}
		return true;
	}

	/**
	 * Check a benchmark table: ids must be unique, names must be valid wire
	 * tokens, entry points must be present and default iteration counts must
	 * be non-zero.  Intended for use in a `static_assert` on the resident
	 * table.
	 */
	constexpr bool
	benchmark_table_valid(std::span<const BenchmarkDescriptor> table)
	{
		for (size_t i = 0; i < table.size(); i++)
		{
			if (!is_valid_name(table[i].name) || (table[i].entry == nullptr) ||
			    (table[i].defaultIterations == 0))
			{
				return false;
			}
			for (size_t j = i + 1; j < table.size(); j++)
			{
				if (table[i].id == table[j].id)
				{
					return false;
				}
			}
		}
		return true;
	}

	/**
	 * Find the benchmark with the given id.  Returns null if none exists.
	 */
	constexpr const BenchmarkDescriptor *
	find_benchmark(std::span<const BenchmarkDescriptor> table, uint32_t id)
	{
		for (const auto &descriptor : table)
		{
			if (descriptor.id == id)
			{
				return &descriptor;
			}
		}
		return nullptr;
	}
} // namespace CycleBench
