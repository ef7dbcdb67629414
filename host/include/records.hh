// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <session.hh>
#include <string>
#include <string_view>
#include <vector>

namespace CycleBench
{
	/**
	 * One line of benchmark output.
	 */
	struct BenchmarkRecord
	{
		uint32_t    id = 0;
		std::string name;
		/// Non-zero if the benchmark's self-check failed.
		int32_t  status     = 0;
		uint32_t iterations = 0;
		uint64_t total      = 0;
		uint64_t min        = 0;
		uint64_t max        = 0;
		/// `total / iterations`, rounded down.  Zero if nothing completed.
		uint64_t              mean = 0;
		std::vector<uint64_t> samples;

		bool operator==(const BenchmarkRecord &) const = default;
	};

	BenchmarkRecord make_record(const RunResult &result, std::string_view name);

	/**
	 * Render a record as a single line, for example:
	 *
	 * ```
	 * 2 empty_call iterations=16 total=320 min=20 max=20 mean=20
	 * ```
	 *
	 * `status=` is added when it is non-zero and `samples=` (comma separated)
	 * when samples were captured.
	 */
	std::string format_record(const BenchmarkRecord &record);
} // namespace CycleBench
