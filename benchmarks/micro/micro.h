#pragma once

#include <benchmark.hh>
#include <span>

namespace CycleBench
{
	/**
	 * The benchmarks resident in every firmware image.  Most measure the
	 * fixed overheads of the harness itself (counter reads, calls, stores) so
	 * that they can be subtracted from other measurements.
	 */
	std::span<const BenchmarkDescriptor> micro_benchmarks();
} // namespace CycleBench
