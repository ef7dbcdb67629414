// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <records.hh>
#include <sstream>

using namespace CycleBench;

BenchmarkRecord CycleBench::make_record(const RunResult &result,
                                        std::string_view name)
{
	const auto &summary = result.summary;
	return {.id         = summary.id,
	        .name       = std::string{name},
	        .status     = summary.status,
	        .iterations = summary.iterations,
	        .total      = summary.total,
	        .min        = summary.min,
	        .max        = summary.max,
	        .mean = summary.iterations == 0 ? 0 : summary.total / summary.iterations,
	        .samples = result.samples};
}

std::string CycleBench::format_record(const BenchmarkRecord &record)
{
	std::ostringstream line;
	line << record.id << ' ' << record.name
	     << " iterations=" << record.iterations << " total=" << record.total
	     << " min=" << record.min << " max=" << record.max
	     << " mean=" << record.mean;
	if (record.status != 0)
	{
		line << " status=" << record.status;
	}
	if (!record.samples.empty())
	{
		line << " samples=";
		const char *separator = "";
		for (uint64_t sample : record.samples)
		{
			line << separator << sample;
			separator = ",";
		}
	}
	return line.str();
}
