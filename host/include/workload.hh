// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <iosfwd>
#include <line_channel.hh>
#include <optional>
#include <session.hh>
#include <string>
#include <string_view>
#include <vector>

namespace CycleBench
{
	/**
	 * A benchmark to run, as given on the command line: `<id>[:<iterations>]`.
	 */
	struct RunRequest
	{
		uint32_t                id = 0;
		std::optional<uint32_t> iterations;

		bool operator==(const RunRequest &) const = default;
	};

	/**
	 * What the host tools do once they have a connection.
	 */
	struct WorkloadOptions
	{
		/// Print the resident benchmarks.
		bool list = false;
		/// Run every resident benchmark with its default iteration count.
		bool all = false;
		/// Ask for individual samples.
		bool capture = false;
		/// Benchmarks to run, in order.
		std::vector<RunRequest> runs;
		/// Raw mode: forward these files line by line.  `-` is standard input.
		std::vector<std::string> rawFiles;
		/// Send `DONE` after each raw file, as the device expects.
		bool finishWithDone = true;
		/// Send `SUSPEND <code>` when finished.
		std::optional<uint32_t> suspendCode;
		/// Per-response timeout.
		std::chrono::milliseconds timeout = Session::DefaultTimeout;
	};

	/**
	 * Parse `<id>[:<iterations>]`.  Returns zero or `-EINVAL`.
	 */
	int parse_run_request(std::string_view text, RunRequest &request);

	/**
	 * Perform `options` over `channel`, writing records (or raw responses) to
	 * `output`.  Individual benchmark failures are reported and do not stop
	 * the workload.  Returns zero if everything succeeded, otherwise the
	 * first error.
	 */
	int run_workload(LineChannel           &channel,
	                 const WorkloadOptions &options,
	                 std::ostream          &output);
} // namespace CycleBench
