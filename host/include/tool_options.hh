// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <boost/program_options.hpp>
#include <cancellation.hh>
#include <stdint.h>
#include <string>
#include <vector>
#include <workload.hh>

namespace CycleBench
{
	/**
	 * Raw values of the workload options shared by the host tools.
	 */
	struct WorkloadArguments
	{
		bool                     list    = false;
		bool                     all     = false;
		bool                     capture = false;
		bool                     raw     = false;
		bool                     verbose = false;
		std::vector<std::string> runs;
		std::vector<std::string> files;
		unsigned                 timeoutMs = 60'000;
		int64_t                  suspend   = -1;
	};

	/**
	 * Register the workload options with `description`, storing into
	 * `arguments`.
	 */
	void add_workload_options(boost::program_options::options_description &description,
	                          WorkloadArguments &arguments);

	/**
	 * Validate `arguments` and convert them into `options`.  Writes a message
	 * to standard error and returns `-EINVAL` if they are inconsistent.
	 */
	int collect_workload_options(const WorkloadArguments &arguments,
	                             WorkloadOptions         &options);

	/**
	 * Set `flag` from SIGINT and SIGTERM.
	 */
	void install_cancellation_handlers(CancellationFlag &flag);
} // namespace CycleBench
