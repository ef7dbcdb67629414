// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <errno.h>
#include <iostream>
#include <signal.h>
#include <tool_options.hh>

using namespace CycleBench;
namespace po = boost::program_options;

namespace
{
	/// The flag set by the signal handler.
	CancellationFlag *signalFlag = nullptr;

	void handle_signal(int)
	{
		if (signalFlag != nullptr)
		{
			signalFlag->cancel();
		}
	}
} // namespace

void CycleBench::add_workload_options(po::options_description &description,
                                      WorkloadArguments       &arguments)
{
	description.add_options()
	  ("list", po::bool_switch(&arguments.list),
	   "Print the benchmarks resident on the device.")
	  ("run", po::value(&arguments.runs)->composing(),
	   "Run a benchmark, given as <id>[:<iterations>].  May be repeated.")
	  ("all", po::bool_switch(&arguments.all),
	   "Run every resident benchmark with its default iteration count.")
	  ("capture", po::bool_switch(&arguments.capture),
	   "Report individual samples as well as the aggregate (at most 64 "
	   "iterations per run).")
	  ("raw", po::bool_switch(&arguments.raw),
	   "Raw mode: forward each line of the given files verbatim and record "
	   "the responses in <file>.result.")
	  ("files", po::value(&arguments.files)->multitoken(),
	   "Input files for raw mode.  Use - for standard input.")
	  ("timeout", po::value(&arguments.timeoutMs)->default_value(60'000),
	   "Milliseconds to wait for each response.")
	  ("suspend", po::value(&arguments.suspend),
	   "Stop the device with this exit code when finished.")
	  ("verbose,v", po::bool_switch(&arguments.verbose),
	   "Print every line sent and received.");
}

int CycleBench::collect_workload_options(const WorkloadArguments &arguments,
                                         WorkloadOptions         &options)
{
	options         = WorkloadOptions{};
	options.list    = arguments.list;
	options.all     = arguments.all;
	options.capture = arguments.capture;
	options.timeout = std::chrono::milliseconds{arguments.timeoutMs};
	if (arguments.timeoutMs == 0)
	{
		std::cerr << "--timeout must be positive\n";
		return -EINVAL;
	}
	if (arguments.suspend >= 0)
	{
		if (arguments.suspend > UINT32_MAX)
		{
			std::cerr << "--suspend code is out of range\n";
			return -EINVAL;
		}
		options.suspendCode = static_cast<uint32_t>(arguments.suspend);
	}
	if (arguments.raw)
	{
		if (arguments.files.empty())
		{
			std::cerr << "--raw needs --files\n";
			return -EINVAL;
		}
		if (arguments.list || arguments.all || !arguments.runs.empty())
		{
			std::cerr << "--raw cannot be combined with --list, --run or --all\n";
			return -EINVAL;
		}
		options.rawFiles = arguments.files;
		return 0;
	}
	if (!arguments.files.empty())
	{
		std::cerr << "--files is only used with --raw\n";
		return -EINVAL;
	}
	for (const auto &text : arguments.runs)
	{
		RunRequest request;
		if (parse_run_request(text, request) != 0)
		{
			std::cerr << "Invalid --run value '" << text
			          << "', expected <id>[:<iterations>]\n";
			return -EINVAL;
		}
		options.runs.push_back(request);
	}
	return 0;
}

void CycleBench::install_cancellation_handlers(CancellationFlag &flag)
{
	signalFlag = &flag;
	struct sigaction action = {};
	action.sa_handler       = handle_signal;
	sigemptyset(&action.sa_mask);
	for (int signal : {SIGINT, SIGTERM})
	{
		if (sigaction(signal, &action, nullptr) != 0)
		{
			std::cerr << "Cannot install handler for signal " << signal << '\n';
		}
	}
}
