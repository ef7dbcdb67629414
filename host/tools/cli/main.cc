// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <iostream>
#include <serial.hh>
#include <string.h>
#include <tool_options.hh>
#include <tracing_channel.hh>

using namespace CycleBench;
namespace po = boost::program_options;

int main(int argc, char *argv[])
{
	WorkloadArguments arguments;
	std::string       tty;
	bool              help = false;

	po::options_description description("cyclebench-cli options");
	description.add_options()
	  ("help,h", po::bool_switch(&help), "Print this message.")
	  ("tty", po::value(&tty),
	   "Serial port or pseudo-terminal of the device.  Defaults to "
	   "$CYCLEBENCH_TTY.");
	add_workload_options(description, arguments);

	try
	{
		po::variables_map variables;
		po::store(po::parse_command_line(argc, argv, description), variables);
		po::notify(variables);
	}
	catch (const po::error &e)
	{
		std::cerr << e.what() << '\n' << description;
		return EXIT_FAILURE;
	}
	if (help)
	{
		std::cout << "Run benchmarks on a device connected over a serial "
		             "line.\n\n"
		          << description;
		return EXIT_SUCCESS;
	}
	if (tty.empty())
	{
		if (const char *fromEnvironment = getenv("CYCLEBENCH_TTY"))
		{
			tty = fromEnvironment;
		}
	}
	if (tty.empty())
	{
		std::cerr << "No device: use --tty or set CYCLEBENCH_TTY\n";
		return EXIT_FAILURE;
	}

	WorkloadOptions options;
	if (collect_workload_options(arguments, options) != 0)
	{
		return EXIT_FAILURE;
	}

	CancellationFlag cancel;
	install_cancellation_handlers(cancel);

	SerialPort port{&cancel};
	int        ret = port.open(tty);
	if (ret != 0)
	{
		std::cerr << "Cannot open " << tty << ": " << strerror(-ret) << '\n';
		return EXIT_FAILURE;
	}
	TracingChannel traced{port, std::cerr};
	LineChannel   &channel =
	  arguments.verbose ? static_cast<LineChannel &>(traced) : port;
	ret = run_workload(channel, options, std::cout);
	if (ret != 0)
	{
		std::cerr << "Workload failed: " << ret << '\n';
		return EXIT_FAILURE;
	}
	return EXIT_SUCCESS;
}
