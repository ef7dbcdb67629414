// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <cyclebench-errno.h>
#include <harness.hh>
#include <iostream>
#include <serial.hh>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/wait.h>
#include <thread>
#include <tool_options.hh>
#include <tracing_channel.hh>
#include <unistd.h>

using namespace CycleBench;
namespace po = boost::program_options;

namespace
{
	/**
	 * Run `command` with the shell, with `CYCLEBENCH_TTY` set to the
	 * endpoint, and wait for it.  Returns its exit status, or a negative
	 * errno value.
	 */
	int run_external(const std::string      &command,
	                 std::string_view        endpoint,
	                 const CancellationFlag &cancel)
	{
		if (setenv("CYCLEBENCH_TTY", std::string{endpoint}.c_str(), 1) != 0)
		{
			return -errno;
		}
		pid_t pid = fork();
		if (pid < 0)
		{
			return -errno;
		}
		if (pid == 0)
		{
			execl("/bin/sh", "sh", "-c", command.c_str(), nullptr);
			_exit(127);
		}
		bool interrupted = false;
		while (true)
		{
			int   status;
			pid_t ret = waitpid(pid, &status, WNOHANG);
			if (ret == pid)
			{
				if (WIFEXITED(status))
				{
					return WEXITSTATUS(status);
				}
				return -ECANCELED;
			}
			if ((ret < 0) && (errno != EINTR))
			{
				return -errno;
			}
			if (cancel.is_cancelled() && !interrupted)
			{
				kill(pid, SIGINT);
				interrupted = true;
			}
			std::this_thread::sleep_for(CancellationFlag::PollInterval);
		}
	}
} // namespace

int main(int argc, char *argv[])
{
	WorkloadArguments        arguments;
	BackendConfig            config;
	std::string              backend = "functional-emulator";
	std::string              exec;
	unsigned                 startupTimeoutMs = 60'000;
	unsigned                 graceMs          = 2'000;
	bool                     help             = false;

	po::options_description description("cyclebench-run options");
	description.add_options()
	  ("help,h", po::bool_switch(&help), "Print this message.")
	  ("backend", po::value(&backend)->default_value(backend),
	   "functional-emulator (qemu), cycle-accurate-simulator (verilator) or "
	   "custom.")
	  ("firmware", po::value(&config.firmware), "Firmware image.")
	  ("qemu", po::value(&config.qemu)->default_value(config.qemu),
	   "QEMU binary.")
	  ("command", po::value(&config.customCommand)->multitoken(),
	   "Command line of a custom backend.")
	  ("pattern", po::value(&config.customPattern),
	   "Regular expression announcing a custom backend's endpoint.  The "
	   "first capture group is the endpoint.")
	  ("startup-timeout", po::value(&startupTimeoutMs)->default_value(60'000),
	   "Milliseconds to wait for the backend to announce its endpoint.")
	  ("grace", po::value(&graceMs)->default_value(2'000),
	   "Milliseconds between SIGINT and SIGKILL when stopping the backend.")
	  ("exec", po::value(&exec),
	   "Run this shell command instead of a workload, with CYCLEBENCH_TTY "
	   "set to the endpoint.");
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
		std::cout << "Start a backend, run a workload against it and stop "
		             "it.\nThe simulator's artifacts are taken from "
		             "VERILATOR_SIM, VERILATOR_ROM and VERILATOR_OTP.\n\n"
		          << description;
		return EXIT_SUCCESS;
	}

	auto kind = parse_backend_kind(backend);
	if (!kind)
	{
		std::cerr << "Unknown backend '" << backend << "'\n";
		return EXIT_FAILURE;
	}
	config.kind           = *kind;
	config.startupTimeout = std::chrono::milliseconds{startupTimeoutMs};
	config.grace          = std::chrono::milliseconds{graceMs};
	config.load_environment();
	if (backend_command(config).empty())
	{
		std::cerr << "Incomplete backend configuration: a firmware image (and "
		             "for the simulator VERILATOR_SIM, VERILATOR_ROM and "
		             "VERILATOR_OTP, or --command for a custom backend) is "
		             "required\n";
		return EXIT_FAILURE;
	}

	WorkloadOptions options;
	if (exec.empty() && (collect_workload_options(arguments, options) != 0))
	{
		return EXIT_FAILURE;
	}

	CancellationFlag cancel;
	install_cancellation_handlers(cancel);

	auto matcher = make_matcher(config);
	if (!matcher)
	{
		std::cerr << "Invalid --pattern '" << config.customPattern << "'\n";
		return EXIT_FAILURE;
	}
	Harness harness{config, std::move(matcher), &cancel};
	int     ret = harness.run([&](std::string_view endpoint) {
        std::cerr << "Backend endpoint: " << endpoint << '\n';
        if (!exec.empty())
        {
            return run_external(exec, endpoint, cancel);
        }
        SerialPort port{&cancel};
        int        opened = port.open(std::string{endpoint});
        if (opened != 0)
        {
            return opened;
        }
        TracingChannel traced{port, std::cerr};
        LineChannel   &channel =
          arguments.verbose ? static_cast<LineChannel &>(traced) : port;
        return run_workload(channel, options, std::cout);
    });
	if (ret == -EBACKENDSTARTUP)
	{
		std::cerr << "The backend did not announce an endpoint\n";
	}
	else if (ret != 0)
	{
		std::cerr << "Workload failed: " << ret << '\n';
	}
	return ret == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
