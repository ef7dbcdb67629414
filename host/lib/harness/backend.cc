// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <backend.hh>
#include <cstdlib>
#include <debug.hh>
#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#ifndef DEBUG_HARNESS
#	define DEBUG_HARNESS false
#endif

using namespace CycleBench;

namespace
{
	using Debug = ConditionalDebug<DEBUG_HARNESS, "Backend">;

	/// How often `terminate` checks whether the child has exited.
	constexpr std::chrono::milliseconds ReapInterval{10};

	/**
	 * Copy an environment variable into `value` if it is set.
	 */
	void from_environment(const char *name, std::string &value)
	{
		if (const char *setting = std::getenv(name))
		{
			value = setting;
		}
	}
} // namespace

std::optional<BackendKind> CycleBench::parse_backend_kind(std::string_view name)
{
	if ((name == "functional-emulator") || (name == "qemu"))
	{
		return BackendKind::FunctionalEmulator;
	}
	if ((name == "cycle-accurate-simulator") || (name == "verilator"))
	{
		return BackendKind::CycleAccurateSimulator;
	}
	if (name == "custom")
	{
		return BackendKind::Custom;
	}
	return std::nullopt;
}

void BackendConfig::load_environment()
{
	from_environment("VERILATOR_SIM", verilatorSimulator);
	from_environment("VERILATOR_ROM", verilatorRom);
	from_environment("VERILATOR_OTP", verilatorOtp);
}

std::vector<std::string> CycleBench::backend_command(const BackendConfig &config)
{
	switch (config.kind)
	{
		case BackendKind::FunctionalEmulator:
			if (config.firmware.empty())
			{
				return {};
			}
			return {config.qemu,
			        "-M",
			        "virt",
			        "-cpu",
			        "rv32",
			        "-smp",
			        "1",
			        "-m",
			        "32M",
			        "-display",
			        "none",
			        "-bios",
			        "none",
			        "-serial",
			        "pty",
			        "-kernel",
			        config.firmware};
		case BackendKind::CycleAccurateSimulator:
			if (config.firmware.empty() || config.verilatorSimulator.empty() ||
			    config.verilatorRom.empty() || config.verilatorOtp.empty())
			{
				return {};
			}
			return {config.verilatorSimulator,
			        "--meminit=rom," + config.verilatorRom,
			        "--meminit=flash," + config.firmware,
			        "--meminit=otp," + config.verilatorOtp};
		case BackendKind::Custom:
			return config.customCommand;
	}
	return {};
}

std::unique_ptr<EndpointMatcher> CycleBench::make_matcher(const BackendConfig &config)
{
	switch (config.kind)
	{
		case BackendKind::FunctionalEmulator:
			return std::make_unique<QemuEndpointMatcher>();
		case BackendKind::CycleAccurateSimulator:
			return std::make_unique<VerilatorEndpointMatcher>();
		case BackendKind::Custom:
			return PatternEndpointMatcher::create(config.customPattern);
	}
	return nullptr;
}

int BackendProcess::spawn(const std::vector<std::string>  &argv,
                          std::unique_ptr<BackendProcess> &process)
{
	if (argv.empty())
	{
		return -EINVAL;
	}
	// Build the argument vector before forking: only async-signal-safe calls
	// are allowed in the child.
	std::vector<char *> arguments;
	arguments.reserve(argv.size() + 1);
	for (const auto &argument : argv)
	{
		arguments.push_back(const_cast<char *>(argument.c_str()));
	}
	arguments.push_back(nullptr);

	int output[2];
	if (pipe2(output, O_CLOEXEC) != 0)
	{
		return -errno;
	}
	pid_t pid = fork();
	if (pid < 0)
	{
		int error = -errno;
		::close(output[0]);
		::close(output[1]);
		return error;
	}
	if (pid == 0)
	{
		setpgid(0, 0);
		int devNull = ::open("/dev/null", O_RDONLY);
		if (devNull >= 0)
		{
			dup2(devNull, STDIN_FILENO);
		}
		dup2(output[1], STDOUT_FILENO);
		dup2(output[1], STDERR_FILENO);
		execvp(arguments[0], arguments.data());
		static const char Message[] = "cyclebench: failed to execute backend\n";
		ssize_t           written   = ::write(STDERR_FILENO, Message, sizeof(Message) - 1);
		(void)written;
		_exit(127);
	}
	// Also set the group from the parent so that it is in place before any
	// signal is sent, whichever process runs first.
	if ((setpgid(pid, pid) != 0) && (errno != EACCES))
	{
		Debug::log("setpgid({}) failed: {}", pid, -errno);
	}
	::close(output[1]);
	if (fcntl(output[0], F_SETFL, O_NONBLOCK) != 0)
	{
		Debug::log("Cannot make the diagnostic pipe non-blocking: {}", -errno);
	}
	Debug::log("Started {} as {}", argv[0], pid);
	process.reset(new BackendProcess(pid, output[0]));
	return 0;
}

BackendProcess::~BackendProcess()
{
	int status = terminate(DefaultGrace);
	if (status < 0)
	{
		Debug::log("Failed to reap backend: {}", status);
	}
}

int BackendProcess::read_line(std::string                    &line,
                              FdLineReader::Clock::time_point deadline,
                              const CancellationFlag         *cancel)
{
	if ((outputFd < 0) || drainThread.joinable())
	{
		return -EBADF;
	}
	return reader.read_line(outputFd, line, deadline, cancel);
}

void BackendProcess::start_drain()
{
	if ((outputFd < 0) || drainThread.joinable())
	{
		return;
	}
	drainThread = std::thread([this]() {
		std::string line;
		while (!stopDrain.load())
		{
			int ret = reader.read_line(
			  outputFd,
			  line,
			  FdLineReader::Clock::now() + CancellationFlag::PollInterval,
			  nullptr);
			if (ret == 0)
			{
				Debug::log("{}: {}", childPid, line);
			}
			else if ((ret != -ETIMEDOUT) && (ret != -EPROTO))
			{
				break;
			}
		}
	});
}

void BackendProcess::stop_drain()
{
	if (drainThread.joinable())
	{
		stopDrain = true;
		drainThread.join();
	}
	if (outputFd >= 0)
	{
		::close(outputFd);
		outputFd = -1;
	}
}

bool BackendProcess::reap(bool block)
{
	if (reaped)
	{
		return true;
	}
	while (true)
	{
		int   status;
		pid_t ret = waitpid(childPid, &status, block ? 0 : WNOHANG);
		if (ret == childPid)
		{
			reaped     = true;
			waitStatus = status;
			Debug::log("Backend {} exited with status {}", childPid, status);
			return true;
		}
		if ((ret < 0) && (errno == EINTR))
		{
			continue;
		}
		if (ret < 0)
		{
			// ECHILD: someone else reaped it.  Nothing more can be done.
			Debug::log("waitpid({}) failed: {}", childPid, -errno);
			reaped = true;
			return true;
		}
		return false;
	}
}

int BackendProcess::terminate(std::chrono::milliseconds grace)
{
	if (childPid <= 0)
	{
		return 0;
	}
	if (!reap(false))
	{
		Debug::log("Sending SIGINT to backend {}", childPid);
		if ((killpg(childPid, SIGINT) != 0) && (errno != ESRCH))
		{
			Debug::log("killpg({}, SIGINT) failed: {}", childPid, -errno);
		}
		auto deadline = std::chrono::steady_clock::now() + grace;
		while (!reap(false) && (std::chrono::steady_clock::now() < deadline))
		{
			std::this_thread::sleep_for(ReapInterval);
		}
		if (!reaped)
		{
			Debug::log("Backend {} ignored SIGINT, killing it", childPid);
			if ((killpg(childPid, SIGKILL) != 0) && (errno != ESRCH))
			{
				Debug::log("killpg({}, SIGKILL) failed: {}", childPid, -errno);
			}
			reap(true);
		}
	}
	// Take down anything the backend left behind in its group.
	if ((killpg(childPid, SIGKILL) != 0) && (errno != ESRCH))
	{
		Debug::log("killpg({}, SIGKILL) failed: {}", childPid, -errno);
	}
	stop_drain();
	childPid = -1;
	return waitStatus;
}
