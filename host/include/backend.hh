// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <atomic>
#include <cancellation.hh>
#include <chrono>
#include <endpoint.hh>
#include <fd_reader.hh>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include <thread>
#include <utils.hh>
#include <vector>

namespace CycleBench
{
	/**
	 * The kinds of backend that can host the firmware.
	 */
	enum class BackendKind : uint8_t
	{
		/// QEMU's `virt` machine.
		FunctionalEmulator,
		/// The Verilator model of Earl Grey.
		CycleAccurateSimulator,
		/// An arbitrary command with a caller-supplied announcement pattern.
		Custom,
	};

	/**
	 * Parse a backend name as used on the command line
	 * (`functional-emulator`, `cycle-accurate-simulator`, `custom`, or the
	 * short forms `qemu` and `verilator`).
	 */
	std::optional<BackendKind> parse_backend_kind(std::string_view name);

	/**
	 * Everything needed to start a backend.
	 */
	struct BackendConfig
	{
		BackendKind kind = BackendKind::FunctionalEmulator;
		/// Firmware image, passed to the backend unchanged.
		std::string firmware;
		/// QEMU binary.
		std::string qemu = "qemu-system-riscv32";
		/// Verilator simulator binary, boot ROM image and OTP image.
		std::string verilatorSimulator;
		std::string verilatorRom;
		std::string verilatorOtp;
		/// Command line for `Custom` backends.
		std::vector<std::string> customCommand;
		/// Announcement pattern for `Custom` backends.
		std::string customPattern;
		/// How long to wait for the endpoint to be announced.
		std::chrono::milliseconds startupTimeout{60'000};
		/// How long to wait after SIGINT before sending SIGKILL.
		std::chrono::milliseconds grace{2'000};

		/**
		 * Fill in the Verilator artifact paths from `VERILATOR_SIM`,
		 * `VERILATOR_ROM` and `VERILATOR_OTP`, where set.
		 */
		void load_environment();
	};

	/**
	 * The command line that starts the backend described by `config`.
	 * Returns an empty vector if required paths are missing.
	 */
	std::vector<std::string> backend_command(const BackendConfig &config);

	/**
	 * The endpoint matcher for `config`'s backend kind.  Returns null for a
	 * custom backend with an invalid pattern.
	 */
	std::unique_ptr<EndpointMatcher> make_matcher(const BackendConfig &config);

	/**
	 * A backend child process.  The child runs in its own process group with
	 * standard output and standard error merged into one pipe, which is the
	 * diagnostic stream.  Destroying the object terminates the process group
	 * and reaps the child.
	 */
	class BackendProcess : private utils::NoCopyNoMove
	{
		pid_t        childPid = -1;
		int          outputFd = -1;
		FdLineReader reader;
		/// Background reader started by `start_drain`.
		std::thread       drainThread;
		std::atomic<bool> stopDrain{false};
		/// Set once the child has been waited for.
		bool reaped = false;
		/// The status reported by `waitpid`, once reaped.
		int waitStatus = 0;

		BackendProcess(pid_t pid, int outputFd)
		  : childPid(pid), outputFd(outputFd)
		{
		}

		void stop_drain();

		/**
		 * Wait for the child without blocking (if `block` is false).  Returns
		 * true once it has been reaped.
		 */
		bool reap(bool block);

		public:
		/// Grace period used by the destructor.
		static constexpr std::chrono::milliseconds DefaultGrace{2'000};

		/**
		 * Start `argv`.  On success, `process` owns the child and zero is
		 * returned.  Fails with a negative errno value if the pipe or the
		 * fork failed.  A command that cannot be executed is reported by the
		 * child on its diagnostic stream, which then closes.
		 */
		static int spawn(const std::vector<std::string>  &argv,
		                 std::unique_ptr<BackendProcess> &process);

		~BackendProcess();

		[[nodiscard]] pid_t pid() const
		{
			return childPid;
		}

		/**
		 * Read one line of diagnostic output.  Not available after
		 * `start_drain`.
		 */
		int read_line(std::string                      &line,
		              FdLineReader::Clock::time_point   deadline,
		              const CancellationFlag           *cancel);

		/**
		 * Log the remaining diagnostic output on a background thread so that
		 * the backend never blocks on a full pipe.
		 */
		void start_drain();

		/**
		 * Send SIGINT to the process group, wait up to `grace` for the child
		 * to exit, then send SIGKILL.  Always reaps the child.  Returns the
		 * child's wait status, or a negative errno value if it could not be
		 * reaped.  Calling this again after the child has been reaped
		 * returns zero.
		 */
		int terminate(std::chrono::milliseconds grace = DefaultGrace);
	};
} // namespace CycleBench
