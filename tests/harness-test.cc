// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#define TEST_NAME "Harness"
#include "tests.hh"
#include <algorithm>
#include <cyclebench-errno.h>
#include <fcntl.h>
#include <fd_reader.hh>
#include <harness.hh>
#include <numeric>
#include <serial.hh>
#include <session.hh>
#include <signal.h>
#include <sstream>
#include <stdexcept>
#include <stdlib.h>
#include <unistd.h>
#include <workload.hh>

#ifndef FAKE_BACKEND_PATH
#	error FAKE_BACKEND_PATH must name the fake backend executable
#endif

using namespace CycleBench;
using namespace std::chrono_literals;

namespace
{
	/**
	 * A custom backend running the fake, announcing the way QEMU does.
	 */
	BackendConfig fake_backend(std::vector<std::string> arguments = {})
	{
		BackendConfig config{.kind           = BackendKind::Custom,
		                     .customPattern  = R"(redirected to (\S+))",
		                     .startupTimeout = 10s,
		                     .grace          = 2s};
		config.customCommand.push_back(FAKE_BACKEND_PATH);
		config.customCommand.insert(
		  config.customCommand.end(), arguments.begin(), arguments.end());
		return config;
	}

	/**
	 * Returns true once `pid` no longer names a process.
	 */
	bool process_gone(pid_t pid)
	{
		return (kill(pid, 0) != 0) && (errno == ESRCH);
	}

	std::chrono::milliseconds
	elapsed_since(std::chrono::steady_clock::time_point start)
	{
		return std::chrono::duration_cast<std::chrono::milliseconds>(
		  std::chrono::steady_clock::now() - start);
	}

	void test_matchers()
	{
		QemuEndpointMatcher qemu;
		TEST(qemu.match("char device redirected to /dev/pts/3 (label serial0)") ==
		       std::optional<std::string>{"/dev/pts/3"},
		     "QEMU announcement not recognised");
		TEST(!qemu.match("qemu-system-riscv32: warning: something"),
		     "QEMU warning taken for an announcement");

		VerilatorEndpointMatcher verilator;
		TEST(verilator.match("UART: Created /dev/pts/5 for uart0. Connect to "
		                     "it with any terminal program.") ==
		       std::optional<std::string>{"/dev/pts/5"},
		     "Simulator announcement not recognised");
		TEST(!verilator.match("UART: Created /dev/pts/6 for uart1."),
		     "Announcement for another UART accepted");
		TEST(!verilator.match("char device redirected to /dev/pts/3"),
		     "QEMU announcement accepted by the simulator matcher");

		auto custom = PatternEndpointMatcher::create(R"(listening on (\S+))");
		TEST(custom != nullptr, "Valid pattern rejected");
		TEST(custom->match("server listening on /tmp/sock now") ==
		       std::optional<std::string>{"/tmp/sock"},
		     "Custom announcement not recognised");
		TEST(PatternEndpointMatcher::create("(") == nullptr,
		     "Invalid pattern accepted");
		TEST(PatternEndpointMatcher::create("no group") == nullptr,
		     "Pattern without a capture group accepted");
	}

	void test_configuration()
	{
		TEST(parse_backend_kind("qemu") == BackendKind::FunctionalEmulator,
		     "qemu");
		TEST(parse_backend_kind("functional-emulator") ==
		       BackendKind::FunctionalEmulator,
		     "functional-emulator");
		TEST(parse_backend_kind("verilator") ==
		       BackendKind::CycleAccurateSimulator,
		     "verilator");
		TEST(parse_backend_kind("custom") == BackendKind::Custom, "custom");
		TEST(!parse_backend_kind("spike"), "Unknown backend accepted");

		BackendConfig qemu;
		TEST(backend_command(qemu).empty(), "QEMU started without firmware");
		qemu.firmware = "firmware.bin";
		auto command  = backend_command(qemu);
		TEST(!command.empty(), "No QEMU command");
		TEST_EQUAL(command.front(), qemu.qemu, "QEMU binary");
		TEST_EQUAL(command.back(), qemu.firmware, "QEMU firmware");
		TEST(std::find(command.begin(), command.end(), "pty") != command.end(),
		     "QEMU serial port is not a pseudo-terminal");

		BackendConfig simulator{.kind     = BackendKind::CycleAccurateSimulator,
		                        .firmware = "build/firmware.elf"};
		TEST(backend_command(simulator).empty(),
		     "Simulator started without its artifacts");
		setenv("VERILATOR_SIM", "/opt/sim", 1);
		setenv("VERILATOR_ROM", "rom.vmem", 1);
		setenv("VERILATOR_OTP", "otp.vmem", 1);
		simulator.load_environment();
		unsetenv("VERILATOR_SIM");
		unsetenv("VERILATOR_ROM");
		unsetenv("VERILATOR_OTP");
		std::vector<std::string> expected{"/opt/sim",
		                                  "--meminit=rom,rom.vmem",
		                                  "--meminit=flash,build/firmware.elf",
		                                  "--meminit=otp,otp.vmem"};
		TEST(backend_command(simulator) == expected,
		     "Unexpected simulator command");

		BackendConfig custom{.kind = BackendKind::Custom, .customPattern = "("};
		TEST(make_matcher(custom) == nullptr, "Invalid custom pattern");
	}

	void test_overlong_lines()
	{
		int fds[2];
		TEST(pipe2(fds, O_NONBLOCK | O_CLOEXEC) == 0, "pipe2 failed: {}", errno);
		std::string input = std::string(FdLineReader::MaxLineLength, 'a') + "\n" +
		                    std::string(5000, 'x') + "\nACK\r\n" +
		                    std::string(5000, 'y');
		TEST_EQUAL(write(fds[1], input.data(), input.size()),
		           static_cast<ssize_t>(input.size()),
		           "Short write to pipe");
		close(fds[1]);

		FdLineReader reader;
		std::string  line;
		auto         deadline =
		  FdLineReader::Clock::now() + std::chrono::seconds{5};
		TEST_SUCCESS(reader.read_line(fds[0], line, deadline));
		TEST_EQUAL(line.size(),
		           FdLineReader::MaxLineLength,
		           "Line of the maximum length was not kept");
		TEST_EQUAL(reader.read_line(fds[0], line, deadline),
		           -EPROTO,
		           "Overlong line was not reported");
		TEST_SUCCESS(reader.read_line(fds[0], line, deadline));
		TEST_EQUAL(line, std::string{"ACK"}, "Line after an overlong one");
		TEST_EQUAL(reader.read_line(fds[0], line, deadline),
		           -EPROTO,
		           "Overlong final line was not reported");
		TEST_EQUAL(reader.read_line(fds[0], line, deadline),
		           -ENOTCONN,
		           "Dropped bytes resurfaced at end of file");
		close(fds[0]);
	}

	void test_session_over_pseudo_terminal()
	{
		Harness harness{fake_backend({"--announce-delay", "100"})};
		TEST_SUCCESS(harness.start());
		pid_t pid = harness.backend_pid();
		TEST(pid > 0, "No backend process");
		TEST(harness.endpoint().starts_with("/dev/pts/"),
		     "Unexpected endpoint {}",
		     harness.endpoint());

		{
			SerialPort port;
			TEST_SUCCESS(port.open(harness.endpoint()));
			Session session{port, 10s};
			TEST_SUCCESS(session.handshake());

			std::vector<Protocol::BenchmarkEntry> benchmarks;
			TEST_SUCCESS(session.list(benchmarks));
			TEST_EQUAL(benchmarks.size(), size_t(7), "Resident benchmarks");
			TEST((benchmarks.back() ==
			      Protocol::BenchmarkEntry{.id = 7, .name = "crc32"}),
			     "Checksum benchmark missing");

			RunResult result;
			TEST_SUCCESS(session.run(7, std::nullopt, false, result));
			TEST_EQUAL(result.summary.status, 0, "Checksum self-check");
			TEST_EQUAL(
			  result.summary.iterations, uint32_t(8), "Default iterations");
			TEST(result.summary.min <= result.summary.max,
			     "Minimum above maximum");

			TEST_SUCCESS(session.run(2, 4, true, result));
			TEST_EQUAL(result.samples.size(), size_t(4), "Captured samples");
			TEST_EQUAL(std::accumulate(result.samples.begin(),
			                           result.samples.end(),
			                           uint64_t(0)),
			           result.summary.total,
			           "Samples must add up to the total");

			RunResult unknown;
			TEST_EQUAL(session.run(42, std::nullopt, false, unknown),
			           -ENOENT,
			           "Unknown benchmark on the device");
			TEST_SUCCESS(session.done());
		}

		harness.stop();
		TEST(process_gone(pid), "Backend {} survived stop", pid);
		TEST(harness.endpoint().empty(), "Endpoint kept after stop");
		TEST_EQUAL(harness.backend_pid(), -1, "Backend kept after stop");
	}

	void test_backend_announcements()
	{
		BackendConfig qemu{.kind           = BackendKind::FunctionalEmulator,
		                   .firmware       = "firmware.bin",
		                   .qemu           = FAKE_BACKEND_PATH,
		                   .startupTimeout = 10s};
		Harness       qemuHarness{qemu};
		TEST_SUCCESS(qemuHarness.start());
		TEST(!qemuHarness.endpoint().empty(), "No QEMU endpoint");
		qemuHarness.stop();

		BackendConfig simulator{.kind     = BackendKind::CycleAccurateSimulator,
		                        .firmware = "firmware.elf",
		                        .verilatorSimulator = FAKE_BACKEND_PATH,
		                        .verilatorRom       = "rom.vmem",
		                        .verilatorOtp       = "otp.vmem",
		                        .startupTimeout     = 10s};
		Harness       simulatorHarness{simulator};
		TEST_SUCCESS(simulatorHarness.start());
		TEST(simulatorHarness.endpoint().starts_with("/dev/pts/"),
		     "Unexpected simulator endpoint {}",
		     simulatorHarness.endpoint());
	}

	void test_startup_failures()
	{
		Harness exits{fake_backend({"--exit-early"})};
		TEST_EQUAL(exits.start(),
		           -EBACKENDSTARTUP,
		           "Backend that exited was started");
		TEST_EQUAL(exits.backend_pid(), -1, "Failed backend kept");
		TEST(exits.endpoint().empty(), "Endpoint from a failed backend");

		BackendConfig silentConfig   = fake_backend({"--silent"});
		silentConfig.startupTimeout = 300ms;
		Harness silent{silentConfig};
		auto    start = std::chrono::steady_clock::now();
		TEST_EQUAL(silent.start(),
		           -EBACKENDSTARTUP,
		           "Silent backend was started");
		auto waited = elapsed_since(start);
		TEST(waited >= 300ms,
		     "Gave up after {} ms",
		     static_cast<int64_t>(waited.count()));
		TEST(waited < 5s,
		     "Took {} ms to give up",
		     static_cast<int64_t>(waited.count()));

		BackendConfig missing = fake_backend();
		missing.customCommand = {"/nonexistent/cyclebench-backend"};
		Harness absent{missing};
		TEST_EQUAL(absent.start(),
		           -EBACKENDSTARTUP,
		           "Missing executable was started");

		CancellationFlag cancel;
		cancel.cancel();
		Harness cancelled{fake_backend({"--silent"}), nullptr, &cancel};
		TEST_EQUAL(cancelled.start(), -ECANCELED, "Cancelled startup");
	}

	void test_stubborn_backend()
	{
		BackendConfig config = fake_backend({"--ignore-sigint"});
		config.grace         = 300ms;
		Harness harness{config};
		TEST_SUCCESS(harness.start());
		pid_t pid   = harness.backend_pid();
		auto  start = std::chrono::steady_clock::now();
		harness.stop();
		auto waited = elapsed_since(start);
		TEST(process_gone(pid), "Backend {} ignoring SIGINT survived", pid);
		TEST(waited >= 300ms,
		     "SIGKILL sent after {} ms, before the grace period",
		     static_cast<int64_t>(waited.count()));
	}

	void test_workload_exit_paths()
	{
		pid_t pid = -1;
		{
			Harness harness{fake_backend()};
			bool    caught = false;
			try
			{
				harness.run([&](std::string_view) -> int {
					pid = harness.backend_pid();
					throw std::runtime_error("workload failed");
				});
			}
			catch (const std::runtime_error &)
			{
				caught = true;
			}
			TEST(caught, "Exception from the workload was lost");
			TEST(pid > 0, "Workload did not run");
			TEST(process_gone(pid), "Backend {} survived an exception", pid);
		}

		Harness harness{fake_backend()};
		int     ret = harness.run([&](std::string_view) {
			pid = harness.backend_pid();
			return -EPROTO;
		});
		TEST_EQUAL(ret, -EPROTO, "Workload result not returned");
		TEST(process_gone(pid), "Backend {} survived a failed workload", pid);

		std::ostringstream output;
		ret = harness.run([&](std::string_view endpoint) {
			SerialPort port;
			int        opened = port.open(std::string{endpoint});
			if (opened != 0)
			{
				return opened;
			}
			WorkloadOptions options{.runs    = {{.id = 7}, {.id = 3}},
			                        .timeout = 10s};
			return run_workload(port, options, output);
		});
		TEST_SUCCESS(ret);
		std::string text = output.str();
		TEST(text.starts_with("7 crc32 iterations=8 "),
		     "Unexpected output '{}'",
		     text);
		TEST(text.find("\n3 call_and_return iterations=16 ") !=
		       std::string::npos,
		     "Unexpected output '{}'",
		     text);
	}
} // namespace

int test_harness()
{
	test_matchers();
	test_overlong_lines();
	test_configuration();
	test_session_over_pseudo_terminal();
	test_backend_announcements();
	test_startup_failures();
	test_stubborn_backend();
	test_workload_exit_paths();
	debug_log("All harness tests passed");
	return 0;
}
