// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <atomic>
#include <chrono>
#include <line_channel.hh>
#include <optional>
#include <response.hh>
#include <utils.hh>
#include <vector>

namespace CycleBench
{
	/**
	 * The outcome of a successful `Session::run`.
	 */
	struct RunResult
	{
		Protocol::ResultSummary summary;
		/// Per-iteration cycle counts, only filled in for captured runs.
		std::vector<uint64_t> samples;
	};

	/**
	 * A synchronous request/response session with the device.
	 *
	 * At most one command is ever outstanding.  A command that times out is
	 * considered lost: it is never re-sent, and the session refuses further
	 * commands with `-EBUSY` until the caller calls `resynchronise`.  Calls
	 * from a second thread while a command is in flight also fail with
	 * `-EBUSY`.
	 *
	 * Every operation returns zero on success or a negative errno value.
	 * Errors reported by the device map to `-ENOENT` (unknown id),
	 * `-ECOUNTERFAULT`, `-EINVAL` (invalid argument) and `-EPROTO` (framing
	 * or unknown tag).  A response that cannot be decoded, or that does not
	 * answer the command that was sent, is also `-EPROTO`.
	 */
	class Session : private utils::NoCopyNoMove
	{
		public:
		/// The default time to wait for the response to a command.
		static constexpr std::chrono::milliseconds DefaultTimeout{60'000};

		/**
		 * Whether a command is outstanding.
		 */
		enum class Outstanding : uint8_t
		{
			/// Ready for a new command.
			None,
			/// A command has been sent and its response is awaited.
			InFlight,
			/// A command timed out and its response may still arrive.
			Lost,
		};

		explicit Session(LineChannel              &channel,
		                 std::chrono::milliseconds timeout = DefaultTimeout)
		  : channel(channel), timeout(timeout)
		{
		}

		/**
		 * Check that the device is ready (`STATUS`, expecting
		 * `STATUS READY`).
		 */
		int handshake();

		/**
		 * Enumerate the resident benchmarks.
		 */
		int list(std::vector<Protocol::BenchmarkEntry> &benchmarks);

		/**
		 * Run benchmark `id`.  If `iterations` is absent the device uses the
		 * benchmark's default.  With `capture`, the individual samples are
		 * returned as well as the aggregate.
		 */
		int run(uint32_t                id,
		        std::optional<uint32_t> iterations,
		        bool                    capture,
		        RunResult              &result);

		int ping();

		int status(Protocol::SuiteStatus &status);

		/**
		 * Tell the device that the host has finished.  The device answers
		 * `STATUS DONE`.
		 */
		int done();

		/**
		 * Ask the device to stop with `code`.  Succeeds once the device has
		 * acknowledged.
		 */
		int suspend(uint32_t code);

		/**
		 * Recover after a timeout: drop pending input, then send `PING` and
		 * skip lines until its `ACK`, so that a late response to the lost
		 * command cannot be mistaken for the answer to the next one.
		 */
		int resynchronise();

		[[nodiscard]] Outstanding outstanding() const
		{
			return state.load();
		}

		/**
		 * The error code from the most recent `ERROR` response (or host-side
		 * decoding failure), or `None`.
		 */
		[[nodiscard]] Protocol::ErrorCode last_device_error() const
		{
			return lastError;
		}

		private:
		LineChannel                &channel;
		std::chrono::milliseconds   timeout;
		std::atomic<Outstanding>    state{Outstanding::None};
		Protocol::ErrorCode         lastError = Protocol::ErrorCode::None;

		/**
		 * Send `command` and receive the response into `response`.  Device
		 * `ERROR` responses are converted to errno values here.
		 */
		int transact(const Protocol::Command &command,
		             Protocol::Response      &response);

	};

	/**
	 * Read the next line from `channel` that is neither empty nor a device
	 * diagnostic.  Fails with `-ETIMEDOUT` once `deadline` passes, however
	 * many diagnostics arrive before it.
	 */
	int read_response_line(LineChannel                          &channel,
	                       std::string                          &line,
	                       std::chrono::steady_clock::time_point deadline);

	/**
	 * Map a device error code to the errno value reported by the session.
	 */
	int error_code_to_errno(Protocol::ErrorCode code);
} // namespace CycleBench
