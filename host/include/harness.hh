// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <backend.hh>
#include <cancellation.hh>
#include <errno.h>
#include <endpoint.hh>
#include <memory>
#include <string>
#include <string_view>
#include <utils.hh>

namespace CycleBench
{
	/**
	 * Runs a workload against a freshly started backend.
	 *
	 * `start` spawns the backend and reads its diagnostic output until the
	 * matcher recognises the endpoint announcement.  Until that line appears
	 * nothing else happens.  If the output ends, the startup timeout expires,
	 * or the caller cancels first, the backend is torn down and `start` fails
	 * with `-EBACKENDSTARTUP` (or `-ECANCELED`).
	 *
	 * The backend lives until `stop` or destruction, so it always outlives
	 * any use of the endpoint by a workload run through `run`.
	 */
	class Harness : private utils::NoCopyNoMove
	{
		BackendConfig                    config;
		std::unique_ptr<EndpointMatcher> matcher;
		const CancellationFlag          *cancel;
		std::unique_ptr<BackendProcess>  backend;
		std::string                      discoveredEndpoint;

		/**
		 * Stops the backend when a workload leaves `run`, by any path.
		 */
		struct StopOnExit
		{
			Harness &harness;

			~StopOnExit()
			{
				harness.stop();
			}
		};

		public:
		/**
		 * Create a harness for `config`.  If `matcher` is null, the default
		 * for the backend kind is used.
		 */
		explicit Harness(BackendConfig                    config,
		                 std::unique_ptr<EndpointMatcher> matcher = nullptr,
		                 const CancellationFlag          *cancel  = nullptr);

		~Harness();

		/**
		 * Start the backend and wait for its endpoint.
		 */
		int start();

		/**
		 * Terminate the backend (SIGINT, then SIGKILL after the grace
		 * period).  Does nothing if it is not running.
		 */
		void stop();

		/**
		 * The discovered endpoint.  Empty unless `start` succeeded.
		 */
		[[nodiscard]] const std::string &endpoint() const
		{
			return discoveredEndpoint;
		}

		/**
		 * The backend's process id, or -1 if there is none.
		 */
		[[nodiscard]] pid_t backend_pid() const
		{
			return backend ? backend->pid() : -1;
		}

		/**
		 * Start the backend, call `workload` with the endpoint, and stop the
		 * backend however the workload finishes, including by throwing.
		 * Returns the startup error or the workload's result.
		 */
		template<typename Workload>
		int run(Workload &&workload)
		{
			int ret = start();
			if (ret != 0)
			{
				return ret;
			}
			StopOnExit stopOnExit{*this};
			if (is_cancelled(cancel))
			{
				return -ECANCELED;
			}
			return workload(std::string_view{discoveredEndpoint});
		}
	};
} // namespace CycleBench
