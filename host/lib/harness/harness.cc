// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <cyclebench-errno.h>
#include <debug.hh>
#include <harness.hh>

#ifndef DEBUG_HARNESS
#	define DEBUG_HARNESS false
#endif

using namespace CycleBench;

namespace
{
	using Debug = ConditionalDebug<DEBUG_HARNESS, "Harness">;
} // namespace

Harness::Harness(BackendConfig                    config,
                 std::unique_ptr<EndpointMatcher> matcher,
                 const CancellationFlag          *cancel)
  : config(std::move(config)), matcher(std::move(matcher)), cancel(cancel)
{
	if (!this->matcher)
	{
		this->matcher = make_matcher(this->config);
	}
}

Harness::~Harness()
{
	stop();
}

int Harness::start()
{
	stop();
	if (!matcher)
	{
		Debug::log("No endpoint matcher for {}", config.kind);
		return -EINVAL;
	}
	auto command = backend_command(config);
	if (command.empty())
	{
		Debug::log("Incomplete configuration for {}", config.kind);
		return -EINVAL;
	}
	int ret = BackendProcess::spawn(command, backend);
	if (ret != 0)
	{
		Debug::log("Failed to start {}: {}", command[0], ret);
		return ret;
	}
	Debug::Assert(backend != nullptr,
	              "Spawning {} succeeded without a process",
	              command[0]);

	auto        deadline = FdLineReader::Clock::now() + config.startupTimeout;
	std::string line;
	while (true)
	{
		ret = backend->read_line(line, deadline, cancel);
		if (ret == -EPROTO)
		{
			Debug::log("Skipping an overlong line from the backend");
			continue;
		}
		if (ret != 0)
		{
			break;
		}
		Debug::log("backend: {}", line);
		if (auto endpoint = matcher->match(line))
		{
			discoveredEndpoint = std::move(*endpoint);
			Debug::log("Endpoint is {}", discoveredEndpoint);
			backend->start_drain();
			return 0;
		}
	}

	Debug::log("Backend did not announce an endpoint: {}", ret);
	stop();
	return ret == -ECANCELED ? -ECANCELED : -EBACKENDSTARTUP;
}

void Harness::stop()
{
	if (backend)
	{
		int status = backend->terminate(config.grace);
		if (status < 0)
		{
			Debug::log("Failed to reap backend: {}", status);
		}
		backend.reset();
	}
	discoveredEndpoint.clear();
}
