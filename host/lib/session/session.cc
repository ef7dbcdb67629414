// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <cyclebench-errno.h>
#include <debug.hh>
#include <session.hh>

#ifndef DEBUG_SESSION
#	define DEBUG_SESSION false
#endif

using namespace CycleBench;
using namespace CycleBench::Protocol;

namespace
{
	using Debug = ConditionalDebug<DEBUG_SESSION, "Session">;

	/**
	 * Returns true if `response` can be the answer to `command`.  Errors can
	 * answer anything.
	 */
	bool answers(const Command &command, const Response &response)
	{
		if (response.tag == ResponseTag::Error)
		{
			return true;
		}
		switch (command.tag)
		{
			case CommandTag::List:
				return response.tag == ResponseTag::List;
			case CommandTag::Run:
				return response.tag == ResponseTag::Result;
			case CommandTag::Ping:
			case CommandTag::Suspend:
				return response.tag == ResponseTag::Ack;
			case CommandTag::Status:
			case CommandTag::Done:
				return response.tag == ResponseTag::Status;
			case CommandTag::Raw:
				return true;
		}
		return false;
	}
} // namespace

int CycleBench::error_code_to_errno(ErrorCode code)
{
	switch (code)
	{
		case ErrorCode::None:
			return 0;
		case ErrorCode::UnknownId:
			return -ENOENT;
		case ErrorCode::CounterFault:
			return -ECOUNTERFAULT;
		case ErrorCode::InvalidArgument:
			return -EINVAL;
		case ErrorCode::FramingError:
		case ErrorCode::UnknownTag:
			return -EPROTO;
	}
	return -EPROTO;
}

int CycleBench::read_response_line(LineChannel                          &channel,
                                   std::string                          &line,
                                   std::chrono::steady_clock::time_point deadline)
{
	while (true)
	{
		auto remaining = std::chrono::ceil<std::chrono::milliseconds>(
		  deadline - std::chrono::steady_clock::now());
		if (remaining.count() <= 0)
		{
			return -ETIMEDOUT;
		}
		int ret = channel.read_line(line, remaining);
		if (ret != 0)
		{
			return ret;
		}
		if (is_diagnostic(line))
		{
			Debug::log("Device: {}", line);
			continue;
		}
		if (line.empty())
		{
			continue;
		}
		return 0;
	}
}

int Session::transact(const Command &command, Response &response)
{
	Outstanding expected = Outstanding::None;
	if (!state.compare_exchange_strong(expected, Outstanding::InFlight))
	{
		Debug::log("Refusing {}: previous command is {}", command.tag, expected);
		return -EBUSY;
	}
	lastError = ErrorCode::None;

	int ret = channel.write_line(encode(command));
	if (ret != 0)
	{
		Debug::log("Failed to send {}: {}", command.tag, ret);
		// Nothing reached the device, so nothing is outstanding.
		state = Outstanding::None;
		return ret;
	}

	std::string line;
	ret = read_response_line(
	  channel, line, std::chrono::steady_clock::now() + timeout);
	if (ret == -ETIMEDOUT)
	{
		Debug::log("Timed out waiting for a response to {}", command.tag);
		state = Outstanding::Lost;
		return ret;
	}
	if (ret == -EPROTO)
	{
		// An overlong line was consumed in place of the response.
		Debug::log("Overlong response to {}", command.tag);
		state     = Outstanding::None;
		lastError = ErrorCode::FramingError;
		return ret;
	}
	if (ret != 0)
	{
		// Cancelled or disconnected: the response may still arrive.
		state = Outstanding::Lost;
		return ret;
	}
	state = Outstanding::None;

	ErrorCode decodeError = decode_response(line, response);
	if (decodeError != ErrorCode::None)
	{
		Debug::log("Undecodable response '{}': {}", line, decodeError);
		lastError = decodeError;
		return -EPROTO;
	}
	if (!answers(command, response))
	{
		Debug::log("Response '{}' does not answer {}", line, command.tag);
		return -EPROTO;
	}
	if (response.tag == ResponseTag::Error)
	{
		Debug::log("Device reported {} for {}", response.error, command.tag);
		lastError = response.error;
		return error_code_to_errno(response.error);
	}
	return 0;
}

int Session::handshake()
{
	SuiteStatus suiteStatus;
	int         ret = status(suiteStatus);
	if (ret != 0)
	{
		return ret;
	}
	return suiteStatus == SuiteStatus::Ready ? 0 : -EPROTO;
}

int Session::list(std::vector<BenchmarkEntry> &benchmarks)
{
	Response response;
	int      ret = transact({.tag = CommandTag::List}, response);
	if (ret != 0)
	{
		return ret;
	}
	benchmarks = std::move(response.benchmarks);
	return 0;
}

int Session::run(uint32_t                id,
                 std::optional<uint32_t> iterations,
                 bool                    capture,
                 RunResult              &result)
{
	Response response;
	int      ret = transact({.tag        = CommandTag::Run,
	                         .id         = id,
	                         .iterations = iterations,
	                         .capture    = capture},
	                        response);
	if (ret != 0)
	{
		return ret;
	}
	if (response.result.id != id)
	{
		Debug::log("Asked for benchmark {}, got a result for {}",
		           id,
		           response.result.id);
		return -EPROTO;
	}
	if (capture &&
	    (!response.samples ||
	     (response.samples->size() != response.result.iterations)))
	{
		Debug::log("Captured run of {} returned the wrong number of samples",
		           id);
		return -EPROTO;
	}
	result.summary = response.result;
	result.samples.clear();
	if (response.samples)
	{
		result.samples = std::move(*response.samples);
	}
	return 0;
}

int Session::ping()
{
	Response response;
	return transact({.tag = CommandTag::Ping}, response);
}

int Session::status(SuiteStatus &suiteStatus)
{
	Response response;
	int      ret = transact({.tag = CommandTag::Status}, response);
	if (ret != 0)
	{
		return ret;
	}
	suiteStatus = response.status;
	return 0;
}

int Session::done()
{
	Response response;
	int      ret = transact({.tag = CommandTag::Done}, response);
	if (ret != 0)
	{
		return ret;
	}
	return response.status == SuiteStatus::Done ? 0 : -EPROTO;
}

int Session::suspend(uint32_t code)
{
	Response response;
	return transact({.tag = CommandTag::Suspend, .code = code}, response);
}

int Session::resynchronise()
{
	Outstanding previous = state.load();
	if ((previous == Outstanding::InFlight) ||
	    !state.compare_exchange_strong(previous, Outstanding::InFlight))
	{
		return -EBUSY;
	}
	Debug::log("Resynchronising (was {})", previous);
	channel.discard_input();
	int ret = channel.write_line(encode(Command{.tag = CommandTag::Ping}));
	if (ret != 0)
	{
		state = previous;
		return ret;
	}
	auto        deadline = std::chrono::steady_clock::now() + timeout;
	std::string line;
	while (true)
	{
		ret = read_response_line(channel, line, deadline);
		if (ret == -EPROTO)
		{
			Debug::log("Discarding a stale overlong line");
			continue;
		}
		if (ret != 0)
		{
			state = Outstanding::Lost;
			return ret;
		}
		Response response;
		if ((decode_response(line, response) == ErrorCode::None) &&
		    (response.tag == ResponseTag::Ack))
		{
			break;
		}
		Debug::log("Discarding stale line '{}'", line);
	}
	state     = Outstanding::None;
	lastError = ErrorCode::None;
	return 0;
}
