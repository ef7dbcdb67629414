// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include "mock_platform.hh"
#include <deque>
#include <dispatcher.hh>
#include <errno.h>
#include <line_channel.hh>
#include <string>
#include <vector>

/**
 * A channel whose other end is a dispatcher running on `MockPlatform`.  Each
 * line written is handed to the dispatcher, which answers it immediately.
 * Reads never block: with nothing to read they time out at once.
 */
class LoopbackChannel final : public CycleBench::LineChannel
{
	/// Responses that have arrived and not yet been read.
	std::deque<std::string> received;
	/// Responses that will arrive only after the next line is written.
	std::deque<std::string> late;

	public:
	MockPlatform                         platform;
	CycleBench::Dispatcher<MockPlatform> dispatcher{platform,
	                                                MockBenchmarkTable};
	/// Every line written, in order.
	std::vector<std::string> sent;
	/// When set, responses are held back until the next write.
	bool delayResponses = false;
	/// When set, responses are lost.
	bool dropResponses = false;
	/// When set, the link behaves as if the device had gone away.
	bool disconnected = false;

	LoopbackChannel()
	{
		MockBenchmarks::reset(platform);
		platform.now = 1'000'000;
	}

	/**
	 * Make `line` available to the next read, ahead of any response.
	 */
	void inject(std::string line)
	{
		received.push_back(std::move(line));
	}

	int write_line(std::string_view line) override
	{
		if (disconnected)
		{
			return -ENOTCONN;
		}
		sent.emplace_back(line);
		received.insert(received.end(), late.begin(), late.end());
		late.clear();
		platform.send(line);
		dispatcher.step();
		auto responses = platform.take_lines();
		if (dropResponses)
		{
			return 0;
		}
		for (auto &response : responses)
		{
			(delayResponses ? late : received).push_back(std::move(response));
		}
		return 0;
	}

	int read_line(std::string &line, std::chrono::milliseconds) override
	{
		if (disconnected)
		{
			return -ENOTCONN;
		}
		if (received.empty())
		{
			return -ETIMEDOUT;
		}
		line = std::move(received.front());
		received.pop_front();
		return 0;
	}

	void discard_input() override
	{
		received.clear();
	}
};
