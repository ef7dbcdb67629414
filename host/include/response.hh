// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <optional>
#include <protocol.hh>
#include <string>
#include <string_view>
#include <vector>

namespace CycleBench::Protocol
{
	/**
	 * One entry in a `LIST` response.
	 */
	struct BenchmarkEntry
	{
		uint32_t    id = 0;
		std::string name;

		bool operator==(const BenchmarkEntry &) const = default;
	};

	/**
	 * A decoded response.  Only the fields relevant to `tag` are set.
	 */
	struct Response
	{
		ResponseTag tag    = ResponseTag::Ack;
		SuiteStatus status = SuiteStatus::Ready;
		ErrorCode   error  = ErrorCode::None;
		/// Entries of a `List`.
		std::vector<BenchmarkEntry> benchmarks;
		/// Aggregate of a `Result`.
		ResultSummary result;
		/// Individual samples of a `Result`, if they were requested.
		std::optional<std::vector<uint64_t>> samples;

		bool operator==(const Response &) const = default;
	};

	/**
	 * A byte sink that appends to a string.
	 */
	struct StringSink
	{
		std::string &output;

		void put(char c)
		{
			output.push_back(c);
		}
	};

	/**
	 * Decode one response line (without its terminator).  Returns
	 * `ErrorCode::None` on success, `UnknownTag` for an unrecognised first
	 * token and `FramingError` for anything else that is malformed, including
	 * a `LIST` whose count does not match its entries.
	 */
	ErrorCode decode_response(std::string_view line, Response &response);

	/**
	 * Encode a response as a single line, without the terminator.
	 */
	std::string encode(const Response &response);

	/**
	 * Encode a command as a single line, without the terminator.
	 */
	std::string encode(const Command &command);

	/**
	 * Returns true if `line` is a device diagnostic rather than a response.
	 */
	inline bool is_diagnostic(std::string_view line)
	{
		return !line.empty() && (line.front() == DiagnosticPrefix);
	}
} // namespace CycleBench::Protocol
