// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <cdefs.h>
#include <charconv>
#include <concepts>
#include <magic_enum/magic_enum.hpp>
#include <optional>
#include <stddef.h>
#include <stdint.h>
#include <string_view>
#include <utils.hh>

/**
 * The line-oriented wire protocol spoken between the host and the device.
 *
 * Every unit is one line of printable ASCII terminated by `\n`.  Tokens are
 * separated by spaces, tags are case-insensitive when decoding and upper case
 * when encoding, and numbers are unsigned decimal (except the benchmark status
 * in a result, which is signed).  Lines starting with `#` are diagnostics
 * printed by the device and are never responses.
 *
 * This header is shared by the firmware and the host tools and so must not
 * allocate or throw.
 */
namespace CycleBench::Protocol
{
	/**
	 * The longest command line that the device will accept, excluding the
	 * terminator.  Longer lines are discarded and reported as framing errors.
	 */
	constexpr size_t MaxCommandLength = 128;

	/**
	 * The maximum number of per-iteration samples that a single run may ask
	 * the device to return.
	 */
	constexpr uint32_t MaxCapturedSamples = 64;

	/// Prefix that marks a device diagnostic line.
	constexpr char DiagnosticPrefix = '#';

	/// Optional trailing keyword on `RUN` asking for individual samples.
	constexpr std::string_view CaptureKeyword = "CAPTURE";

	/// Keyword introducing the captured samples in a `RESULT`.
	constexpr std::string_view SamplesKeyword = "SAMPLES";

	/**
	 * Commands, sent from the host to the device.
	 */
	enum class CommandTag : uint8_t
	{
		/// Enumerate the resident benchmarks.
		List,
		/// Run one benchmark.
		Run,
		/// Liveness check, answered with `Ack`.
		Ping,
		/// Ask whether the suite is ready.
		Status,
		/// Tell the suite that the host has finished.
		Done,
		/// Acknowledge and then stop the device with an exit code.
		Suspend,
		/// Host-side only: bytes forwarded verbatim, never decoded.
		Raw,
	};

	/**
	 * Responses, sent from the device to the host.
	 */
	enum class ResponseTag : uint8_t
	{
		Ack,
		Status,
		List,
		Result,
		Error,
	};

	/**
	 * The state reported in a `STATUS` response.
	 */
	enum class SuiteStatus : uint8_t
	{
		Ready,
		Done,
	};

	/**
	 * Error codes carried in an `ERROR` response.  Also used as the result of
	 * decoding.
	 */
	enum class ErrorCode : uint8_t
	{
		/// Not an error.
		None = 0,
		/// The line was malformed, truncated, or too long.
		FramingError,
		/// The first token was not a recognised tag.
		UnknownTag,
		/// No resident benchmark has the requested id.
		UnknownId,
		/// A measurement ended before it started.
		CounterFault,
		/// The arguments were well formed but not acceptable.
		InvalidArgument,
	};

	/**
	 * A decoded command.  Fields that a tag does not use are left at their
	 * default values so that two equal commands compare equal.
	 */
	struct Command
	{
		CommandTag tag = CommandTag::Ping;
		/// Benchmark id, for `Run`.
		uint32_t id = 0;
		/// Requested iterations for `Run`, absent to use the default.
		std::optional<uint32_t> iterations;
		/// Whether `Run` should return individual samples.
		bool capture = false;
		/// Exit code, for `Suspend`.
		uint32_t code = 0;
		/// The verbatim line, for `Raw`.
		std::string_view raw;

		bool operator==(const Command &) const = default;
	};

	/**
	 * The aggregate timing for one run of a benchmark.
	 */
	struct ResultSummary
	{
		uint32_t id = 0;
		/// Zero, or the first non-zero status returned by the benchmark.
		int32_t status = 0;
		/// The number of iterations that completed.
		uint32_t iterations = 0;
		/// Saturating sum of the per-iteration cycle counts.
		uint64_t total = 0;
		uint64_t min   = 0;
		uint64_t max   = 0;

		bool operator==(const ResultSummary &) const = default;
	};

	/**
	 * Splits a line into space-separated tokens.
	 */
	class Tokenizer
	{
		std::string_view rest;

		void skip_spaces()
		{
			while (!rest.empty() && rest.front() == ' ')
			{
				rest.remove_prefix(1);
			}
		}

		public:
		explicit Tokenizer(std::string_view line) : rest(line) {}

		/**
		 * Returns the next token, or nothing if the line is exhausted.
		 */
		std::optional<std::string_view> next()
		{
			skip_spaces();
			if (rest.empty())
			{
				return std::nullopt;
			}
			size_t end = rest.find(' ');
			if (end == std::string_view::npos)
			{
				end = rest.size();
			}
			std::string_view token = rest.substr(0, end);
			rest.remove_prefix(end);
			return token;
		}

		/**
		 * Returns true if no tokens remain.
		 */
		bool empty()
		{
			skip_spaces();
			return rest.empty();
		}
	};

	/**
	 * Parse a decimal integer that must occupy the whole token.  Returns
	 * nothing for empty tokens, stray characters, or values out of range.
	 */
	template<std::integral T>
	std::optional<T> parse_number(std::string_view token)
	{
		if (token.empty() || token.front() == '+')
		{
			return std::nullopt;
		}
		T value{};
		auto [end, error] =
		  std::from_chars(token.data(), token.data() + token.size(), value);
		if ((error != std::errc{}) || (end != token.data() + token.size()))
		{
			return std::nullopt;
		}
		return value;
	}

	/**
	 * Case-insensitive comparison of two tokens.
	 */
	inline bool token_equals(std::string_view a, std::string_view b)
	{
		if (a.size() != b.size())
		{
			return false;
		}
		for (size_t i = 0; i < a.size(); i++)
		{
			if (!utils::ascii_equal_ignore_case(a[i], b[i]))
			{
				return false;
			}
		}
		return true;
	}

	/**
	 * Map a token to an enumerator by name, ignoring case.
	 */
	template<typename E>
	std::optional<E> parse_enum(std::string_view token)
	{
		return magic_enum::enum_cast<E>(token, &utils::ascii_equal_ignore_case);
	}

	/**
	 * Anything that accepts encoded output one character at a time.
	 */
	template<typename T>
	concept IsByteSink = requires(T &sink, char c) {
		{ sink.put(c) };
	};

	/**
	 * Low-level writer for wire tokens.  Shared by the command and response
	 * encoders.
	 */
	template<IsByteSink Sink>
	class TokenWriter
	{
		protected:
		Sink &sink;

		void put(char c)
		{
			sink.put(c);
		}

		void put(std::string_view text)
		{
			for (char c : text)
			{
				sink.put(c);
			}
		}

		/// Writes an enumerator name in upper case.
		template<typename E>
		void put_upper(E value)
		{
			for (char c : magic_enum::enum_name(value))
			{
				sink.put(utils::ascii_upper(c));
			}
		}

		template<std::integral T>
		void put_number(T value)
		{
			// Large enough for a signed 64-bit value in decimal.
			std::array<char, 24> buffer;
			auto [end, error] =
			  std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
			put(std::string_view(buffer.data(),
			                     static_cast<size_t>(end - buffer.data())));
		}

		void space()
		{
			sink.put(' ');
		}

		public:
		explicit TokenWriter(Sink &sink) : sink(sink) {}

		/**
		 * Terminates the current line.
		 */
		void end()
		{
			sink.put('\n');
		}
	};

	/**
	 * Encodes complete command lines, including the terminator.
	 */
	template<IsByteSink Sink>
	class CommandEncoder : public TokenWriter<Sink>
	{
		using Base = TokenWriter<Sink>;

		public:
		using Base::Base;

		void encode(const Command &command)
		{
			if (command.tag == CommandTag::Raw)
			{
				Base::put(command.raw);
				Base::end();
				return;
			}
			Base::put_upper(command.tag);
			switch (command.tag)
			{
				case CommandTag::Run:
					Base::space();
					Base::put_number(command.id);
					if (command.iterations)
					{
						Base::space();
						Base::put_number(*command.iterations);
					}
					if (command.capture)
					{
						Base::space();
						Base::put(CaptureKeyword);
					}
					break;
				case CommandTag::Suspend:
					Base::space();
					Base::put_number(command.code);
					break;
				default:
					break;
			}
			Base::end();
		}
	};

	/**
	 * Encodes response lines.  `ack`, `status` and `error` write complete
	 * lines.  Lists and results are streamed and must be finished with `end`,
	 * so that the device never needs to buffer a whole response.
	 */
	template<IsByteSink Sink>
	class ResponseEncoder : public TokenWriter<Sink>
	{
		using Base = TokenWriter<Sink>;

		public:
		using Base::Base;

		void ack()
		{
			Base::put_upper(ResponseTag::Ack);
			Base::end();
		}

		void status(SuiteStatus status)
		{
			Base::put_upper(ResponseTag::Status);
			Base::space();
			Base::put_upper(status);
			Base::end();
		}

		/**
		 * Error codes travel by their enumerator name, for example
		 * `ERROR UnknownId`.
		 */
		void error(ErrorCode code)
		{
			Base::put_upper(ResponseTag::Error);
			Base::space();
			Base::put(magic_enum::enum_name(code));
			Base::end();
		}

		void begin_list(size_t count)
		{
			Base::put_upper(ResponseTag::List);
			Base::space();
			Base::put_number(count);
		}

		void list_entry(uint32_t id, std::string_view name)
		{
			Base::space();
			Base::put_number(id);
			Base::space();
			Base::put(name);
		}

		void result(const ResultSummary &summary)
		{
			Base::put_upper(ResponseTag::Result);
			Base::space();
			Base::put_number(summary.id);
			Base::space();
			Base::put_number(summary.status);
			Base::space();
			Base::put_number(summary.iterations);
			Base::space();
			Base::put_number(summary.total);
			Base::space();
			Base::put_number(summary.min);
			Base::space();
			Base::put_number(summary.max);
		}

		void begin_samples()
		{
			Base::space();
			Base::put(SamplesKeyword);
		}

		void sample(uint64_t cycles)
		{
			Base::space();
			Base::put_number(cycles);
		}
	};

	/**
	 * Decode one command line (without its terminator).  On success, fills in
	 * `command` and returns `ErrorCode::None`.  Returns `UnknownTag` if the
	 * first token does not name a command and `FramingError` for any other
	 * malformed input.  `command` is unspecified on failure.
	 *
	 * `Raw` is never produced: it is not a wire tag.
	 */
	inline ErrorCode decode_command(std::string_view line, Command &command)
	{
		command = Command{};
		Tokenizer tokens{line};
		auto      tagToken = tokens.next();
		if (!tagToken)
		{
			return ErrorCode::FramingError;
		}
		auto tag = parse_enum<CommandTag>(*tagToken);
		if (!tag || (*tag == CommandTag::Raw))
		{
			return ErrorCode::UnknownTag;
		}
		command.tag = *tag;
		switch (*tag)
		{
			case CommandTag::Run:
			{
				auto idToken = tokens.next();
				if (!idToken)
				{
					return ErrorCode::FramingError;
				}
				auto id = parse_number<uint32_t>(*idToken);
				if (!id)
				{
					return ErrorCode::FramingError;
				}
				command.id = *id;
				auto token = tokens.next();
				if (token && !token_equals(*token, CaptureKeyword))
				{
					command.iterations = parse_number<uint32_t>(*token);
					if (!command.iterations)
					{
						return ErrorCode::FramingError;
					}
					token = tokens.next();
				}
				if (token)
				{
					if (!token_equals(*token, CaptureKeyword))
					{
						return ErrorCode::FramingError;
					}
					command.capture = true;
				}
				break;
			}
			case CommandTag::Suspend:
			{
				auto codeToken = tokens.next();
				if (!codeToken)
				{
					return ErrorCode::FramingError;
				}
				auto code = parse_number<uint32_t>(*codeToken);
				if (!code)
				{
					return ErrorCode::FramingError;
				}
				command.code = *code;
				break;
			}
			default:
				break;
		}
		if (!tokens.empty())
		{
			return ErrorCode::FramingError;
		}
		return ErrorCode::None;
	}

	/**
	 * The outcome of feeding one byte to a `LineAssembler`.
	 */
	enum class FeedResult : uint8_t
	{
		/// More bytes are needed.
		Incomplete,
		/// A complete, non-empty line is available from `line()`.
		Complete,
		/// A line longer than the capacity was discarded.
		Overflow,
	};

	/**
	 * Incremental line framing over a fixed buffer.  Bytes are fed one at a
	 * time as they arrive.  Carriage returns are ignored and empty lines are
	 * skipped.  A line longer than `Capacity` is dropped up to its terminator
	 * and reported once, as `Overflow`, when the terminator arrives.
	 */
	template<size_t Capacity>
	class LineAssembler
	{
		std::array<char, Capacity> buffer;
		size_t                     length     = 0;
		bool                       discarding = false;
		bool                       complete   = false;

		public:
		FeedResult feed(char c)
		{
			if (complete)
			{
				reset();
			}
			if (c == '\r')
			{
				return FeedResult::Incomplete;
			}
			if (c == '\n')
			{
				if (discarding)
				{
					reset();
					return FeedResult::Overflow;
				}
				if (length == 0)
				{
					return FeedResult::Incomplete;
				}
				complete = true;
				return FeedResult::Complete;
			}
			if (discarding)
			{
				return FeedResult::Incomplete;
			}
			if (length == Capacity)
			{
				discarding = true;
				return FeedResult::Incomplete;
			}
			buffer[length++] = c;
			return FeedResult::Incomplete;
		}

		/**
		 * The most recently completed line.  Valid until the next call to
		 * `feed` or `reset`.
		 */
		[[nodiscard]] std::string_view line() const
		{
			return {buffer.data(), length};
		}

		/**
		 * Drop any partially assembled line.
		 */
		void reset()
		{
			length     = 0;
			discarding = false;
			complete   = false;
		}
	};

} // namespace CycleBench::Protocol
