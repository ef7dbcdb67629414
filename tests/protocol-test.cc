// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#define TEST_NAME "Protocol"
#include "tests.hh"
#include <protocol.hh>
#include <response.hh>

using namespace CycleBench::Protocol;

namespace
{
	void test_decode_commands()
	{
		Command command;
		TEST_EQUAL(decode_command("LIST", command), ErrorCode::None, "LIST");
		TEST((command == Command{.tag = CommandTag::List}), "LIST decoded wrong");

		TEST_EQUAL(decode_command("ping", command),
		           ErrorCode::None,
		           "Tags must be case-insensitive");
		TEST(command.tag == CommandTag::Ping, "ping decoded as {}", command.tag);

		TEST_EQUAL(decode_command("  STATUS  ", command),
		           ErrorCode::None,
		           "Surrounding spaces must be ignored");
		TEST_EQUAL(command.tag, CommandTag::Status, "STATUS decoded wrong");

		TEST_EQUAL(decode_command("RUN 3", command), ErrorCode::None, "RUN 3");
		TEST((command == Command{.tag = CommandTag::Run, .id = 3}),
		     "RUN without iterations must leave them absent");

		TEST_EQUAL(
		  decode_command("RUN 3   10", command), ErrorCode::None, "RUN 3 10");
		TEST((command ==
		      Command{.tag = CommandTag::Run, .id = 3, .iterations = 10}),
		     "RUN 3 10 decoded wrong");

		TEST_EQUAL(decode_command("RUN 3 10 CAPTURE", command),
		           ErrorCode::None,
		           "RUN with capture");
		TEST((command == Command{.tag        = CommandTag::Run,
		                         .id         = 3,
		                         .iterations = 10,
		                         .capture    = true}),
		     "RUN 3 10 CAPTURE decoded wrong");

		TEST_EQUAL(decode_command("run 4 capture", command),
		           ErrorCode::None,
		           "RUN with capture and no iterations");
		TEST(command.capture && !command.iterations,
		     "run 4 capture decoded wrong");

		TEST_EQUAL(
		  decode_command("SUSPEND 4", command), ErrorCode::None, "SUSPEND");
		TEST((command == Command{.tag = CommandTag::Suspend, .code = 4}),
		     "SUSPEND 4 decoded wrong");
	}

	void test_reject_malformed_commands()
	{
		struct
		{
			const char *line;
			ErrorCode   expected;
		} cases[] = {
		  {"", ErrorCode::FramingError},
		  {"   ", ErrorCode::FramingError},
		  {"RUN", ErrorCode::FramingError},
		  {"RUN x", ErrorCode::FramingError},
		  {"RUN -1", ErrorCode::FramingError},
		  {"RUN +3", ErrorCode::FramingError},
		  {"RUN 4294967296", ErrorCode::FramingError},
		  {"RUN 3 10 20", ErrorCode::FramingError},
		  {"RUN 3 CAPTURE 10", ErrorCode::FramingError},
		  {"RUN 3 10 CAPTURE extra", ErrorCode::FramingError},
		  {"PING extra", ErrorCode::FramingError},
		  {"SUSPEND", ErrorCode::FramingError},
		  {"SUSPEND two", ErrorCode::FramingError},
		  {"JUMP", ErrorCode::UnknownTag},
		  {"RAW", ErrorCode::UnknownTag},
		  {"ACK", ErrorCode::UnknownTag},
		};
		for (const auto &testCase : cases)
		{
			Command command;
			TEST_EQUAL(decode_command(testCase.line, command),
			           testCase.expected,
			           testCase.line);
		}
	}

	void test_encode_commands()
	{
		TEST_EQUAL(encode(Command{.tag = CommandTag::List}),
		           std::string{"LIST"},
		           "LIST");
		TEST_EQUAL(encode(Command{.tag        = CommandTag::Run,
		                          .id         = 3,
		                          .iterations = 10,
		                          .capture    = true}),
		           std::string{"RUN 3 10 CAPTURE"},
		           "RUN with everything");
		TEST_EQUAL(encode(Command{.tag = CommandTag::Run, .id = 42}),
		           std::string{"RUN 42"},
		           "RUN with defaults");
		TEST_EQUAL(encode(Command{.tag = CommandTag::Suspend, .code = 9}),
		           std::string{"SUSPEND 9"},
		           "SUSPEND");
		TEST_EQUAL(encode(Command{.tag = CommandTag::Raw, .raw = "run 1 x"}),
		           std::string{"run 1 x"},
		           "Raw commands are sent verbatim");

		// Everything the host encodes must decode to the same command.
		Command commands[] = {
		  {.tag = CommandTag::List},
		  {.tag = CommandTag::Ping},
		  {.tag = CommandTag::Status},
		  {.tag = CommandTag::Done},
		  {.tag = CommandTag::Run, .id = 7},
		  {.tag = CommandTag::Run, .id = 7, .capture = true},
		  {.tag = CommandTag::Run, .id = UINT32_MAX, .iterations = 1},
		  {.tag = CommandTag::Suspend, .code = 0},
		};
		for (const auto &command : commands)
		{
			Command decoded;
			std::string line = encode(command);
			TEST_EQUAL(decode_command(line, decoded), ErrorCode::None, line);
			TEST(decoded == command, "'{}' did not decode to itself", line);
		}
	}

	void test_encode_responses()
	{
		std::string                 line;
		StringSink                  sink{line};
		ResponseEncoder<StringSink> encoder{sink};

		encoder.error(ErrorCode::UnknownId);
		TEST_EQUAL(line, std::string{"ERROR UnknownId\n"}, "Error response");
		line.clear();

		encoder.status(SuiteStatus::Done);
		TEST_EQUAL(line, std::string{"STATUS DONE\n"}, "Status response");
		line.clear();

		encoder.begin_list(2);
		encoder.list_entry(1, "a");
		encoder.list_entry(20, "b.c");
		encoder.end();
		TEST_EQUAL(line, std::string{"LIST 2 1 a 20 b.c\n"}, "List response");
		line.clear();

		encoder.result({.id         = 4,
		                .status     = -2,
		                .iterations = 3,
		                .total      = UINT64_MAX,
		                .min        = 1,
		                .max        = 2});
		encoder.begin_samples();
		encoder.sample(5);
		encoder.end();
		TEST_EQUAL(line,
		           std::string{"RESULT 4 -2 3 18446744073709551615 1 2 SAMPLES 5\n"},
		           "Result response");
	}

	void test_decode_responses()
	{
		Response response;
		TEST_EQUAL(decode_response("ACK", response), ErrorCode::None, "ACK");
		TEST_EQUAL(response.tag, ResponseTag::Ack, "ACK decoded wrong");

		TEST_EQUAL(decode_response("status ready", response),
		           ErrorCode::None,
		           "Lower-case status");
		TEST(response.tag == ResponseTag::Status &&
		       response.status == SuiteStatus::Ready,
		     "STATUS READY decoded wrong");

		TEST_EQUAL(decode_response("ERROR CounterFault", response),
		           ErrorCode::None,
		           "Error response");
		TEST_EQUAL(response.error, ErrorCode::CounterFault, "Error code");

		TEST_EQUAL(decode_response("LIST 2 1 fixed 2 growing", response),
		           ErrorCode::None,
		           "List response");
		TEST_EQUAL(response.benchmarks.size(), size_t(2), "List length");
		TEST((response.benchmarks[1] ==
		      BenchmarkEntry{.id = 2, .name = "growing"}),
		     "Second list entry decoded wrong");

		TEST_EQUAL(decode_response("LIST 0", response),
		           ErrorCode::None,
		           "Empty list");
		TEST(response.benchmarks.empty(), "Empty list has entries");

		TEST_EQUAL(decode_response("RESULT 1 -2 3 60 10 30", response),
		           ErrorCode::None,
		           "Result response");
		TEST((response.result == ResultSummary{.id         = 1,
		                                       .status     = -2,
		                                       .iterations = 3,
		                                       .total      = 60,
		                                       .min        = 10,
		                                       .max        = 30}),
		     "Result decoded wrong");
		TEST(!response.samples, "Result without samples has samples");

		TEST_EQUAL(decode_response("RESULT 1 0 3 60 10 30 SAMPLES 10 20 30",
		                           response),
		           ErrorCode::None,
		           "Result with samples");
		TEST(response.samples &&
		       (*response.samples == std::vector<uint64_t>{10, 20, 30}),
		     "Samples decoded wrong");

		struct
		{
			const char *line;
			ErrorCode   expected;
		} invalid[] = {
		  {"", ErrorCode::FramingError},
		  {"NOPE", ErrorCode::UnknownTag},
		  {"ACK 1", ErrorCode::FramingError},
		  {"STATUS", ErrorCode::FramingError},
		  {"STATUS BUSY", ErrorCode::FramingError},
		  {"ERROR", ErrorCode::FramingError},
		  {"ERROR None", ErrorCode::FramingError},
		  {"ERROR Bogus", ErrorCode::FramingError},
		  {"LIST 2 1 fixed", ErrorCode::FramingError},
		  {"LIST 1 1 fixed 2 growing", ErrorCode::FramingError},
		  {"LIST 1 x fixed", ErrorCode::FramingError},
		  {"RESULT 1 0 3 60 10", ErrorCode::FramingError},
		  {"RESULT 1 0 3 60 10 30 EXTRA", ErrorCode::FramingError},
		  {"RESULT 1 0 3 60 10 30 SAMPLES 1 x", ErrorCode::FramingError},
		};
		for (const auto &testCase : invalid)
		{
			TEST_EQUAL(decode_response(testCase.line, response),
			           testCase.expected,
			           testCase.line);
		}
	}

	void test_response_lines()
	{
		Response list{.tag        = ResponseTag::List,
		              .benchmarks = {{.id = 1, .name = "cycle_read"}}};
		TEST_EQUAL(
		  encode(list), std::string{"LIST 1 1 cycle_read"}, "Encoded list");
		Response result{.tag    = ResponseTag::Result,
		                .result = {.id = 2, .iterations = 1, .total = 9},
		                .samples = std::vector<uint64_t>{9}};
		TEST_EQUAL(encode(result),
		           std::string{"RESULT 2 0 1 9 0 0 SAMPLES 9"},
		           "Encoded result");
		Response responses[] = {
		  {.tag = ResponseTag::Ack},
		  {.tag = ResponseTag::Status, .status = SuiteStatus::Ready},
		  {.tag = ResponseTag::Status, .status = SuiteStatus::Done},
		  {.tag = ResponseTag::Error, .error = ErrorCode::UnknownId},
		  {.tag = ResponseTag::Error, .error = ErrorCode::CounterFault},
		  {.tag = ResponseTag::Error, .error = ErrorCode::InvalidArgument},
		  {.tag = ResponseTag::Error, .error = ErrorCode::FramingError},
		  {.tag = ResponseTag::Error, .error = ErrorCode::UnknownTag},
		  {.tag = ResponseTag::List},
		  list,
		  {.tag    = ResponseTag::Result,
		   .result = {.id = 5, .status = 3, .iterations = 2, .min = 1}},
		  result,
		};
		for (const auto &response : responses)
		{
			Response    decoded;
			std::string line = encode(response);
			TEST_EQUAL(decode_response(line, decoded), ErrorCode::None, line);
			TEST(decoded == response, "'{}' did not decode to itself", line);
		}

		TEST(is_diagnostic("# Dispatch: hello"), "Diagnostic not recognised");
		TEST(!is_diagnostic("ACK"), "Response taken for a diagnostic");
		TEST(!is_diagnostic(""), "Empty line taken for a diagnostic");
	}

	void test_line_assembler()
	{
		LineAssembler<8> assembler;
		auto             feed = [&](std::string_view bytes) {
            FeedResult result = FeedResult::Incomplete;
            for (char c : bytes)
            {
                result = assembler.feed(c);
            }
            return result;
		};

		TEST_EQUAL(feed("\n\r\n"),
		           FeedResult::Incomplete,
		           "Empty lines must be skipped");
		TEST_EQUAL(feed("PI"), FeedResult::Incomplete, "Partial line");
		TEST_EQUAL(feed("NG\r\n"), FeedResult::Complete, "Split line");
		TEST_EQUAL(assembler.line(), std::string_view{"PING"}, "Split line");

		TEST_EQUAL(feed("12345678\n"),
		           FeedResult::Complete,
		           "A line of exactly the capacity fits");
		TEST_EQUAL(
		  assembler.line(), std::string_view{"12345678"}, "Full-length line");

		TEST_EQUAL(feed("123456789"),
		           FeedResult::Incomplete,
		           "Overflow is reported at the terminator");
		TEST_EQUAL(feed("abc\n"), FeedResult::Overflow, "Overlong line");
		TEST_EQUAL(feed("OK\n"),
		           FeedResult::Complete,
		           "Framing must recover after an overflow");
		TEST_EQUAL(assembler.line(), std::string_view{"OK"}, "Recovered line");

		feed("PARTIAL");
		assembler.reset();
		TEST_EQUAL(feed("X\n"), FeedResult::Complete, "Line after reset");
		TEST_EQUAL(assembler.line(), std::string_view{"X"}, "Reset line");
	}

	/**
	 * Decoding and re-encoding a line yields its canonical form, for every
	 * command and response tag.
	 */
	void test_canonical_lines()
	{
		struct
		{
			const char *line;
			const char *canonical;
		} commands[] = {
		  {"LIST", "LIST"},
		  {"PING", "PING"},
		  {"STATUS", "STATUS"},
		  {"DONE", "DONE"},
		  {"RUN 3", "RUN 3"},
		  {"RUN 3 10", "RUN 3 10"},
		  {"RUN 3 CAPTURE", "RUN 3 CAPTURE"},
		  {"RUN 3 10 CAPTURE", "RUN 3 10 CAPTURE"},
		  {"SUSPEND 0", "SUSPEND 0"},
		  {"run 3 10", "RUN 3 10"},
		  {"  ping  ", "PING"},
		  {"Suspend   7", "SUSPEND 7"},
		  {"run 4 capture", "RUN 4 CAPTURE"},
		};
		for (const auto &testCase : commands)
		{
			Command command;
			TEST_EQUAL(decode_command(testCase.line, command),
			           ErrorCode::None,
			           testCase.line);
			TEST_EQUAL(encode(command),
			           std::string{testCase.canonical},
			           testCase.line);
		}

		// Raw commands have no wire tag of their own: the bytes are the
		// encoding.
		for (const char *bytes : {"run 3 10", "JUMP 1", "# not a command"})
		{
			TEST_EQUAL(encode(Command{.tag = CommandTag::Raw, .raw = bytes}),
			           std::string{bytes},
			           bytes);
		}

		struct
		{
			const char *line;
			const char *canonical;
		} responses[] = {
		  {"ACK", "ACK"},
		  {"STATUS READY", "STATUS READY"},
		  {"STATUS DONE", "STATUS DONE"},
		  {"ERROR UnknownId", "ERROR UnknownId"},
		  {"ERROR CounterFault", "ERROR CounterFault"},
		  {"ERROR InvalidArgument", "ERROR InvalidArgument"},
		  {"ERROR FramingError", "ERROR FramingError"},
		  {"ERROR UnknownTag", "ERROR UnknownTag"},
		  {"LIST 0", "LIST 0"},
		  {"LIST 2 1 a 20 b.c", "LIST 2 1 a 20 b.c"},
		  {"RESULT 1 0 3 60 10 30", "RESULT 1 0 3 60 10 30"},
		  {"RESULT 1 -2 3 60 10 30 SAMPLES 10 20 30",
		   "RESULT 1 -2 3 60 10 30 SAMPLES 10 20 30"},
		  {"ack", "ACK"},
		  {"status done", "STATUS DONE"},
		  {"error unknownid", "ERROR UnknownId"},
		  {"list 1 7   crc32", "LIST 1 7 crc32"},
		  {"result 2 0 1 9 9 9 samples 9", "RESULT 2 0 1 9 9 9 SAMPLES 9"},
		};
		for (const auto &testCase : responses)
		{
			Response response;
			TEST_EQUAL(decode_response(testCase.line, response),
			           ErrorCode::None,
			           testCase.line);
			TEST_EQUAL(encode(response),
			           std::string{testCase.canonical},
			           testCase.line);
		}
	}
} // namespace

int test_protocol()
{
	test_decode_commands();
	test_reject_malformed_commands();
	test_encode_commands();
	test_encode_responses();
	test_decode_responses();
	test_response_lines();
	test_line_assembler();
	test_canonical_lines();
	debug_log("All protocol tests passed");
	return 0;
}
