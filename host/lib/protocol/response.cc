// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <response.hh>

using namespace CycleBench::Protocol;

namespace
{
	/**
	 * Parse the next token as a number, failing if it is missing or invalid.
	 */
	template<typename T>
	bool next_number(Tokenizer &tokens, T &value)
	{
		auto token = tokens.next();
		if (!token)
		{
			return false;
		}
		auto number = parse_number<T>(*token);
		if (!number)
		{
			return false;
		}
		value = *number;
		return true;
	}

	ErrorCode decode_list(Tokenizer &tokens, Response &response)
	{
		size_t count;
		if (!next_number(tokens, count))
		{
			return ErrorCode::FramingError;
		}
		for (size_t i = 0; i < count; i++)
		{
			BenchmarkEntry entry;
			if (!next_number(tokens, entry.id))
			{
				return ErrorCode::FramingError;
			}
			auto name = tokens.next();
			if (!name)
			{
				return ErrorCode::FramingError;
			}
			entry.name = std::string{*name};
			response.benchmarks.push_back(std::move(entry));
		}
		return ErrorCode::None;
	}

	ErrorCode decode_result(Tokenizer &tokens, Response &response)
	{
		ResultSummary &summary = response.result;
		if (!next_number(tokens, summary.id) ||
		    !next_number(tokens, summary.status) ||
		    !next_number(tokens, summary.iterations) ||
		    !next_number(tokens, summary.total) ||
		    !next_number(tokens, summary.min) ||
		    !next_number(tokens, summary.max))
		{
			return ErrorCode::FramingError;
		}
		auto keyword = tokens.next();
		if (!keyword)
		{
			return ErrorCode::None;
		}
		if (!token_equals(*keyword, SamplesKeyword))
		{
			return ErrorCode::FramingError;
		}
		std::vector<uint64_t> samples;
		while (auto token = tokens.next())
		{
			auto sample = parse_number<uint64_t>(*token);
			if (!sample)
			{
				return ErrorCode::FramingError;
			}
			samples.push_back(*sample);
		}
		response.samples = std::move(samples);
		return ErrorCode::None;
	}
} // namespace

ErrorCode CycleBench::Protocol::decode_response(std::string_view line,
                                                Response        &response)
{
	response = Response{};
	Tokenizer tokens{line};
	auto      tagToken = tokens.next();
	if (!tagToken)
	{
		return ErrorCode::FramingError;
	}
	auto tag = parse_enum<ResponseTag>(*tagToken);
	if (!tag)
	{
		return ErrorCode::UnknownTag;
	}
	response.tag = *tag;
	ErrorCode error = ErrorCode::None;
	switch (*tag)
	{
		case ResponseTag::Ack:
			break;
		case ResponseTag::Status:
		{
			auto word   = tokens.next();
			auto status = word ? parse_enum<SuiteStatus>(*word) : std::nullopt;
			if (!status)
			{
				return ErrorCode::FramingError;
			}
			response.status = *status;
			break;
		}
		case ResponseTag::Error:
		{
			auto name = tokens.next();
			auto code = name ? parse_enum<ErrorCode>(*name) : std::nullopt;
			if (!code || (*code == ErrorCode::None))
			{
				return ErrorCode::FramingError;
			}
			response.error = *code;
			break;
		}
		case ResponseTag::List:
			error = decode_list(tokens, response);
			break;
		case ResponseTag::Result:
			error = decode_result(tokens, response);
			break;
	}
	if (error != ErrorCode::None)
	{
		return error;
	}
	if (!tokens.empty())
	{
		return ErrorCode::FramingError;
	}
	return ErrorCode::None;
}

std::string CycleBench::Protocol::encode(const Response &response)
{
	std::string                 line;
	StringSink                  sink{line};
	ResponseEncoder<StringSink> encoder{sink};
	switch (response.tag)
	{
		case ResponseTag::Ack:
			encoder.ack();
			break;
		case ResponseTag::Status:
			encoder.status(response.status);
			break;
		case ResponseTag::Error:
			encoder.error(response.error);
			break;
		case ResponseTag::List:
			encoder.begin_list(response.benchmarks.size());
			for (const auto &entry : response.benchmarks)
			{
				encoder.list_entry(entry.id, entry.name);
			}
			encoder.end();
			break;
		case ResponseTag::Result:
			encoder.result(response.result);
			if (response.samples)
			{
				encoder.begin_samples();
				for (uint64_t sample : *response.samples)
				{
					encoder.sample(sample);
				}
			}
			encoder.end();
			break;
	}
	line.pop_back();
	return line;
}

std::string CycleBench::Protocol::encode(const Command &command)
{
	std::string                line;
	StringSink                 sink{line};
	CommandEncoder<StringSink> encoder{sink};
	encoder.encode(command);
	line.pop_back();
	return line;
}
