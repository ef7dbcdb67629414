// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <cyclebench-errno.h>
#include <debug.hh>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <raw_console.hh>
#include <records.hh>
#include <workload.hh>

#ifndef DEBUG_SESSION
#	define DEBUG_SESSION false
#endif

using namespace CycleBench;

namespace
{
	using Debug = ConditionalDebug<DEBUG_SESSION, "Workload">;

	/**
	 * Remember the first failure.
	 */
	void note_error(int &firstError, int ret)
	{
		if ((firstError == 0) && (ret != 0))
		{
			firstError = ret;
		}
	}

	/**
	 * Forward one raw file.  Responses go to `<file>.result` (the input's
	 * extension replaced), or to `output` when reading standard input.
	 */
	int run_raw_file(LineChannel           &channel,
	                 const WorkloadOptions &options,
	                 const std::string     &file,
	                 std::ostream          &output)
	{
		RawConsole    console{channel, options.timeout};
		std::ifstream inputFile;
		std::ofstream outputFile;
		std::istream *input       = &std::cin;
		std::ostream *destination = &output;
		if (file != "-")
		{
			inputFile.open(file);
			if (!inputFile)
			{
				Debug::log("Cannot read {}", file);
				return -ENOENT;
			}
			auto resultPath =
			  std::filesystem::path{file}.replace_extension(".result");
			outputFile.open(resultPath);
			if (!outputFile)
			{
				Debug::log("Cannot write {}", resultPath.string());
				return -EACCES;
			}
			input       = &inputFile;
			destination = &outputFile;
		}
		RawConsoleReport report;
		int              ret = console.run(*input, *destination, &report);
		Debug::log("{}: {} sent, {} received, {} timed out",
		           file,
		           report.sent,
		           report.received,
		           report.timeouts);
		if ((ret == 0) && options.finishWithDone)
		{
			ret = console.exchange("DONE", *destination);
		}
		if ((ret == 0) && (report.timeouts != 0))
		{
			ret = -ETIMEDOUT;
		}
		return ret;
	}

	/**
	 * Find the name of benchmark `id`, or a placeholder.
	 */
	std::string_view
	name_of(const std::vector<Protocol::BenchmarkEntry> &benchmarks, uint32_t id)
	{
		for (const auto &entry : benchmarks)
		{
			if (entry.id == id)
			{
				return entry.name;
			}
		}
		return "?";
	}
} // namespace

int CycleBench::parse_run_request(std::string_view text, RunRequest &request)
{
	auto        separator = text.find(':');
	std::string_view idText = text.substr(0, separator);
	auto             id     = Protocol::parse_number<uint32_t>(idText);
	if (!id)
	{
		return -EINVAL;
	}
	request = RunRequest{.id = *id};
	if (separator != std::string_view::npos)
	{
		request.iterations =
		  Protocol::parse_number<uint32_t>(text.substr(separator + 1));
		if (!request.iterations || (*request.iterations == 0))
		{
			return -EINVAL;
		}
	}
	return 0;
}

int CycleBench::run_workload(LineChannel           &channel,
                             const WorkloadOptions &options,
                             std::ostream          &output)
{
	Session session{channel, options.timeout};
	int     ret = session.handshake();
	if (ret != 0)
	{
		Debug::log("Handshake failed: {}", ret);
		return ret;
	}

	int firstError = 0;
	if (!options.rawFiles.empty())
	{
		for (const auto &file : options.rawFiles)
		{
			note_error(firstError, run_raw_file(channel, options, file, output));
		}
		return firstError;
	}

	std::vector<Protocol::BenchmarkEntry> benchmarks;
	ret = session.list(benchmarks);
	if (ret != 0)
	{
		Debug::log("Listing benchmarks failed: {}", ret);
		return ret;
	}
	if (options.list)
	{
		for (const auto &entry : benchmarks)
		{
			output << entry.id << ' ' << entry.name << '\n';
		}
	}

	std::vector<RunRequest> runs = options.runs;
	if (options.all)
	{
		for (const auto &entry : benchmarks)
		{
			runs.push_back({.id = entry.id});
		}
	}

	for (const auto &request : runs)
	{
		RunResult result;
		ret = session.run(
		  request.id, request.iterations, options.capture, result);
		if (ret == 0)
		{
			output << format_record(make_record(
			            result, name_of(benchmarks, request.id)))
			       << '\n';
			if (result.summary.status != 0)
			{
				note_error(firstError, -EIO);
			}
			continue;
		}
		output << request.id << ' ' << name_of(benchmarks, request.id)
		       << " error=" << ret << '\n';
		note_error(firstError, ret);
		if ((ret == -ETIMEDOUT) || (ret == -ECANCELED) || (ret == -ENOTCONN))
		{
			if (ret != -ETIMEDOUT)
			{
				return firstError;
			}
			// The run may still be executing.  Wait for it rather than
			// running the next benchmark alongside it.
			ret = session.resynchronise();
			if (ret != 0)
			{
				Debug::log("Could not resynchronise: {}", ret);
				return firstError;
			}
		}
	}
	output.flush();

	ret = session.done();
	note_error(firstError, ret);
	if (options.suspendCode)
	{
		note_error(firstError, session.suspend(*options.suspendCode));
	}
	return firstError;
}
