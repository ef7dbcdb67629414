// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <endpoint.hh>

using namespace CycleBench;

std::unique_ptr<PatternEndpointMatcher>
PatternEndpointMatcher::create(const std::string &expression)
{
	std::regex pattern;
	try
	{
		pattern.assign(expression, std::regex::ECMAScript);
	}
	catch (const std::regex_error &)
	{
		return nullptr;
	}
	if (pattern.mark_count() < 1)
	{
		return nullptr;
	}
	return std::unique_ptr<PatternEndpointMatcher>(
	  new PatternEndpointMatcher(std::move(pattern)));
}

std::optional<std::string>
PatternEndpointMatcher::match(std::string_view line) const
{
	std::match_results<std::string_view::const_iterator> match;
	if (!std::regex_search(line.begin(), line.end(), match, pattern) ||
	    !match[1].matched || (match[1].length() == 0))
	{
		return std::nullopt;
	}
	return match[1].str();
}

QemuEndpointMatcher::QemuEndpointMatcher()
  : PatternEndpointMatcher(std::regex{R"(redirected to (\S+))"})
{
}

VerilatorEndpointMatcher::VerilatorEndpointMatcher()
  : PatternEndpointMatcher(std::regex{R"(UART: Created (\S+) for uart0)"})
{
}
