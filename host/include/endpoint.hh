// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace CycleBench
{
	/**
	 * Recognises the line in a backend's diagnostic output that announces
	 * the endpoint it created.  One implementation per kind of backend keeps
	 * each backend's message format in one place.
	 */
	class EndpointMatcher
	{
		public:
		virtual ~EndpointMatcher() = default;

		/**
		 * Returns the endpoint if `line` announces one.
		 */
		[[nodiscard]] virtual std::optional<std::string>
		match(std::string_view line) const = 0;
	};

	/**
	 * Matches a regular expression whose first capture group is the
	 * endpoint.
	 */
	class PatternEndpointMatcher : public EndpointMatcher
	{
		std::regex pattern;

		protected:
		/**
		 * Construct from a pattern known to be valid.
		 */
		explicit PatternEndpointMatcher(std::regex pattern)
		  : pattern(std::move(pattern))
		{
		}

		public:
		/**
		 * Build a matcher from a caller-supplied expression.  Returns null if
		 * the expression is invalid or has no capture group.
		 */
		static std::unique_ptr<PatternEndpointMatcher>
		create(const std::string &expression);

		[[nodiscard]] std::optional<std::string>
		match(std::string_view line) const override;
	};

	/**
	 * QEMU, started with `-serial pty`, prints
	 * `char device redirected to /dev/pts/N (label serial0)`.
	 */
	class QemuEndpointMatcher final : public PatternEndpointMatcher
	{
		public:
		QemuEndpointMatcher();
	};

	/**
	 * The Earl Grey Verilator model prints
	 * `UART: Created /dev/pts/N for uart0. ...`.
	 */
	class VerilatorEndpointMatcher final : public PatternEndpointMatcher
	{
		public:
		VerilatorEndpointMatcher();
	};
} // namespace CycleBench
