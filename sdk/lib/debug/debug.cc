// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <array>
#include <debug.hh>
#include <platform-debug.hh>

namespace
{
	/**
	 * Printer for debug messages.  This implements the `DebugWriter` interface
	 * so that it can be used with custom callbacks.
	 *
	 * Output is collected into a fixed buffer and handed to the platform's
	 * `DebugOutput` in as few writes as possible, so that messages are not
	 * interleaved with other output.  Every line starts with the platform's
	 * line prefix, which on the device marks it as a diagnostic rather than a
	 * protocol response.
	 *
	 * This is not exposed for subclassing and so is final to allow internal
	 * calls to avoid the vtable.  Only callbacks use the vtable.
	 */
	struct DebugPrinter final : DebugWriter
	{
		/// Pending output.
		std::array<char, 256> buffer;
		/// Number of bytes used in `buffer`.
		size_t used = 0;
		/// Set when the next character starts a new line.
		bool atLineStart = true;

		DebugPrinter()                                = default;
		DebugPrinter(const DebugPrinter &)            = delete;
		DebugPrinter &operator=(const DebugPrinter &) = delete;

		~DebugPrinter()
		{
			flush();
		}

		/**
		 * Pass everything buffered so far to the output.
		 */
		void flush()
		{
			if (used > 0)
			{
				DebugOutput::write(std::string_view{buffer.data(), used});
				used = 0;
			}
		}

		void append(char c)
		{
			if (used == buffer.size())
			{
				flush();
			}
			buffer[used++] = c;
		}

		/**
		 * Write a character, inserting the line prefix at the start of each
		 * line.
		 */
		void write(char c) override
		{
			if (atLineStart)
			{
				atLineStart = false;
				for (char p : std::string_view{DebugOutput::LinePrefix})
				{
					append(p);
				}
			}
			append(c);
			if (c == '\n')
			{
				atLineStart = true;
			}
		}

		/**
		 * Write a null-terminated C string.
		 */
		void write(const char *str) override
		{
			if (str == nullptr)
			{
				write("<null>");
				return;
			}
			for (; *str; ++str)
			{
				write(*str);
			}
		}

		/**
		 * Write a string view.
		 */
		void write(std::string_view str) override
		{
			for (char c : str)
			{
				write(c);
			}
		}

		/**
		 * Write an unsigned value as a decimal string.
		 */
		void write_decimal(uint64_t value)
		{
			std::array<char, 20> buf;
			size_t               length = 0;
			do
			{
				buf[length++] = static_cast<char>('0' + (value % 10));
				value /= 10;
			} while (value != 0);
			while (length > 0)
			{
				write(buf[--length]);
			}
		}

		/**
		 * Write a signed integer, as a decimal string.
		 */
		void write(int32_t s) override
		{
			write(static_cast<int64_t>(s));
		}

		/**
		 * Write a signed integer, as a decimal string.
		 */
		void write(int64_t s) override
		{
			uint64_t magnitude = static_cast<uint64_t>(s);
			if (s < 0)
			{
				write('-');
				magnitude = 0 - magnitude;
			}
			write_decimal(magnitude);
		}

		/**
		 * Write a 32-bit unsigned integer to the buffer as hex with no prefix.
		 */
		void append_hex_word(uint32_t s, bool skipLeadingZeroes)
		{
			std::array<char, 8> buf;
			const char          Hexdigits[] = "0123456789abcdef";
			// Length of string including null terminator
			static_assert(sizeof(Hexdigits) == 0x11);
			for (long i = long(buf.size() - 1); i >= 0; i--)
			{
				buf.at(static_cast<size_t>(i)) = Hexdigits[s & 0xf];
				s >>= 4;
			}
			bool skipZero = skipLeadingZeroes;
			for (auto c : buf)
			{
				if (skipZero && (c == '0'))
				{
					continue;
				}
				skipZero = false;
				write(c);
			}
			if (skipZero)
			{
				write('0');
			}
		}

		/**
		 * Write a 32-bit unsigned integer to the buffer as hex.
		 */
		void write(uint32_t s) override
		{
			write('0');
			write('x');
			append_hex_word(s, true);
		}

		/**
		 * Write a 64-bit unsigned integer to the buffer as hex.
		 */
		void write(uint64_t s) override
		{
			write('0');
			write('x');
			uint32_t hi = static_cast<uint32_t>(s >> 32);
			uint32_t lo = static_cast<uint32_t>(s);
			if (hi != 0)
			{
				append_hex_word(hi, true);
				append_hex_word(lo, false);
				return;
			}
			append_hex_word(lo, true);
		}

		/**
		 * Format a message, using the provided arguments.
		 */
		void format(const char          *fmt,
		            DebugFormatArgument *arguments,
		            size_t               argumentsCount)
		{
			// If there are no format arguments, just write the string.
			if (argumentsCount == 0)
			{
				write(fmt);
				return;
			}
			size_t argumentIndex = 0;
			for (const char *s = fmt; *s != 0; ++s)
			{
				if (s[0] == '{' && s[1] == '}')
				{
					s++;
					if (argumentIndex >= argumentsCount)
					{
						write("<missing argument>");
						continue;
					}
					auto &argument = arguments[argumentIndex++];
					switch (argument.kind)
					{
						case DebugFormatArgumentBool:
							write(argument.value != 0 ? "true" : "false");
							break;
						case DebugFormatArgumentCharacter:
							write(static_cast<char>(argument.value));
							break;
						case DebugFormatArgumentPointer:
							write(static_cast<uint64_t>(argument.value));
							break;
						case DebugFormatArgumentSignedNumber32:
							write(static_cast<int32_t>(argument.value));
							break;
						case DebugFormatArgumentUnsignedNumber32:
							write(static_cast<uint32_t>(argument.value));
							break;
						case DebugFormatArgumentSignedNumber64:
						{
							int64_t value;
							memcpy(&value, &argument.value, sizeof(value));
							write(value);
							break;
						}
						case DebugFormatArgumentUnsignedNumber64:
							write(static_cast<uint64_t>(argument.value));
							break;
						case DebugFormatArgumentDecimal64:
							write_decimal(argument.value);
							break;
						case DebugFormatArgumentCString:
							write(reinterpret_cast<const char *>(
							  static_cast<uintptr_t>(argument.value)));
							break;
						case DebugFormatArgumentStringView:
							write(*reinterpret_cast<std::string_view *>(
							  static_cast<uintptr_t>(argument.value)));
							break;
						case DebugFormatArgumentCallback:
							if (argument.callback != nullptr)
							{
								argument.callback(argument.value, *this);
								break;
							}
							[[fallthrough]];
						default:
							write("<invalid argument kind>");
							break;
					}
					continue;
				}
				write(*s);
			}
		}
	};

} // namespace

void debug_log_message_write(const char          *context,
                             const char          *format,
                             DebugFormatArgument *messages,
                             size_t               messageCount)
{
	DebugPrinter printer;
	printer.write("\x1b[35m");
	printer.write(context);
	printer.write("\033[0m: ");
	printer.format(format, messages, messageCount);
	printer.write("\n");
}

void debug_report_failure(const char          *kind,
                          const char          *file,
                          const char          *function,
                          int                  line,
                          const char          *format,
                          DebugFormatArgument *arguments,
                          size_t               argumentCount)
{
	DebugPrinter printer;
	printer.write("\x1b[35m");
	printer.write(file);
	printer.write(":");
	printer.write(static_cast<int32_t>(line));
	printer.write("\x1b[31m ");
	printer.write(kind);
	printer.write(" failure\x1b[35m in ");
	printer.write(function);
	printer.write("\x1b[36m\n");
	printer.format(format, arguments, argumentCount);
	printer.write("\033[0m\n");
}
