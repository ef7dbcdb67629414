// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <benchmark.hh>
#include <cycles.hh>
#include <debug.hh>
#include <platform/concepts/platform.hh>
#include <protocol.hh>
#include <span>
#include <utils.hh>

#ifndef DEBUG_DISPATCH
#	define DEBUG_DISPATCH false
#endif

namespace CycleBench
{
	/**
	 * The states of the device dispatch loop.  Every command passes through
	 * them in order and the loop is back in `Idle` before the next command is
	 * read, whatever the outcome.
	 */
	enum class DispatchState : uint8_t
	{
		/// Waiting for a complete command line.
		Idle,
		/// Decoding a received line.
		Decoding,
		/// Running a benchmark.
		Executing,
		/// Sending the response.
		Responding,
	};

	/**
	 * The device-side command loop.  Reads command lines from the platform
	 * UART, runs benchmarks from a resident table and writes one response
	 * line per command.
	 *
	 * The platform is a template parameter so that a firmware image contains
	 * exactly one hardware access layer and nothing is dispatched through a
	 * vtable.
	 */
	template<IsPlatform Platform>
	class Dispatcher : private utils::NoCopyNoMove
	{
		using Debug = ConditionalDebug<DEBUG_DISPATCH, "Dispatch">;

		/**
		 * Adaptor that writes encoded output straight to the UART.
		 */
		struct PlatformSink
		{
			Platform &platform;

			void put(char c)
			{
				platform.write_byte(c);
			}
		};

		using Encoder = Protocol::ResponseEncoder<PlatformSink>;

		/// The hardware access layer.
		Platform &platform;
		/// The resident benchmarks.
		std::span<const BenchmarkDescriptor> benchmarks;
		/// Framing for incoming commands.
		Protocol::LineAssembler<Protocol::MaxCommandLength> assembler;
		/// Storage for per-iteration samples when a run asks for them.
		std::array<uint64_t, Protocol::MaxCapturedSamples> samples;
		/// The current state, for observation by tests.
		DispatchState currentState = DispatchState::Idle;

		/**
		 * Read bytes until the assembler produces a line or reports an
		 * overflow.
		 */
		Protocol::FeedResult receive()
		{
			Protocol::FeedResult result;
			do
			{
				result = assembler.feed(platform.read_byte());
			} while (result == Protocol::FeedResult::Incomplete);
			return result;
		}

		void respond_error(Encoder &encoder, Protocol::ErrorCode code)
		{
			currentState = DispatchState::Responding;
			encoder.error(code);
		}

		void respond_list(Encoder &encoder)
		{
			currentState = DispatchState::Responding;
			encoder.begin_list(benchmarks.size());
			for (const auto &descriptor : benchmarks)
			{
				encoder.list_entry(descriptor.id, descriptor.name);
			}
			encoder.end();
		}

		/**
		 * Run one benchmark and report the result.
		 */
		void execute(Encoder &encoder, const Protocol::Command &command)
		{
			using Protocol::ErrorCode;
			const BenchmarkDescriptor *descriptor =
			  find_benchmark(benchmarks, command.id);
			if (descriptor == nullptr)
			{
				Debug::log("No benchmark with id {}", command.id);
				respond_error(encoder, ErrorCode::UnknownId);
				return;
			}
			uint32_t iterations =
			  command.iterations.value_or(descriptor->defaultIterations);
			if ((iterations == 0) ||
			    (command.capture &&
			     (iterations > Protocol::MaxCapturedSamples)))
			{
				Debug::log("Rejecting {} iterations (capture: {})",
				           iterations,
				           command.capture);
				respond_error(encoder, ErrorCode::InvalidArgument);
				return;
			}

			currentState = DispatchState::Executing;
			Debug::log(
			  "Running {} for {} iterations", descriptor->name, iterations);
			SampleAggregate aggregate;
			int32_t         status = 0;
			for (uint32_t i = 0; i < iterations; i++)
			{
				uint64_t start;
				uint64_t end;
				int      entryStatus;
				{
					InterruptGuard<Platform> guard{platform};
					start       = read_cycles(platform);
					entryStatus = descriptor->entry();
					end         = read_cycles(platform);
				}
				if (entryStatus != 0)
				{
					Debug::log("{} failed with status {} after {} iterations",
					           descriptor->name,
					           entryStatus,
					           i);
					status = entryStatus;
					break;
				}
				auto delta = cycle_delta(start, end);
				if (!delta)
				{
					Debug::log("Cycle counter went backwards: {} -> {}",
					           Decimal{start},
					           Decimal{end});
					respond_error(encoder, ErrorCode::CounterFault);
					return;
				}
				if (command.capture)
				{
					samples[aggregate.count] = *delta;
				}
				aggregate.add(*delta);
			}

			currentState = DispatchState::Responding;
			encoder.result({.id         = descriptor->id,
			                .status     = status,
			                .iterations = aggregate.count,
			                .total      = aggregate.total,
			                .min        = aggregate.minimum(),
			                .max        = aggregate.max});
			if (command.capture)
			{
				encoder.begin_samples();
				for (uint32_t i = 0; i < aggregate.count; i++)
				{
					encoder.sample(samples[i]);
				}
			}
			encoder.end();
		}

		public:
		Dispatcher(Platform                            &platform,
		           std::span<const BenchmarkDescriptor> benchmarks)
		  : platform(platform), benchmarks(benchmarks)
		{
		}

		/**
		 * The state of the loop.  Outside of `step` this is always `Idle`.
		 */
		[[nodiscard]] DispatchState state() const
		{
			return currentState;
		}

		/**
		 * Receive, decode and answer exactly one command.
		 */
		void step()
		{
			using Protocol::CommandTag;
			using Protocol::ErrorCode;
			currentState = DispatchState::Idle;
			PlatformSink sink{platform};
			Encoder      encoder{sink};

			if (receive() == Protocol::FeedResult::Overflow)
			{
				Debug::log("Discarded an overlong command line");
				respond_error(encoder, ErrorCode::FramingError);
				currentState = DispatchState::Idle;
				return;
			}

			currentState = DispatchState::Decoding;
			Protocol::Command command;
			ErrorCode error = Protocol::decode_command(assembler.line(), command);
			assembler.reset();
			if (error != ErrorCode::None)
			{
				Debug::log("Rejected command: {}", error);
				respond_error(encoder, error);
				currentState = DispatchState::Idle;
				return;
			}

			switch (command.tag)
			{
				case CommandTag::List:
					respond_list(encoder);
					break;
				case CommandTag::Run:
					execute(encoder, command);
					break;
				case CommandTag::Ping:
					currentState = DispatchState::Responding;
					encoder.ack();
					break;
				case CommandTag::Status:
					currentState = DispatchState::Responding;
					encoder.status(Protocol::SuiteStatus::Ready);
					break;
				case CommandTag::Done:
					currentState = DispatchState::Responding;
					encoder.status(Protocol::SuiteStatus::Done);
					break;
				case CommandTag::Suspend:
					currentState = DispatchState::Responding;
					encoder.ack();
					Debug::log("Suspending with code {}", command.code);
					platform.halt(command.code);
					break;
				case CommandTag::Raw:
					// Never produced by the decoder.
					respond_error(encoder, ErrorCode::UnknownTag);
					break;
			}
			currentState = DispatchState::Idle;
		}

		/**
		 * Answer commands forever.
		 */
		[[noreturn]] void run()
		{
			while (true)
			{
				step();
			}
		}
	};
} // namespace CycleBench
