/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "quill/sinks/ConsoleSink.h"
#include "quill/sinks/FileSink.h"
#include "quill/sinks/Sink.h"
#include "quill/LogMacros.h"
#include "quill/Frontend.h"
#include "quill/Logger.h"
#include "preamble.hpp"
#include "utils/service.hpp"

#define TRACE(...) LOG_TRACE_L1(globals::logger->global, __VA_ARGS__)
#define DEBUG(...) LOG_DEBUG(globals::logger->global, __VA_ARGS__)
#define INFO(...) LOG_INFO(globals::logger->global, __VA_ARGS__)
#define WARN(...) LOG_WARNING(globals::logger->global, __VA_ARGS__)
#define ERROR(...) LOG_ERROR(globals::logger->global, __VA_ARGS__)
#define CRIT(...) LOG_CRITICAL(globals::logger->global, __VA_ARGS__)

// Log to a specific category

#define TRACE_AS(category, ...) LOG_TRACE_L1(static_cast<quill::Frontend::logger_t*>(category), __VA_ARGS__)
#define DEBUG_AS(category, ...) LOG_DEBUG(static_cast<quill::Frontend::logger_t*>(category), __VA_ARGS__)
#define INFO_AS(category, ...) LOG_INFO(static_cast<quill::Frontend::logger_t*>(category), __VA_ARGS__)
#define WARN_AS(category, ...) LOG_WARNING(static_cast<quill::Frontend::logger_t*>(category), __VA_ARGS__)
#define ERROR_AS(category, ...) LOG_ERROR(static_cast<quill::Frontend::logger_t*>(category), __VA_ARGS__)
#define CRIT_AS(category, ...) LOG_CRITICAL(static_cast<quill::Frontend::logger_t*>(category), __VA_ARGS__)

namespace stepline {

// Point of access to the logging system.
class Logger {
public:
	// A named tag for log messages. Its destinations and level can be customized independently.
	using Category = quill::Frontend::logger_t*;
	// Log importance level.
	using Level = quill::LogLevel;

	// A special category that writes all log messages into an owned string buffer.
	// Use create_string_logger() to get an instance.
	class StringLogger {
	public:
		~StringLogger();

		// Retrieve the string with all log messages so far.
		// The existing buffer is moved out, and a new one is created in its place.
		auto get_buffer() -> string;

		// Allow usage in *_AS macros.
		operator Logger::Category() { return category; }

		StringLogger(StringLogger const&) = delete;
		auto operator=(StringLogger const&) -> StringLogger& = delete;

	private:
		class MemorySink: public quill::Sink {
		public:
			MemorySink() = default;

			void write_log(quill::MacroMetadata const*, uint64_t /** log_timestamp **/,
				std::string_view /** thread_id **/, std::string_view /** thread_name **/,
				std::string const& /** process_id **/, std::string_view /** logger_name **/,
				quill::LogLevel, std::string_view /** log_level_description **/,
				std::string_view /** log_level_short_code **/,
				std::vector<std::pair<std::string, std::string>> const* /** named_args **/,
				std::string_view /** log_message **/, std::string_view log_statement) override
			{
				auto lock = lock_guard{buffer_lock};
				buffer.append(log_statement);
			}

			auto get_buffer() -> string;

			void flush_sink() noexcept override {}
			void run_periodic_tasks() noexcept override {}

			MemorySink(MemorySink const&) = delete;
			auto operator=(MemorySink const&) -> MemorySink& = delete;

		private:
			string buffer;
			mutex buffer_lock;
		};

		friend class Logger;

		shared_ptr<MemorySink> sink;
		Logger::Category category;

		StringLogger(string_view name, Logger::Level);
	};

	// Public access to the global logging category.
	Category global = nullptr;

	// Initialize the logger. A global category will be created, immediately usable
	// with the global logging macros.
	Logger(string_view log_file_path, Level);

	// Create a new category. To be used with the *_AS macros.
	// If the category already exists, the previously created instance is returned.
	auto create_category(string_view name, Level = Level::TraceL1,
		bool log_to_console = true, bool log_to_file = true) -> Category;

	// Create a category with its level read from the "logging" section of the global config.
	// Throws runtime_error if the configured level is not a valid level name.
	auto create_configured_category(string_view name, string_view config_entry) -> Category;

	// Create a new category that logs into a string buffer.
	auto create_string_logger(string_view name, Level = Level::TraceL1) -> StringLogger;

	Logger(Logger const&) = delete;
	auto operator=(Logger const&) -> Logger& = delete;
	Logger(Logger&&) = delete;
	auto operator=(Logger&&) -> Logger& = delete;

private:
	shared_ptr<quill::ConsoleSink> console_sink;
	shared_ptr<quill::FileSink> file_sink;
};

// Parse a log level from its name, as used in the config file.
// Throws runtime_error on an unknown name.
auto parse_log_level(string_view name) -> Logger::Level;

}

namespace stepline::globals {
inline auto logger = Service<Logger>{};
}
