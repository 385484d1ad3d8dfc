/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "utils/logger.hpp"

#include "quill/Backend.h"
#include "preamble.hpp"
#include "utils/config.hpp"

namespace stepline {

static auto const StringLoggerPattern = quill::PatternFormatterOptions{
	"[%(log_level_short_code)] %(message)",
	"%H:%M:%S.%Qms"
};

static auto const LoggerPattern = quill::PatternFormatterOptions{
	"%(time) [%(log_level_short_code)] [%(logger)] %(message)",
	"%H:%M:%S.%Qms"
};

static auto const ShortCodes = to_array<string>({
	"TR3", "TR2", "TRA", "DBG", "INF", "NTC",
	"WRN", "ERR", "CRT", "BCT", "___"
});

Logger::StringLogger::StringLogger(string_view name, Logger::Level level)
{
	auto name_str = string{name};
	sink = static_pointer_cast<MemorySink>(quill::Frontend::create_or_get_sink<MemorySink>(name_str));
	category = quill::Frontend::create_or_get_logger(name_str, {sink}, StringLoggerPattern);
	category->set_log_level(level);
}

Logger::StringLogger::~StringLogger()
{
	quill::Frontend::remove_logger(category);
}

auto Logger::StringLogger::get_buffer() -> string
{
	category->flush_log();
	return sink->get_buffer();
}

auto Logger::StringLogger::MemorySink::get_buffer() -> string
{
	auto lock = lock_guard{buffer_lock};
	return exchange(buffer, string{});
}

Logger::Logger(string_view log_file_path, Level global_log_level)
{
	quill::Backend::start<quill::FrontendOptions>({
		.thread_name = "Logging",
		.enable_yield_when_idle = true,
		.sleep_duration = 0ns,
		.check_printable_char = {}, // Allow UTF-8
		.log_level_short_codes = ShortCodes,
	}, quill::SignalHandlerOptions{});

	console_sink = static_pointer_cast<quill::ConsoleSink>(
		quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));

	auto file_cfg = quill::FileSinkConfig{};
	file_cfg.set_open_mode('w');
	file_sink = static_pointer_cast<quill::FileSink>(
		quill::Frontend::create_or_get_sink<quill::FileSink>(string{log_file_path}, file_cfg));

	global = create_category("Global", global_log_level);
}

auto Logger::create_category(string_view name, Level level, bool log_to_console, bool log_to_file) -> Category
{
	auto sinks = std::vector<shared_ptr<quill::Sink>>{};
	if (log_to_console) sinks.emplace_back(console_sink);
	if (log_to_file) sinks.emplace_back(file_sink);
	auto* category = quill::Frontend::create_or_get_logger(string{name}, move(sinks), LoggerPattern);
	category->set_log_level(level);
	return category;
}

auto Logger::create_configured_category(string_view name, string_view config_entry) -> Category
{
	return create_category(name,
		parse_log_level(globals::config->get_entry<string>("logging", config_entry)));
}

auto Logger::create_string_logger(string_view name, Level level) -> StringLogger
{
	return StringLogger{name, level};
}

auto parse_log_level(string_view name) -> Logger::Level
{
	auto const level = enum_cast<Logger::Level>(name);
	if (!level) throw runtime_error_fmt("Invalid log level: {}", name);
	return *level;
}

}
