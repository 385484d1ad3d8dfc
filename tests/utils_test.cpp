/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include <gtest/gtest.h>
#include "preamble.hpp"
#include "utils/logger.hpp"
#include "utils/config.hpp"
#include "io/file.hpp"

namespace stepline {

TEST(Config, DefaultEntries)
{
	auto const config = Config{};
	EXPECT_EQ(config.get_entry<int>("pipewire", "buffer_size"), 128);
	EXPECT_EQ(config.get_entry<int>("gameplay", "lead_in"), 2000);
	EXPECT_DOUBLE_EQ(config.get_entry<double>("controls", "axis_threshold"), 0.5);
	EXPECT_EQ(config.get_entry<string>("gameplay", "difficulty"), "Medium");
	EXPECT_THROW(static_cast<void>(config.get_entry<int>("gameplay", "no_such_entry")), runtime_error);
}

TEST(Config, SetEntryKeepsType)
{
	auto config = Config{};
	config.set_entry({.category = "gameplay", .name = "audio_offset", .value = 15});
	EXPECT_EQ(config.get_entry<int>("gameplay", "audio_offset"), 15);
	EXPECT_THROW(config.set_entry({.category = "gameplay", .name = "audio_offset", .value = 1.5}), runtime_error);
	EXPECT_EQ(config.get_entry<int>("gameplay", "audio_offset"), 15);
}

TEST(Config, LoadsOverridesFromFile)
{
	auto const path = fs::temp_directory_path() / "stepline-config-test.toml";
	auto const contents = string{
		"[gameplay]\n"
		"lead_in = 500\n"
		"scroll_speed = 2.5\n"
		"difficulty = \"Expert\"\n"
		"[controls]\n"
		"kb_left = \"Q\"\n"
	};
	io::write_file(path, {reinterpret_cast<byte const*>(contents.data()), contents.size()});
	{
		auto config = Config{path};
		config.load_from_file();
		EXPECT_EQ(config.get_entry<int>("gameplay", "lead_in"), 500);
		EXPECT_DOUBLE_EQ(config.get_entry<double>("gameplay", "scroll_speed"), 2.5);
		EXPECT_EQ(config.get_entry<string>("gameplay", "difficulty"), "Expert");
		EXPECT_EQ(config.get_entry<string>("controls", "kb_left"), "Q");
		EXPECT_EQ(config.get_entry<string>("controls", "kb_right"), "Right");
	}

	// The file was rewritten with every entry on destruction
	auto reloaded = Config{path};
	reloaded.load_from_file();
	EXPECT_EQ(reloaded.get_entry<int>("gameplay", "lead_in"), 500);
	fs::remove(path);
}

TEST(Config, MissingFileKeepsDefaults)
{
	auto const path = fs::temp_directory_path() / "stepline-config-missing.toml";
	fs::remove(path);
	{
		auto config = Config{path};
		EXPECT_NO_THROW(config.load_from_file());
		EXPECT_EQ(config.get_entry<int>("pipewire", "buffer_size"), 128);
	}
	fs::remove(path);
}

TEST(File, AudioExtensionMatching)
{
	EXPECT_TRUE(io::has_extension("songs/track.ogg", io::AudioExtensions));
	EXPECT_TRUE(io::has_extension("TRACK.MP3", io::AudioExtensions));
	EXPECT_FALSE(io::has_extension("chart.sm", io::AudioExtensions));
	EXPECT_FALSE(io::has_extension("noextension", io::AudioExtensions));
}

TEST(File, ReadMissingFileThrows)
{
	EXPECT_THROW(io::read_file_bytes(fs::temp_directory_path() / "stepline-no-such-file.ogg"), runtime_error);
	EXPECT_THROW(io::read_file_bytes(fs::temp_directory_path()), runtime_error);
}

TEST(Logger, ParseLevel)
{
	EXPECT_EQ(parse_log_level("Info"), Logger::Level::Info);
	EXPECT_EQ(parse_log_level("TraceL1"), Logger::Level::TraceL1);
	EXPECT_EQ(parse_log_level("Warning"), Logger::Level::Warning);
	EXPECT_THROW(parse_log_level("Loud"), runtime_error);
}

TEST(Logger, StringLoggerCapturesMessages)
{
	auto log = globals::logger->create_string_logger("LoggerTest", Logger::Level::Info);
	INFO_AS(log, "Hello {}", 42);
	DEBUG_AS(log, "Filtered out");
	auto const buffer = log.get_buffer();
	EXPECT_NE(buffer.find("Hello 42"), string::npos);
	EXPECT_EQ(buffer.find("Filtered out"), string::npos);
	EXPECT_TRUE(log.get_buffer().empty());
}

}
