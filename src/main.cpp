/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include <cstdlib>
#include "preamble.hpp"
#include "utils/task_pool.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"
#include "lib/debug.hpp"
#include "io/file.hpp"
#include "dev/gamepad.hpp"
#include "dev/window.hpp"
#include "audio/mixer.hpp"
#include "audio/clock.hpp"
#include "input/keyboard.hpp"
#include "input/poller.hpp"
#include "game/session.hpp"
#include "game/chart.hpp"

using namespace stepline; // Can't namespace main()

// Place notes on a constant-BPM grid over the whole song, one chart per difficulty. Denser
// difficulties add holds and jumps.
static auto make_demo_charts(nanoseconds song_duration, double bpm) -> shared_ptr<game::ChartSet const>
{
	using game::Note;
	using game::Lane;
	if (bpm <= 0.0) throw runtime_error_fmt("Invalid BPM: {}", bpm);
	auto const beat = seconds_to_ns(60.0 / bpm);

	auto const make_chart = [&](int steps_per_beat, int hold_every, int jump_every, int rating) {
		auto const step = beat / steps_per_beat;
		auto notes = vector<Note>{};
		auto idx = 0;
		for (auto time = beat; time + beat < song_duration; time += step, idx += 1) {
			auto const lane = static_cast<Lane>(idx % game::LaneCount);
			if (jump_every && idx % jump_every == jump_every - 1) {
				auto const other = static_cast<Lane>((idx + 2) % game::LaneCount);
				notes.emplace_back(Note{ .timestamp = time, .type = Note::Jump{{lane, other}} });
			} else if (hold_every && idx % hold_every == hold_every - 1) {
				notes.emplace_back(Note{ .timestamp = time, .type = Note::Hold{lane, time + step * 2} });
			} else {
				notes.emplace_back(Note{ .timestamp = time, .type = Note::Tap{lane} });
			}
		}
		return make_shared<game::Chart const>(game::Chart::build(move(notes), rating));
	};

	auto charts = make_shared<game::ChartSet>();
	charts->add(game::Difficulty::Easy, make_chart(1, 0, 0, 2));
	charts->add(game::Difficulty::Medium, make_chart(1, 8, 0, 4));
	charts->add(game::Difficulty::Hard, make_chart(2, 8, 0, 7));
	charts->add(game::Difficulty::Expert, make_chart(2, 8, 6, 10));
	return charts;
}

static auto run(int argc, char* argv[]) -> int
{
	if (argc < 2) {
		CRIT("Usage: {} <audio file> [bpm]", argv[0]);
		return EXIT_FAILURE;
	}
	auto const song_path = fs::path{argv[1]};
	if (!io::has_extension(song_path, io::AudioExtensions))
		WARN("\"{}\" doesn't have an audio file extension, decoding might fail", song_path);
	auto const bpm = argc >= 3? lexical_cast<double>(argv[2]) : 120.0;
	auto const difficulty_name = globals::config->get_entry<string>("gameplay", "difficulty");
	auto const difficulty = *enum_cast<game::Difficulty>(difficulty_name).or_else([&] -> optional<game::Difficulty> {
		throw runtime_error_fmt("Unknown difficulty: {}", difficulty_name);
	});
	auto const gameplay_config = game::GameplayConfig::from_config();

	auto* session_cat = globals::logger->create_configured_category("Session", "session");
	auto* audio_cat = globals::logger->create_configured_category("Audio", "audio");
	auto* input_cat = globals::logger->create_configured_category("Input", "input");

	auto glfw_stub = globals::glfw.provide();
	auto window = dev::Window{AppTitle, 1280, 720};
	auto bg_pool_stub = globals::bg_pool.provide(make_bg_pool(max(2u, jthread::hardware_concurrency()) - 1));
	auto mixer_stub = globals::mixer.provide(audio_cat);
	INFO("Audio latency: {:.1f}ms", ratio(globals::mixer->get_latency(), 1ms));

	auto clock = audio::Clock{audio_cat, globals::mixer->get_audio().get_sampling_rate(),
		[] { return globals::glfw->get_time(); }};
	globals::mixer->add_generator(clock);
	auto const clock_registration = unique_resource{&clock, [](audio::Clock* c) { globals::mixer->remove_generator(*c); }};

	auto poller = input::Poller{input_cat};
	auto const keyboard = input::Keyboard{window, input::Keyboard::bindings_from_config()};
	auto const gamepads = dev::Gamepads{input_cat};
	auto const axis_threshold = static_cast<float>(globals::config->get_entry<double>("controls", "axis_threshold"));
	poller.add_source([&] { return keyboard.get_state(); });
	poller.add_source([&] { return gamepads.get_state(axis_threshold); });

	INFO("Loading \"{}\"", song_path);
	auto pending_load = clock.load_async(io::read_file_bytes(song_path));
	auto song_duration = optional<nanoseconds>{};
	while (!song_duration) {
		if (window.is_closing()) return EXIT_SUCCESS;
		globals::glfw->poll();
		if (auto const result = pending_load.poll()) {
			if (!*result) {
				CRIT("Unable to load \"{}\": {}", song_path, result->error().message);
				return EXIT_FAILURE;
			}
			song_duration = **result;
		}
		sleep_for(10ms);
	}

	auto session = game::Session{session_cat, clock, poller, make_demo_charts(*song_duration, bpm), difficulty,
		gameplay_config, {
			.on_state_change = [&](game::Session::State state) {
				if (state == game::Session::State::Paused) INFO("Paused");
			},
			.on_finish = [&](game::Results const& results) {
				INFO("Marvelous: {}, Perfect: {}, Great: {}, Good: {}, Miss: {}",
					results.judgments[+game::Judgment::Marvelous], results.judgments[+game::Judgment::Perfect],
					results.judgments[+game::Judgment::Great], results.judgments[+game::Judgment::Good],
					results.judgments[+game::Judgment::Miss]);
				if (results.top_full_combo) INFO("Marvelous full combo!");
				else if (results.perfect_full_combo) INFO("Perfect full combo!");
				else if (results.full_combo) INFO("Full combo!");
			},
		}};
	auto const [width, height] = window.size();
	session.resize(width, height);
	window.register_resize_callback([&](int w, int h) { session.resize(w, h); });

	window.register_key_callback([&](dev::Window::KeyCode key, bool pressed) {
		if (!pressed) return;
		if (key == dev::Window::KeyCode::Escape) {
			if (session.get_state() == game::Session::State::Paused)
				session.resume();
			else
				session.pause();
		}
		if (key == dev::Window::KeyCode::Minus || key == dev::Window::KeyCode::Equal) {
			auto const step = key == dev::Window::KeyCode::Minus? -0.1f : 0.1f;
			globals::mixer->set_master_volume(globals::mixer->get_master_volume() + step);
			INFO("Master volume: {:.0f}%", globals::mixer->get_master_volume() * 100.0f);
		}
		if (key == dev::Window::KeyCode::Q) window.request_close();
		if (key == dev::Window::KeyCode::R) {
			if (auto const restarted = session.restart(); !restarted)
				ERROR("Unable to restart the session: {}", enum_name(restarted.error()));
		}
	});

	if (auto const started = session.start(); !started)
		throw runtime_error_fmt("Unable to start the session: {}", enum_name(started.error()));
	while (!window.is_closing() && session.get_state() != game::Session::State::Finished) {
		globals::glfw->poll();
		session.tick(globals::glfw->get_time());
		sleep_for(1ms);
	}
	return EXIT_SUCCESS;
}

auto main(int argc, char* argv[]) -> int
try {
	lib::dbg::set_assert_handler();
	auto config_stub = globals::config.provide(fs::path{ConfigPath});
	globals::config->load_from_file();
	auto logger_stub = globals::logger.provide(LogfilePath,
		parse_log_level(globals::config->get_entry<string>("logging", "global")));
	INFO("{} {}.{}.{} starting up", AppTitle, AppVersion[0], AppVersion[1], AppVersion[2]);
	return run(argc, argv);
}
catch (exception const& e) {
	if (globals::logger)
		CRIT("Uncaught exception: {}", e.what());
	else
		lib::dbg::syserror(format("Uncaught exception: {}", e.what()));
	return EXIT_FAILURE;
}
