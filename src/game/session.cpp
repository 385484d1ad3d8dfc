/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "game/session.hpp"

#include "preamble.hpp"
#include "utils/assert.hpp"
#include "utils/config.hpp"

namespace stepline::game {

auto GameplayConfig::from_config() -> GameplayConfig
{
	auto const lead_in = globals::config->get_entry<int>("gameplay", "lead_in");
	if (lead_in < 0) throw runtime_error_fmt("Lead-in can't be negative: {}ms", lead_in);
	auto const scroll_speed = globals::config->get_entry<double>("gameplay", "scroll_speed");
	if (scroll_speed <= 0.0) throw runtime_error_fmt("Scroll speed must be positive: {}", scroll_speed);
	return GameplayConfig{
		.lead_in = milliseconds{lead_in},
		.audio_offset = milliseconds{globals::config->get_entry<int>("gameplay", "audio_offset")},
		.scroll_speed = scroll_speed,
		.receptor_y = globals::config->get_entry<double>("gameplay", "receptor_y"),
	};
}

Session::Session(Logger::Category cat, audio::Clock& clock, input::Poller& poller,
	shared_ptr<ChartSet const> chart_set, Difficulty difficulty, GameplayConfig config, Callbacks callbacks):
	cat{cat},
	clock{clock},
	poller{poller},
	chart_set{move(chart_set)},
	difficulty{difficulty},
	config{config},
	callbacks{move(callbacks)},
	playfield{config.scroll_speed, config.receptor_y}
{
	ASSERT(config.lead_in >= 0ns);
}

Session::~Session() noexcept
{
	claim.reset();
}

auto Session::start() -> expected<void, StartError>
{
	if (state != State::Idle) return {};
	if (!chart_set) return fail_start(StartError::ResourceNotReady, "no chart set");
	auto selected = chart_set->find(difficulty);
	if (!selected) return fail_start(StartError::ChartUnavailable, enum_name(difficulty));
	if (!clock.is_loaded()) return fail_start(StartError::ResourceNotReady, "audio not loaded");
	if (!playfield.has_viewport()) return fail_start(StartError::ResourceNotReady, "no viewport");

	chart = move(selected);
	judge.emplace(chart);
	hold_tracker.emplace(chart);
	score.emplace(chart->note_count);
	claim.reset();
	claim.emplace(clock.acquire());
	poller.reset();
	lead_in_reference.reset();
	lead_in_time = -config.lead_in;
	latest_judgment.reset();
	results.reset();
	frame = Frame{};
	INFO_AS(cat, "Starting {} chart with {} notes", enum_name(difficulty), chart->note_count);
	set_state(State::LeadIn);
	return {};
}

void Session::tick(nanoseconds now)
{
	if (!check_claim()) return;
	auto const generation = tick_generation;
	switch (state) {
	case State::LeadIn:
		tick_lead_in(now, generation);
		break;
	case State::Playing:
		tick_playing();
		break;
	case State::Paused:
		update_frame(clock.get_current_time() + config.audio_offset);
		break;
	case State::Idle:
	case State::Finished:
		break;
	}
}

void Session::pause()
{
	if (state != State::Playing || !check_claim()) return;
	clock.pause();
	set_state(State::Paused);
}

void Session::resume()
{
	if (state != State::Paused || !check_claim()) return;
	clock.resume();
	set_state(State::Playing);
}

void Session::stop()
{
	tick_generation += 1;
	poller.reset();
	claim.reset(); // Stops playback, unless another session took over the clock
	if (state != State::Idle) set_state(State::Idle);
}

auto Session::restart() -> expected<void, StartError>
{
	stop();
	return start();
}

auto Session::get_score() const -> Score const&
{
	return *ASSERT_VAL(score);
}

auto Session::get_note_states() const -> span<NoteState const>
{
	return ASSERT_VAL(judge)->get_note_states();
}

auto Session::get_hold_state(isize note_idx) const -> HoldTracker::HoldState
{
	return ASSERT_VAL(hold_tracker)->get_state(note_idx);
}

auto Session::fail_start(StartError error, string_view reason) -> expected<void, StartError>
{
	WARN_AS(cat, "Session can't start ({}): {}", enum_name(error), reason);
	return unexpected{error};
}

auto Session::check_claim() -> bool
{
	if (state == State::Idle || state == State::Finished) return true;
	if (claim && claim->is_current()) return true;
	INFO_AS(cat, "Audio clock was taken over by another session, stopping");
	stop();
	return false;
}

void Session::set_state(State new_state)
{
	DEBUG_AS(cat, "Session state: {} -> {}", enum_name(state), enum_name(new_state));
	state = new_state;
	if (callbacks.on_state_change) callbacks.on_state_change(new_state);
}

void Session::tick_lead_in(nanoseconds now, uint64_t generation)
{
	if (!lead_in_reference) lead_in_reference = now;
	lead_in_time = -config.lead_in + (now - *lead_in_reference);
	if (lead_in_time < 0ns) {
		poller.poll(lead_in_time); // Only for receptor flashes, there's nothing to judge yet
		update_frame(lead_in_time);
		return;
	}

	clock.play({});
	set_state(State::Playing);
	if (generation != tick_generation) return;
	update_frame(clock.get_current_time() + config.audio_offset);
}

void Session::tick_playing()
{
	auto const clock_time = clock.get_current_time();
	auto const time = clock_time + config.audio_offset;

	auto const edges = poller.poll(time);
	for (auto const& edge: edges) {
		if (edge.pressed) judge->press(edge.lane, edge.timestamp);
	}
	judge->sweep_misses(time);
	process_judgments(time);

	for (auto const& edge: edges) {
		if (!edge.pressed) hold_tracker->release(edge.lane, edge.timestamp);
	}
	hold_tracker->update(time);
	process_holds();

	if (clock.has_ended() || clock_time >= clock.get_duration()) {
		finish();
		return;
	}

	update_frame(time);
	if (callbacks.on_score_update) callbacks.on_score_update(*score);
}

void Session::process_judgments(nanoseconds time)
{
	for (auto const& event: judge->pending_judgment_events()) {
		score->record_judgment(event.judgment);
		latest_judgment = JudgmentDisplay{
			.judgment = event.judgment,
			.timestamp = event.timestamp,
		};
		if (event.judgment == Judgment::Miss) {
			TRACE_AS(cat, "Note #{} missed at {}ms", event.note_idx, duration_cast<milliseconds>(time).count());
			continue;
		}
		TRACE_AS(cat, "Note #{} on lane {}: {}, {}us", event.note_idx, enum_name(event.lane),
			enum_name(event.judgment), duration_cast<microseconds>(*event.timing).count());
		if (chart->notes[event.note_idx].type_is<Note::Hold>())
			hold_tracker->activate(event.note_idx, event.timestamp);
	}
}

void Session::process_holds()
{
	for (auto const& event: hold_tracker->pending_hold_events()) {
		judge->end_hold(event.note_idx);
		DEBUG_AS(cat, "Hold #{} on lane {}: {} at {}ms", event.note_idx, enum_name(event.lane),
			enum_name(event.outcome), duration_cast<milliseconds>(event.timestamp).count());
	}
}

void Session::finish()
{
	poller.reset();
	results = score->finalize();
	INFO_AS(cat, "Chart finished: score {}/{}, accuracy {:.2f}%, grade {}, max combo {}",
		results->score, results->max_possible_score, results->accuracy * 100.0,
		enum_name(results->grade), results->max_combo);
	auto const generation = tick_generation;
	set_state(State::Finished);
	if (generation != tick_generation) return;
	if (callbacks.on_finish) callbacks.on_finish(*results);
}

void Session::update_frame(nanoseconds time)
{
	frame.current_time = time;
	frame.notes = project(*chart, judge->get_note_states(), time, playfield.get_visible_window(), playfield);
	frame.receptor_flash = poller.get_held();
	auto const hold_ends = hold_tracker->active_holds();
	for (auto [end_y, end]: views::zip(frame.active_hold_end_y, hold_ends))
		end_y = end? make_optional(playfield.note_y(*end, time)) : nullopt;
	frame.judgment = latest_judgment;
	frame.combo = score->get_combo();
	frame.lead_in_remaining = state == State::LeadIn? make_optional(-lead_in_time) : nullopt;
}

}
