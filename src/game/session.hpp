/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"
#include "utils/logger.hpp"
#include "audio/clock.hpp"
#include "input/poller.hpp"
#include "game/hold_tracker.hpp"
#include "game/projection.hpp"
#include "game/score.hpp"
#include "game/judge.hpp"
#include "game/chart.hpp"
#include "game/lane.hpp"

namespace stepline::game {

// Reasons a session can refuse to start.
enum class StartError {
	ChartUnavailable, // No chart for the selected difficulty
	ResourceNotReady, // Chart set, audio or viewport missing
};

// Gameplay settings, fixed for the lifetime of a session.
struct GameplayConfig {
	nanoseconds lead_in = 2s; // Time before the first audio sample
	nanoseconds audio_offset = 0ns; // Added to the audio clock to get gameplay time
	double scroll_speed = 1.0;
	double receptor_y = 100.0;

	// Read the settings from the "gameplay" section of the global config.
	// Throws runtime_error if a value is out of range.
	static auto from_config() -> GameplayConfig;
};

// A single play of a chart. Drives judging, hold tracking and scoring from the audio clock and
// player input, one tick at a time.
class Session {
public:
	enum class State {
		Idle,
		LeadIn,
		Playing,
		Paused,
		Finished,
	};

	struct JudgmentDisplay {
		Judgment judgment;
		nanoseconds timestamp;
	};

	// Everything needed to draw the playfield for one frame.
	struct Frame {
		nanoseconds current_time;
		vector<ProjectedNote> notes;
		PerLane<bool> receptor_flash; // Lanes currently held
		PerLane<optional<double>> active_hold_end_y;
		optional<JudgmentDisplay> judgment; // Latest judgment
		isize combo;
		optional<nanoseconds> lead_in_remaining;
	};

	// Notification hooks. All are optional, and all are called from within the session's methods.
	struct Callbacks {
		function<void(State)> on_state_change;
		function<void(Score const&)> on_score_update; // Once per playing tick
		function<void(Results const&)> on_finish;
	};

	// The clock and the poller must outlive the session.
	Session(Logger::Category, audio::Clock&, input::Poller&, shared_ptr<ChartSet const>, Difficulty,
		GameplayConfig = {}, Callbacks = {});
	~Session() noexcept;

	// Begin the lead-in. Only valid from Idle; does nothing in any other state.
	auto start() -> expected<void, StartError>;

	// Advance the session to the provided time. Timestamps are from any monotonic time source.
	void tick(nanoseconds now);

	// Does nothing unless playing. A session whose clock was taken over by another one stops instead.
	void pause();

	// Does nothing unless paused.
	void resume();

	// Abandon the session and return to Idle. Safe to call from anywhere, including callbacks.
	void stop();

	// Stop, then start again from the beginning.
	auto restart() -> expected<void, StartError>;

	// Update the viewport size in pixels.
	void resize(int width, int height) { playfield.resize(width, height); }

	[[nodiscard]] auto get_state() const -> State { return state; }
	[[nodiscard]] auto get_frame() const -> Frame const& { return frame; }
	[[nodiscard]] auto get_playfield() const -> Playfield const& { return playfield; }
	[[nodiscard]] auto get_results() const -> optional<Results> const& { return results; }

	// Score of the current or most recent play. Only valid after a successful start().
	[[nodiscard]] auto get_score() const -> Score const&;

	// Judging progress of every note. Only valid after a successful start().
	[[nodiscard]] auto get_note_states() const -> span<NoteState const>;

	// State of a hold note. Only valid after a successful start().
	[[nodiscard]] auto get_hold_state(isize note_idx) const -> HoldTracker::HoldState;

	Session(Session const&) = delete;
	auto operator=(Session const&) -> Session& = delete;
	Session(Session&&) = delete;
	auto operator=(Session&&) -> Session& = delete;

private:
	Logger::Category cat;
	audio::Clock& clock;
	input::Poller& poller;
	shared_ptr<ChartSet const> chart_set;
	Difficulty difficulty;
	GameplayConfig config;
	Callbacks callbacks;

	State state = State::Idle;
	uint64_t tick_generation = 0; // Incremented by stop(), invalidating any tick in progress
	Playfield playfield;
	shared_ptr<Chart const> chart;
	optional<Judge> judge;
	optional<HoldTracker> hold_tracker;
	optional<Score> score;
	optional<audio::Clock::Claim> claim;
	optional<nanoseconds> lead_in_reference;
	nanoseconds lead_in_time = 0ns; // Counts up from -lead_in to 0
	optional<JudgmentDisplay> latest_judgment;
	optional<Results> results;
	Frame frame{};

	auto fail_start(StartError, string_view reason) -> expected<void, StartError>;
	// Stop if another session acquired the clock since start(). Returns false if stopped.
	auto check_claim() -> bool;
	void set_state(State);
	void tick_lead_in(nanoseconds now, uint64_t generation);
	void tick_playing();
	void process_judgments(nanoseconds time);
	void process_holds();
	void finish();
	void update_frame(nanoseconds time);
};

}
