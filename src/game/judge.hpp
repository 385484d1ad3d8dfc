/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"
#include "game/chart.hpp"
#include "game/lane.hpp"

namespace stepline::game {

// Timing windows. A hit whose distance from the note is within a window gets that window's
// judgment, boundaries included.
inline constexpr auto MarvelousWindow = 22'500us;
inline constexpr auto PerfectWindow = 45ms;
inline constexpr auto GreatWindow = 90ms;
inline constexpr auto GoodWindow = 135ms;
// Not used for judging; how long a missed note lingers for display.
inline constexpr auto MissWindow = 180ms;

enum class Judgment {
	Marvelous,
	Perfect,
	Great,
	Good,
	Miss,
};

// Judge the timing of a hit. Returns nullopt if the hit is too far from the note to count.
[[nodiscard]] auto judge_timing(nanoseconds offset) -> optional<Judgment>;

// true if a press this far from a note can hit it.
[[nodiscard]] inline auto is_valid_hit(nanoseconds offset) -> bool { return abs(offset) <= GoodWindow; }

// Judging progress of a single note. hit and missed are mutually exclusive and final.
struct NoteState {
	bool hit;
	bool missed;
	bool hold_active; // Holds only; set on head hit, cleared once the hold is over

	[[nodiscard]] auto is_judged() const -> bool { return hit || missed; }
};

// Judges lane presses against a chart's notes and keeps track of which notes are already judged.
class Judge {
public:
	struct JudgmentEvent {
		isize note_idx;
		Lane lane; // Lane that hit the note; the note's primary lane for misses
		Judgment judgment;
		nanoseconds timestamp; // Time of the press, or of the sweep that found the miss
		optional<nanoseconds> timing; // Positive if late, negative if early; nullopt for misses
	};

	explicit Judge(shared_ptr<Chart const>);

	// Judge a press of a lane. The nearest unjudged note on the lane within the hit window is hit;
	// with two equally near notes, the earlier one in the chart wins. Returns false for a ghost
	// press, which has no effect.
	auto press(Lane, nanoseconds timestamp) -> bool;

	// Mark every unjudged note that can no longer be hit as missed. Repeated calls with the same
	// timestamp have no further effect.
	void sweep_misses(nanoseconds timestamp);

	// Clear the active flag of a hold note once it has completed or been dropped.
	void end_hold(isize note_idx);

	// Return every judgment since the last time this was called.
	auto pending_judgment_events() -> generator<JudgmentEvent>;

	[[nodiscard]] auto get_note_states() const -> span<NoteState const> { return {note_states.data(), note_states.size()}; }
	[[nodiscard]] auto get_chart() const -> Chart const& { return *chart; }

private:
	shared_ptr<Chart const> chart;
	vector<NoteState> note_states;
	isize sweep_cursor = 0; // Every note before this one is judged
	spsc_queue<JudgmentEvent> judgment_events;
};

}
