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

// How early a hold can be released and still count as completed.
inline constexpr auto ReleaseGrace = 50ms;

// Tracks the lifetime of hold notes after their head is hit.
class HoldTracker {
public:
	enum class HoldState {
		NotStarted,
		Active,
		Completed,
		Dropped,
	};

	struct HoldEvent {
		isize note_idx;
		Lane lane;
		HoldState outcome; // Completed or Dropped
		nanoseconds timestamp;
	};

	explicit HoldTracker(shared_ptr<Chart const>);

	// Start tracking a hold whose head was just hit. If the lane already has an active hold,
	// that hold is completed first.
	void activate(isize note_idx, nanoseconds timestamp);

	// Handle a release of a lane. The lane's active hold is dropped if released before
	// the grace window of its end; releases anywhere else are ignored.
	void release(Lane, nanoseconds timestamp);

	// Complete every active hold whose end was reached.
	void update(nanoseconds timestamp);

	[[nodiscard]] auto get_state(isize note_idx) const -> HoldState;

	// The end time of each lane's active hold, if any.
	[[nodiscard]] auto active_holds() const -> PerLane<optional<nanoseconds>>;

	// Return every hold completion or drop since the last time this was called.
	auto pending_hold_events() -> generator<HoldEvent>;

private:
	shared_ptr<Chart const> chart;
	vector<HoldState> states;
	PerLane<optional<isize>> active; // Note index of each lane's active hold
	spsc_queue<HoldEvent> hold_events;

	void finish(Lane, HoldState outcome, nanoseconds timestamp);
};

}
