/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "game/hold_tracker.hpp"

#include "preamble.hpp"
#include "utils/assert.hpp"

namespace stepline::game {

HoldTracker::HoldTracker(shared_ptr<Chart const> chart):
	chart{move(chart)}
{
	ASSERT(this->chart);
	states.resize(this->chart->notes.size(), HoldState::NotStarted);
}

void HoldTracker::activate(isize note_idx, nanoseconds timestamp)
{
	ASSERT(note_idx >= 0 && note_idx < static_cast<isize>(states.size()));
	auto const& note = chart->notes[note_idx];
	ASSERT(note.type_is<Note::Hold>());
	if (states[note_idx] != HoldState::NotStarted) return;

	auto const lane = note.params<Note::Hold>().lane;
	if (active[+lane]) finish(lane, HoldState::Completed, timestamp);
	states[note_idx] = HoldState::Active;
	active[+lane] = note_idx;
}

void HoldTracker::release(Lane lane, nanoseconds timestamp)
{
	if (!active[+lane]) return;
	auto const end = chart->notes[*active[+lane]].params<Note::Hold>().end;
	if (timestamp < end - ReleaseGrace) finish(lane, HoldState::Dropped, timestamp);
}

void HoldTracker::update(nanoseconds timestamp)
{
	for (auto lane: enum_values<Lane>()) {
		if (!active[+lane]) continue;
		auto const end = chart->notes[*active[+lane]].params<Note::Hold>().end;
		if (timestamp >= end) finish(lane, HoldState::Completed, timestamp);
	}
}

auto HoldTracker::get_state(isize note_idx) const -> HoldState
{
	ASSERT(note_idx >= 0 && note_idx < static_cast<isize>(states.size()));
	return states[note_idx];
}

auto HoldTracker::active_holds() const -> PerLane<optional<nanoseconds>>
{
	auto result = PerLane<optional<nanoseconds>>{};
	for (auto [end, idx]: views::zip(result, active)) {
		if (idx) end = chart->notes[*idx].params<Note::Hold>().end;
	}
	return result;
}

auto HoldTracker::pending_hold_events() -> generator<HoldEvent>
{
	auto event = HoldEvent{};
	while (hold_events.try_dequeue(event)) co_yield move(event);
}

void HoldTracker::finish(Lane lane, HoldState outcome, nanoseconds timestamp)
{
	auto const idx = *ASSUME_VAL(active[+lane]);
	states[idx] = outcome;
	active[+lane].reset();
	hold_events.enqueue(HoldEvent{
		.note_idx = idx,
		.lane = lane,
		.outcome = outcome,
		.timestamp = timestamp,
	});
}

}
