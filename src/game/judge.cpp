/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "game/judge.hpp"

#include "preamble.hpp"
#include "utils/assert.hpp"

namespace stepline::game {

auto judge_timing(nanoseconds offset) -> optional<Judgment>
{
	auto const distance = abs(offset);
	if (distance <= MarvelousWindow) return Judgment::Marvelous;
	if (distance <= PerfectWindow) return Judgment::Perfect;
	if (distance <= GreatWindow) return Judgment::Great;
	if (distance <= GoodWindow) return Judgment::Good;
	return nullopt;
}

Judge::Judge(shared_ptr<Chart const> chart):
	chart{move(chart)}
{
	ASSERT(this->chart);
	note_states.resize(this->chart->notes.size(), NoteState{});
}

auto Judge::press(Lane lane, nanoseconds timestamp) -> bool
{
	auto const& notes = chart->notes;
	auto const first = lower_bound(notes, timestamp - GoodWindow, {}, &Note::timestamp);

	auto best = optional<isize>{};
	auto best_distance = nanoseconds::max();
	for (auto it = first; it != notes.end() && it->timestamp - timestamp <= GoodWindow; ++it) {
		auto const idx = static_cast<isize>(distance(notes.begin(), it));
		if (note_states[idx].is_judged() || !it->occupies(lane)) continue;
		auto const dist = abs(timestamp - it->timestamp);
		if (dist < best_distance) { // Strict, so that the earlier note wins ties
			best = idx;
			best_distance = dist;
		}
	}
	if (!best) return false;

	auto const& note = notes[*best];
	auto& state = note_states[*best];
	auto const timing = timestamp - note.timestamp;
	state.hit = true;
	if (note.type_is<Note::Hold>()) state.hold_active = true;
	judgment_events.enqueue(JudgmentEvent{
		.note_idx = *best,
		.lane = lane,
		.judgment = *ASSUME_VAL(judge_timing(timing)),
		.timestamp = timestamp,
		.timing = timing,
	});
	return true;
}

void Judge::sweep_misses(nanoseconds timestamp)
{
	auto const& notes = chart->notes;
	while (sweep_cursor < static_cast<isize>(notes.size()) && timestamp - notes[sweep_cursor].timestamp > GoodWindow) {
		auto& state = note_states[sweep_cursor];
		if (!state.is_judged()) {
			state.missed = true;
			judgment_events.enqueue(JudgmentEvent{
				.note_idx = sweep_cursor,
				.lane = notes[sweep_cursor].primary_lane(),
				.judgment = Judgment::Miss,
				.timestamp = timestamp,
				.timing = nullopt,
			});
		}
		sweep_cursor += 1;
	}
}

void Judge::end_hold(isize note_idx)
{
	ASSERT(note_idx >= 0 && note_idx < static_cast<isize>(note_states.size()));
	note_states[note_idx].hold_active = false;
}

auto Judge::pending_judgment_events() -> generator<JudgmentEvent>
{
	auto event = JudgmentEvent{};
	while (judgment_events.try_dequeue(event)) co_yield move(event);
}

}
