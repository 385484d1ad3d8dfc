/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "game/chart.hpp"

#include "preamble.hpp"

namespace stepline::game {

auto Note::occupies(Lane lane) const -> bool
{
	return visit(visitor{
		[&](Tap const& tap) { return tap.lane == lane; },
		[&](Jump const& jump) { return contains(jump.lanes, lane); },
		[&](Hold const& hold) { return hold.lane == lane; },
	}, type);
}

auto Note::primary_lane() const -> Lane
{
	return visit(visitor{
		[](Tap const& tap) { return tap.lane; },
		[](Jump const& jump) { return jump.lanes[0]; },
		[](Hold const& hold) { return hold.lane; },
	}, type);
}

auto Chart::build(vector<Note> notes, int difficulty_rating) -> Chart
{
	for (auto const& note: notes) {
		auto const lanes_valid = visit(visitor{
			[](Note::Tap const& tap) { return enum_contains(tap.lane); },
			[](Note::Jump const& jump) { return all_of(jump.lanes, [](Lane lane) { return enum_contains(lane); }); },
			[](Note::Hold const& hold) { return enum_contains(hold.lane); },
		}, note.type);
		if (!lanes_valid)
			throw runtime_error_fmt("Note at {}ms is outside of the playfield's lanes",
				duration_cast<milliseconds>(note.timestamp).count());
		if (auto const* jump = get_if<Note::Jump>(&note.type); jump && jump->lanes[0] == jump->lanes[1])
			throw runtime_error_fmt("Jump at {}ms uses lane {} twice",
				duration_cast<milliseconds>(note.timestamp).count(), enum_name(jump->lanes[0]));
		if (auto const* hold = get_if<Note::Hold>(&note.type); hold && hold->end <= note.timestamp)
			throw runtime_error_fmt("Hold at {}ms doesn't end after it starts",
				duration_cast<milliseconds>(note.timestamp).count());
	}
	stable_sort(notes, {}, &Note::timestamp);
	auto const note_count = static_cast<isize>(notes.size());
	return Chart{
		.notes = move(notes),
		.note_count = note_count,
		.difficulty_rating = difficulty_rating,
	};
}

}
