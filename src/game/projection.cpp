/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "game/projection.hpp"

#include "preamble.hpp"
#include "utils/assert.hpp"

namespace stepline::game {

Playfield::Playfield(double scroll_speed, double receptor_y):
	scroll_multiplier{scroll_speed},
	receptor_y{receptor_y}
{
	ASSERT(scroll_speed > 0.0);
}

void Playfield::resize(int new_width, int new_height)
{
	width = max(new_width, 0);
	height = max(new_height, 0);
}

auto Playfield::get_visible_window() const -> nanoseconds
{
	return seconds_to_ns(static_cast<double>(height) / get_scroll_speed());
}

auto Playfield::lane_x(Lane lane) const -> double
{
	constexpr auto LaneWidth = ArrowSize + LaneGap;
	constexpr auto TotalWidth = LaneWidth * LaneCount - LaneGap;
	auto const start = (static_cast<double>(width) - TotalWidth) / 2.0;
	return start + LaneWidth * +lane;
}

auto Playfield::note_y(nanoseconds timestamp, nanoseconds current) const -> double
{
	return receptor_y + ratio(timestamp - current, 1s) * get_scroll_speed();
}

auto project(Chart const& chart, span<NoteState const> note_states, nanoseconds current,
	nanoseconds visible_window, Playfield const& playfield) -> vector<ProjectedNote>
{
	ASSERT(note_states.size() == chart.notes.size());
	auto const window_start = current - Playfield::VisibilityMargin;
	auto const window_end = current + visible_window + Playfield::VisibilityMargin;

	auto result = vector<ProjectedNote>{};
	auto const first = lower_bound(chart.notes, window_start, {}, &Note::timestamp);
	for (auto it = first; it != chart.notes.end() && it->timestamp <= window_end; ++it) {
		auto const idx = static_cast<isize>(distance(chart.notes.begin(), it));
		auto const& state = note_states[idx];
		result.emplace_back(ProjectedNote{
			.note_idx = idx,
			.note = &*it,
			.screen_y = playfield.note_y(it->timestamp, current),
			.end_screen_y = it->type_is<Note::Hold>()?
				make_optional(playfield.note_y(it->params<Note::Hold>().end, current)) : nullopt,
			.hit = state.hit,
			.missed = state.missed,
		});
	}
	return result;
}

}
