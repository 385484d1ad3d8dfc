/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"
#include "game/judge.hpp"
#include "game/chart.hpp"
#include "game/lane.hpp"

namespace stepline::game {

// Geometry of the playfield: converts chart time into screen coordinates.
class Playfield {
public:
	// Pixels per second of chart time at a scroll speed of 1.0.
	static constexpr auto BaseScrollSpeed = 600.0;
	static constexpr auto ArrowSize = 64.0;
	static constexpr auto LaneGap = 8.0;
	// Extra time before and after the visible window in which notes are still projected.
	static constexpr auto VisibilityMargin = 500ms;

	Playfield(double scroll_speed, double receptor_y);

	// Update the viewport size in pixels.
	void resize(int width, int height);

	[[nodiscard]] auto has_viewport() const -> bool { return width > 0 && height > 0; }

	// Amount of chart time that fits between the top and bottom of the viewport.
	[[nodiscard]] auto get_visible_window() const -> nanoseconds;

	// Pixels per second of chart time.
	[[nodiscard]] auto get_scroll_speed() const -> double { return BaseScrollSpeed * scroll_multiplier; }

	[[nodiscard]] auto get_receptor_y() const -> double { return receptor_y; }

	// Horizontal position of a lane's left edge, with all lanes centered in the viewport.
	[[nodiscard]] auto lane_x(Lane) const -> double;

	// Vertical position of a point in chart time, relative to the current time.
	[[nodiscard]] auto note_y(nanoseconds timestamp, nanoseconds current) const -> double;

private:
	double scroll_multiplier;
	double receptor_y;
	int width = 0;
	int height = 0;
};

// A note placed on the screen for the current frame.
struct ProjectedNote {
	isize note_idx;
	Note const* note;
	double screen_y;
	optional<double> end_screen_y; // Holds only
	bool hit;
	bool missed;
};

// Place every note near the visible part of the chart on the screen. Notes in the range
// [current - margin, current + visible_window + margin] are returned, in chart order.
[[nodiscard]] auto project(Chart const&, span<NoteState const>, nanoseconds current,
	nanoseconds visible_window, Playfield const&) -> vector<ProjectedNote>;

}
