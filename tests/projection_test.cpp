/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include <gtest/gtest.h>
#include "preamble.hpp"
#include "game/projection.hpp"
#include "game/judge.hpp"
#include "game/chart.hpp"
#include "game/lane.hpp"

namespace stepline::game {

static auto tap(nanoseconds timestamp, Lane lane) -> Note
{
	return Note{.timestamp = timestamp, .type = Note::Tap{lane}};
}

class ProjectionTest: public testing::Test {
protected:
	Playfield playfield{1.0, 100.0};

	void SetUp() override { playfield.resize(800, 600); }
};

TEST_F(ProjectionTest, ViewportGeometry)
{
	EXPECT_TRUE(playfield.has_viewport());
	EXPECT_DOUBLE_EQ(playfield.get_scroll_speed(), 600.0);
	EXPECT_EQ(playfield.get_visible_window(), 1s);
	EXPECT_DOUBLE_EQ(playfield.get_receptor_y(), 100.0);

	// 4 lanes of 64px with 8px gaps, centered in 800px
	EXPECT_DOUBLE_EQ(playfield.lane_x(Lane::Left), 260.0);
	EXPECT_DOUBLE_EQ(playfield.lane_x(Lane::Down), 332.0);
	EXPECT_DOUBLE_EQ(playfield.lane_x(Lane::Up), 404.0);
	EXPECT_DOUBLE_EQ(playfield.lane_x(Lane::Right), 476.0);

	EXPECT_DOUBLE_EQ(playfield.note_y(5s, 5s), 100.0);
	EXPECT_DOUBLE_EQ(playfield.note_y(6s, 5s), 700.0);
	EXPECT_DOUBLE_EQ(playfield.note_y(4500ms, 5s), -200.0);
}

TEST_F(ProjectionTest, ScrollSpeedScalesWindow)
{
	auto fast = Playfield{2.0, 0.0};
	fast.resize(800, 600);
	EXPECT_DOUBLE_EQ(fast.get_scroll_speed(), 1200.0);
	EXPECT_EQ(fast.get_visible_window(), 500ms);
	EXPECT_DOUBLE_EQ(fast.note_y(1s, 0ns), 1200.0);
}

TEST_F(ProjectionTest, NoViewportUntilResized)
{
	auto fresh = Playfield{1.0, 100.0};
	EXPECT_FALSE(fresh.has_viewport());
	EXPECT_EQ(fresh.get_visible_window(), 0ns);
	fresh.resize(800, 0);
	EXPECT_FALSE(fresh.has_viewport());
}

TEST_F(ProjectionTest, ProjectsNotesWithinMarginedWindow)
{
	auto const chart = Chart::build({
		tap(-600ms, Lane::Left),
		tap(-500ms, Lane::Down),
		tap(0ms, Lane::Up),
		tap(1500ms, Lane::Right),
		tap(1501ms, Lane::Left),
	});
	auto const states = std::vector<NoteState>(chart.notes.size(), NoteState{});
	auto const projected = project(chart, states, 0ns, playfield.get_visible_window(), playfield);

	ASSERT_EQ(projected.size(), 3u);
	EXPECT_EQ(projected[0].note_idx, 1);
	EXPECT_EQ(projected[1].note_idx, 2);
	EXPECT_EQ(projected[2].note_idx, 3);
	EXPECT_EQ(projected[0].note, &chart.notes[1]);
	EXPECT_DOUBLE_EQ(projected[0].screen_y, -200.0);
	EXPECT_DOUBLE_EQ(projected[1].screen_y, 100.0);
	EXPECT_DOUBLE_EQ(projected[2].screen_y, 1000.0);
}

TEST_F(ProjectionTest, ProjectionIsRepeatable)
{
	auto const chart = Chart::build({tap(200ms, Lane::Left), tap(400ms, Lane::Right)});
	auto const states = std::vector<NoteState>(chart.notes.size(), NoteState{});
	auto const first = project(chart, states, 100ms, 1s, playfield);
	auto const second = project(chart, states, 100ms, 1s, playfield);
	ASSERT_EQ(first.size(), second.size());
	for (auto i: views::iota(0zu, first.size())) {
		EXPECT_EQ(first[i].note_idx, second[i].note_idx);
		EXPECT_DOUBLE_EQ(first[i].screen_y, second[i].screen_y);
	}
}

TEST_F(ProjectionTest, CarriesJudgingStateAndHoldEnds)
{
	auto const chart = Chart::build({
		tap(0ms, Lane::Left),
		tap(100ms, Lane::Down),
		Note{.timestamp = 200ms, .type = Note::Hold{Lane::Up, 700ms}},
	});
	auto states = std::vector<NoteState>(chart.notes.size(), NoteState{});
	states[0].hit = true;
	states[1].missed = true;
	auto const projected = project(chart, states, 0ns, 1s, playfield);

	ASSERT_EQ(projected.size(), 3u);
	EXPECT_TRUE(projected[0].hit);
	EXPECT_FALSE(projected[0].missed);
	EXPECT_TRUE(projected[1].missed);
	EXPECT_FALSE(projected[0].end_screen_y);
	ASSERT_TRUE(projected[2].end_screen_y);
	EXPECT_DOUBLE_EQ(*projected[2].end_screen_y, 100.0 + 0.7 * 600.0);
}

}
