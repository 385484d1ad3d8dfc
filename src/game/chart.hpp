/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"
#include "game/lane.hpp"

namespace stepline::game {

// A note of a chart with a definite timestamp, ready for gameplay.
struct Note {
	struct Tap {
		Lane lane;
	};
	struct Jump {
		array<Lane, 2> lanes; // Always distinct
	};
	struct Hold {
		Lane lane;
		nanoseconds end; // Always later than the note's timestamp
	};
	using Type = variant<
		Tap,  // 0
		Jump, // 1
		Hold  // 2
	>;

	nanoseconds timestamp;
	Type type;

	template<variant_alternative<Type> T>
	[[nodiscard]] auto type_is() const -> bool { return holds_alternative<T>(type); }

	template<variant_alternative<Type> T>
	[[nodiscard]] auto params() const -> T const& { return get<T>(type); }

	// true if the note can be hit with the given lane.
	[[nodiscard]] auto occupies(Lane) const -> bool;

	// The lane used for display and hold tracking. For jumps, the first of the two.
	[[nodiscard]] auto primary_lane() const -> Lane;
};

enum class Difficulty {
	Easy,
	Medium,
	Hard,
	Expert,
};

// A complete chart. Immutable once built; share it with shared_ptr<Chart const>.
struct Chart {
	vector<Note> notes; // Sorted by timestamp from earliest
	isize note_count;
	int difficulty_rating; // For display only

	// Sort the notes and check their validity.
	// Throws runtime_error if a jump uses the same lane twice, or a hold doesn't end after it starts.
	static auto build(vector<Note> notes, int difficulty_rating = 0) -> Chart;
};

// All charts of a song, at most one per difficulty.
class ChartSet {
public:
	// Add a chart, replacing any previous one of the same difficulty.
	void add(Difficulty difficulty, shared_ptr<Chart const> chart) { charts[+difficulty] = move(chart); }

	// Retrieve the chart of a difficulty, or nullptr if there isn't one.
	[[nodiscard]] auto find(Difficulty difficulty) const -> shared_ptr<Chart const> { return charts[+difficulty]; }

	[[nodiscard]] auto has(Difficulty difficulty) const -> bool { return charts[+difficulty] != nullptr; }

private:
	array<shared_ptr<Chart const>, enum_count<Difficulty>()> charts;
};

}
