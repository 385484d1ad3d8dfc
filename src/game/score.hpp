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

namespace stepline::game {

enum class Grade {
	AAA, AA, A,
	B, C, D, F,
};

// Points awarded for each judgment.
inline constexpr auto JudgmentPoints = to_array<isize>({100, 98, 65, 25, 0});
inline constexpr auto MaxNotePoints = JudgmentPoints[0];

// Text shown to the player for a judgment.
[[nodiscard]] auto judgment_text(Judgment) -> string_view;

// Final outcome of a play.
struct Results {
	using JudgmentCounts = array<isize, enum_count<Judgment>()>;

	isize score;
	isize max_possible_score;
	double accuracy;
	Grade grade;
	isize max_combo;
	JudgmentCounts judgments;
	bool full_combo; // No misses
	bool perfect_full_combo; // No misses, greats or goods
	bool top_full_combo; // Marvelous only
	isize notes_hit;
	isize notes_missed;
	isize total_notes;
};

// Running score of a play.
class Score {
public:
	explicit Score(isize total_notes);

	// Add a judgment to the totals.
	void record_judgment(Judgment);

	[[nodiscard]] auto get_score() const -> isize { return score; }
	[[nodiscard]] auto get_max_possible_score() const -> isize { return total_notes * MaxNotePoints; }
	[[nodiscard]] auto get_combo() const -> isize { return combo; }
	[[nodiscard]] auto get_max_combo() const -> isize { return max_combo; }
	[[nodiscard]] auto get_accuracy() const -> double { return accuracy; }
	[[nodiscard]] auto get_grade() const -> Grade { return grade; }
	[[nodiscard]] auto get_judgments() const -> Results::JudgmentCounts const& { return judgments; }
	[[nodiscard]] auto get_notes_hit() const -> isize { return notes_hit; }
	[[nodiscard]] auto get_notes_missed() const -> isize { return notes_missed; }
	[[nodiscard]] auto get_total_notes() const -> isize { return total_notes; }

	// Snapshot the score as final results.
	[[nodiscard]] auto finalize() const -> Results;

private:
	isize total_notes;
	Results::JudgmentCounts judgments{};
	isize score = 0;
	isize combo = 0;
	isize max_combo = 0;
	isize notes_hit = 0;
	isize notes_missed = 0;
	double accuracy = 1.0;
	Grade grade = Grade::AAA;
};

// Grade earned by an accuracy value.
[[nodiscard]] auto grade_for(double accuracy) -> Grade;

}
