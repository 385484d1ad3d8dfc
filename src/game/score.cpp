/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "game/score.hpp"

#include "preamble.hpp"
#include "utils/assert.hpp"

namespace stepline::game {

auto judgment_text(Judgment judgment) -> string_view
{
	switch (judgment) {
	case Judgment::Marvelous: return "MARVELOUS";
	case Judgment::Perfect: return "PERFECT";
	case Judgment::Great: return "GREAT";
	case Judgment::Good: return "GOOD";
	case Judgment::Miss: return "MISS";
	default: PANIC();
	}
}

auto grade_for(double accuracy) -> Grade
{
	if (accuracy >= 1.00) return Grade::AAA;
	if (accuracy >= 0.99) return Grade::AA;
	if (accuracy >= 0.96) return Grade::A;
	if (accuracy >= 0.89) return Grade::B;
	if (accuracy >= 0.80) return Grade::C;
	if (accuracy >= 0.65) return Grade::D;
	return Grade::F;
}

Score::Score(isize total_notes):
	total_notes{total_notes}
{
	ASSERT(total_notes >= 0);
}

void Score::record_judgment(Judgment judgment)
{
	judgments[+judgment] += 1;
	score += JudgmentPoints[+judgment];
	if (judgment == Judgment::Miss) {
		combo = 0;
		notes_missed += 1;
	} else {
		combo += 1;
		max_combo = max(max_combo, combo);
		notes_hit += 1;
	}

	auto const judged = notes_hit + notes_missed;
	accuracy = static_cast<double>(score) / static_cast<double>(judged * MaxNotePoints);
	grade = grade_for(accuracy);
}

auto Score::finalize() const -> Results
{
	auto const full_combo = judgments[+Judgment::Miss] == 0;
	auto const perfect_full_combo = full_combo &&
		judgments[+Judgment::Great] == 0 && judgments[+Judgment::Good] == 0;
	return Results{
		.score = score,
		.max_possible_score = get_max_possible_score(),
		.accuracy = accuracy,
		.grade = grade,
		.max_combo = max_combo,
		.judgments = judgments,
		.full_combo = full_combo,
		.perfect_full_combo = perfect_full_combo,
		.top_full_combo = perfect_full_combo && judgments[+Judgment::Perfect] == 0,
		.notes_hit = notes_hit,
		.notes_missed = notes_missed,
		.total_notes = total_notes,
	};
}

}
