/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include <gtest/gtest.h>
#include "preamble.hpp"
#include "utils/logger.hpp"
#include "audio/clock.hpp"
#include "audio/track.hpp"
#include "input/poller.hpp"
#include "game/session.hpp"
#include "game/chart.hpp"
#include "game/lane.hpp"

namespace stepline::game {

using State = Session::State;
using HoldState = HoldTracker::HoldState;

static constexpr auto SamplingRate = 48000;

static auto silent_track(nanoseconds length) -> audio::Track
{
	return audio::Track{
		.samples = vector<lib::Sample>(lib::ns_to_samples(length, SamplingRate), lib::Sample{}),
		.sampling_rate = SamplingRate,
	};
}

static auto tap(nanoseconds timestamp, Lane lane) -> Note
{
	return Note{.timestamp = timestamp, .type = Note::Tap{lane}};
}

class SessionTest: public testing::Test {
protected:
	nanoseconds now = 0ns;
	PerLane<bool> keys{};
	audio::Clock clock{globals::logger->create_category("SessionTest", Logger::Level::Warning), SamplingRate, [this] { return now; }};
	input::Poller poller{globals::logger->global};
	shared_ptr<ChartSet> charts = make_shared<ChartSet>();
	GameplayConfig config{.lead_in = 0ns};
	Session::Callbacks callbacks{};
	std::vector<State> state_changes;
	isize finish_count = 0;
	optional<Session> session;

	void SetUp() override
	{
		clock.load(silent_track(2s));
		poller.add_source([this] { return keys; });
		callbacks.on_state_change = [this](State state) { state_changes.push_back(state); };
		callbacks.on_finish = [this](Results const&) { finish_count += 1; };
	}

	// Create the session with a Medium chart of the provided notes.
	void create(vector<Note> notes, Difficulty difficulty = Difficulty::Medium, bool with_viewport = true)
	{
		charts->add(Difficulty::Medium, make_shared<Chart const>(Chart::build(move(notes))));
		session.emplace(globals::logger->global, clock, poller, charts, difficulty, config, callbacks);
		if (with_viewport) session->resize(800, 600);
	}

	void tick_at(nanoseconds time)
	{
		now = time;
		session->tick(now);
	}

	void press(Lane lane, nanoseconds time)
	{
		keys[+lane] = true;
		tick_at(time);
	}

	void release(Lane lane, nanoseconds time)
	{
		keys[+lane] = false;
		tick_at(time);
	}

	// Start with no lead-in, so that clock time matches the time source.
	void start_now()
	{
		ASSERT_TRUE(session->start());
		tick_at(0ns);
		ASSERT_EQ(session->get_state(), State::Playing);
	}
};

TEST_F(SessionTest, PerfectRun)
{
	create({tap(500ms, Lane::Left), tap(750ms, Lane::Down), tap(1s, Lane::Up), tap(1250ms, Lane::Right)});
	start_now();
	auto const hits = to_array({
		pair{500ms, Lane::Left},
		pair{750ms, Lane::Down},
		pair{1000ms, Lane::Up},
		pair{1250ms, Lane::Right},
	});
	for (auto [idx, hit]: views::enumerate(hits)) {
		auto const [time, lane] = hit;
		press(lane, time);
		EXPECT_EQ(session->get_frame().combo, idx + 1);
		EXPECT_TRUE(session->get_frame().receptor_flash[+lane]);
		release(lane, time + 10ms);
	}
	tick_at(2s);

	ASSERT_EQ(session->get_state(), State::Finished);
	ASSERT_TRUE(session->get_results());
	auto const& results = *session->get_results();
	EXPECT_EQ(results.score, 400);
	EXPECT_EQ(results.max_possible_score, 400);
	EXPECT_DOUBLE_EQ(results.accuracy, 1.0);
	EXPECT_EQ(results.grade, Grade::AAA);
	EXPECT_EQ(results.max_combo, 4);
	EXPECT_EQ(results.judgments[+Judgment::Marvelous], 4);
	EXPECT_TRUE(results.top_full_combo);
	EXPECT_EQ(finish_count, 1);

	tick_at(3s);
	EXPECT_EQ(finish_count, 1);
	EXPECT_EQ(session->get_state(), State::Finished);
}

TEST_F(SessionTest, NoInputMissesEverything)
{
	create({tap(500ms, Lane::Left), tap(750ms, Lane::Down), tap(1s, Lane::Up), tap(1250ms, Lane::Right)});
	start_now();
	for (auto time = 100ms; time <= 2s; time += 100ms)
		tick_at(time);

	ASSERT_EQ(session->get_state(), State::Finished);
	auto const& results = *session->get_results();
	EXPECT_EQ(results.score, 0);
	EXPECT_EQ(results.notes_missed, 4);
	EXPECT_EQ(results.notes_hit, 0);
	EXPECT_EQ(results.judgments[+Judgment::Miss], 4);
	EXPECT_DOUBLE_EQ(results.accuracy, 0.0);
	EXPECT_EQ(results.grade, Grade::F);
	EXPECT_FALSE(results.full_combo);
	EXPECT_EQ(finish_count, 1);
	for (auto const& state: session->get_note_states())
		EXPECT_TRUE(state.missed);
}

TEST_F(SessionTest, HeldHoldCompletes)
{
	create({Note{.timestamp = 500ms, .type = Note::Hold{Lane::Left, 1s}}});
	start_now();
	press(Lane::Left, 500ms);
	EXPECT_EQ(session->get_hold_state(0), HoldState::Active);
	EXPECT_TRUE(session->get_note_states()[0].hold_active);

	tick_at(700ms);
	auto const& frame = session->get_frame();
	EXPECT_TRUE(frame.receptor_flash[+Lane::Left]);
	ASSERT_TRUE(frame.active_hold_end_y[+Lane::Left]);
	EXPECT_DOUBLE_EQ(*frame.active_hold_end_y[+Lane::Left], 100.0 + 0.3 * 600.0);

	tick_at(1s);
	EXPECT_EQ(session->get_hold_state(0), HoldState::Completed);
	EXPECT_FALSE(session->get_note_states()[0].hold_active);
	EXPECT_FALSE(session->get_frame().active_hold_end_y[+Lane::Left]);
	release(Lane::Left, 1100ms);
	EXPECT_EQ(session->get_hold_state(0), HoldState::Completed);

	tick_at(2s);
	EXPECT_EQ(session->get_results()->score, 100);
}

TEST_F(SessionTest, EarlyReleaseDropsHold)
{
	create({Note{.timestamp = 500ms, .type = Note::Hold{Lane::Left, 1s}}});
	start_now();
	press(Lane::Left, 500ms);
	release(Lane::Left, 900ms);
	EXPECT_EQ(session->get_hold_state(0), HoldState::Dropped);
	EXPECT_FALSE(session->get_note_states()[0].hold_active);

	tick_at(2s);
	auto const& results = *session->get_results();
	EXPECT_EQ(results.score, 100);
	EXPECT_EQ(results.notes_hit, 1);
	EXPECT_TRUE(results.full_combo);
}

TEST_F(SessionTest, JumpCountsOnce)
{
	create({Note{.timestamp = 500ms, .type = Note::Jump{{Lane::Left, Lane::Right}}}});
	start_now();
	press(Lane::Left, 500ms);
	press(Lane::Right, 510ms);
	tick_at(2s);

	auto const& results = *session->get_results();
	EXPECT_EQ(results.total_notes, 1);
	EXPECT_EQ(results.notes_hit, 1);
	EXPECT_EQ(results.judgments[+Judgment::Marvelous], 1);
	EXPECT_EQ(results.score, 100);
}

TEST_F(SessionTest, AudioOffsetShiftsGameplayTime)
{
	config.audio_offset = 20ms;
	create({tap(500ms, Lane::Up)});
	start_now();
	press(Lane::Up, 480ms);
	auto const& frame = session->get_frame();
	EXPECT_EQ(frame.current_time, 500ms);
	ASSERT_TRUE(frame.judgment);
	EXPECT_EQ(frame.judgment->judgment, Judgment::Marvelous);
	EXPECT_EQ(frame.judgment->timestamp, 500ms);
}

TEST_F(SessionTest, FrameProjectsUpcomingNotes)
{
	create({tap(500ms, Lane::Up), tap(3s, Lane::Down)});
	start_now();
	tick_at(100ms);
	auto const& frame = session->get_frame();
	ASSERT_EQ(frame.notes.size(), 1u);
	EXPECT_EQ(frame.notes[0].note_idx, 0);
	EXPECT_DOUBLE_EQ(frame.notes[0].screen_y, 100.0 + 0.4 * 600.0);
	EXPECT_FALSE(frame.lead_in_remaining);
	EXPECT_FALSE(frame.judgment);
}

TEST_F(SessionTest, StartRequiresViewport)
{
	create({tap(500ms, Lane::Up)}, Difficulty::Medium, false);
	auto const result = session->start();
	ASSERT_FALSE(result);
	EXPECT_EQ(result.error(), StartError::ResourceNotReady);
	EXPECT_EQ(session->get_state(), State::Idle);
	EXPECT_TRUE(state_changes.empty());
}

TEST_F(SessionTest, StartRequiresChartForDifficulty)
{
	create({tap(500ms, Lane::Up)}, Difficulty::Expert);
	auto const result = session->start();
	ASSERT_FALSE(result);
	EXPECT_EQ(result.error(), StartError::ChartUnavailable);
	EXPECT_EQ(session->get_state(), State::Idle);
}

TEST_F(SessionTest, StartRequiresLoadedAudio)
{
	create({tap(500ms, Lane::Up)});
	clock.unload();
	auto const result = session->start();
	ASSERT_FALSE(result);
	EXPECT_EQ(result.error(), StartError::ResourceNotReady);
}

TEST_F(SessionTest, StartRequiresChartSet)
{
	auto orphan = Session{globals::logger->global, clock, poller, nullptr, Difficulty::Easy};
	orphan.resize(800, 600);
	auto const result = orphan.start();
	ASSERT_FALSE(result);
	EXPECT_EQ(result.error(), StartError::ResourceNotReady);
}

TEST_F(SessionTest, LeadInCountsDownBeforeAudio)
{
	config.lead_in = 1s;
	create({tap(500ms, Lane::Up)});
	ASSERT_TRUE(session->start());
	EXPECT_EQ(session->get_state(), State::LeadIn);

	tick_at(3s);
	EXPECT_EQ(session->get_state(), State::LeadIn);
	EXPECT_EQ(session->get_frame().lead_in_remaining, 1s);
	EXPECT_FALSE(clock.is_playing());

	tick_at(3500ms);
	EXPECT_EQ(session->get_frame().lead_in_remaining, 500ms);
	EXPECT_EQ(session->get_frame().current_time, -500ms);

	tick_at(4s);
	EXPECT_EQ(session->get_state(), State::Playing);
	EXPECT_TRUE(clock.is_playing());
	EXPECT_FALSE(session->get_frame().lead_in_remaining);

	tick_at(4500ms);
	EXPECT_EQ(clock.get_current_time(), 500ms);
	EXPECT_EQ(session->get_frame().current_time, 500ms);
}

TEST_F(SessionTest, ReceptorsFlashDuringLeadIn)
{
	config.lead_in = 1s;
	create({tap(500ms, Lane::Up)});
	ASSERT_TRUE(session->start());
	tick_at(0ns);
	press(Lane::Left, 200ms);
	EXPECT_EQ(session->get_state(), State::LeadIn);
	EXPECT_TRUE(session->get_frame().receptor_flash[+Lane::Left]);
	EXPECT_FALSE(session->get_frame().receptor_flash[+Lane::Up]);
	EXPECT_EQ(session->get_score().get_combo(), 0);

	release(Lane::Left, 400ms);
	EXPECT_FALSE(session->get_frame().receptor_flash[+Lane::Left]);
	EXPECT_FALSE(session->get_note_states()[0].is_judged());
}

TEST_F(SessionTest, StartOutsideIdleDoesNothing)
{
	create({tap(500ms, Lane::Up)});
	start_now();
	press(Lane::Up, 500ms);
	EXPECT_TRUE(session->start());
	EXPECT_EQ(session->get_state(), State::Playing);
	EXPECT_EQ(session->get_score().get_notes_hit(), 1);
}

TEST_F(SessionTest, PauseAndResume)
{
	create({tap(500ms, Lane::Up), tap(1500ms, Lane::Up)});
	session->pause();
	session->resume();
	EXPECT_EQ(session->get_state(), State::Idle);

	start_now();
	tick_at(300ms);
	session->pause();
	EXPECT_EQ(session->get_state(), State::Paused);
	session->pause();
	EXPECT_FALSE(clock.is_playing());

	tick_at(1s);
	EXPECT_EQ(session->get_frame().current_time, 300ms);
	EXPECT_FALSE(session->get_note_states()[0].is_judged()); // No judging while paused

	session->resume();
	EXPECT_EQ(session->get_state(), State::Playing);
	tick_at(1100ms);
	EXPECT_EQ(clock.get_current_time(), 400ms);
	press(Lane::Up, 1200ms);
	EXPECT_TRUE(session->get_note_states()[0].hit);

	auto const expected_changes = std::vector<State>{State::LeadIn, State::Playing, State::Paused, State::Playing};
	EXPECT_EQ(state_changes, expected_changes);
}

TEST_F(SessionTest, PauseDuringLeadInIsIgnored)
{
	config.lead_in = 1s;
	create({tap(500ms, Lane::Up)});
	ASSERT_TRUE(session->start());
	tick_at(0ns);
	session->pause();
	EXPECT_EQ(session->get_state(), State::LeadIn);
}

TEST_F(SessionTest, StopFromScoreCallback)
{
	callbacks.on_score_update = [this](Score const&) { session->stop(); };
	create({tap(500ms, Lane::Up)});
	start_now();
	press(Lane::Up, 100ms);
	EXPECT_EQ(session->get_state(), State::Idle);
	EXPECT_FALSE(clock.is_playing());
	EXPECT_FALSE(poller.get_held()[+Lane::Up]);

	tick_at(2s);
	EXPECT_EQ(session->get_state(), State::Idle);
	EXPECT_EQ(finish_count, 0);
}

TEST_F(SessionTest, StopFromStateCallbackDuringLeadIn)
{
	callbacks.on_state_change = [this](State state) {
		state_changes.push_back(state);
		if (state == State::Playing) session->stop();
	};
	create({tap(500ms, Lane::Up)});
	ASSERT_TRUE(session->start());
	tick_at(0ns);
	EXPECT_EQ(session->get_state(), State::Idle);
	EXPECT_FALSE(clock.is_playing());
}

TEST_F(SessionTest, RestartBeginsAnew)
{
	create({tap(500ms, Lane::Up)});
	start_now();
	press(Lane::Up, 500ms);
	EXPECT_EQ(session->get_score().get_notes_hit(), 1);

	ASSERT_TRUE(session->restart());
	EXPECT_EQ(session->get_state(), State::LeadIn);
	EXPECT_EQ(session->get_score().get_score(), 0);
	EXPECT_FALSE(session->get_note_states()[0].is_judged());
	EXPECT_FALSE(clock.is_playing());

	tick_at(5s);
	EXPECT_EQ(session->get_state(), State::Playing);
	press(Lane::Up, 5500ms);
	EXPECT_TRUE(session->get_note_states()[0].hit);
}

TEST_F(SessionTest, SecondSessionTakesOverClock)
{
	create({tap(500ms, Lane::Up)});
	start_now();

	auto other = Session{globals::logger->global, clock, poller, charts, Difficulty::Medium, config};
	other.resize(800, 600);
	ASSERT_TRUE(other.start());
	EXPECT_FALSE(clock.is_playing());
	other.tick(now);
	EXPECT_TRUE(clock.is_playing());

	session->stop(); // Must not stop the other session's playback
	EXPECT_TRUE(clock.is_playing());
}

TEST_F(SessionTest, SessionThatLostClockCantPauseIt)
{
	create({tap(500ms, Lane::Up)});
	start_now();

	auto other = Session{globals::logger->global, clock, poller, charts, Difficulty::Medium, config};
	other.resize(800, 600);
	ASSERT_TRUE(other.start());
	other.tick(now);
	ASSERT_TRUE(clock.is_playing());

	session->pause();
	EXPECT_TRUE(clock.is_playing());
	EXPECT_EQ(session->get_state(), State::Idle);
	EXPECT_EQ(other.get_state(), State::Playing);
}

TEST_F(SessionTest, SessionThatLostClockStopsTicking)
{
	create({tap(500ms, Lane::Up)});
	start_now();

	auto other = Session{globals::logger->global, clock, poller, charts, Difficulty::Medium, config};
	other.resize(800, 600);
	ASSERT_TRUE(other.start());
	other.tick(now);

	tick_at(1s);
	EXPECT_EQ(session->get_state(), State::Idle);
	EXPECT_FALSE(session->get_note_states()[0].is_judged());
	EXPECT_EQ(finish_count, 0);
	EXPECT_TRUE(clock.is_playing());
	EXPECT_EQ(state_changes.back(), State::Idle);
}

TEST_F(SessionTest, PausedSessionThatLostClockCantResumeIt)
{
	create({tap(500ms, Lane::Up)});
	start_now();
	session->pause();

	auto other = Session{globals::logger->global, clock, poller, charts, Difficulty::Medium, config};
	other.resize(800, 600);
	ASSERT_TRUE(other.start());
	other.tick(now);
	other.pause();
	ASSERT_FALSE(clock.is_playing());

	session->resume();
	EXPECT_FALSE(clock.is_playing());
	EXPECT_EQ(session->get_state(), State::Idle);
	EXPECT_EQ(other.get_state(), State::Paused);
}

TEST(GameplayConfig, ReadsDefaultsFromConfig)
{
	auto const config = GameplayConfig::from_config();
	EXPECT_EQ(config.lead_in, 2s);
	EXPECT_EQ(config.audio_offset, 0ns);
	EXPECT_DOUBLE_EQ(config.scroll_speed, 1.0);
	EXPECT_DOUBLE_EQ(config.receptor_y, 100.0);
}

}
