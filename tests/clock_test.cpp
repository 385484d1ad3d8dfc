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
#include "lib/audio_common.hpp"

namespace stepline::audio {

static constexpr auto SamplingRate = 48000;

// One second of a rising ramp, so that every sample is distinguishable.
static auto make_ramp_track() -> Track
{
	auto track = Track{.samples = {}, .sampling_rate = SamplingRate};
	track.samples.reserve(SamplingRate);
	for (auto i: views::iota(0, SamplingRate)) {
		auto const value = static_cast<float>(i) / SamplingRate;
		track.samples.emplace_back(lib::Sample{value, -value});
	}
	return track;
}

static auto to_bytes(string_view str) -> span<byte const>
{
	return {reinterpret_cast<byte const*>(str.data()), str.size()};
}

static constexpr auto WavFrames = 4800; // 100ms at SamplingRate

// A 16-bit stereo PCM WAV file at SamplingRate. Every frame is +0.5 on the left and -0.5 on the right.
static auto make_wav(isize frames) -> vector<byte>
{
	constexpr auto Channels = 2u;
	constexpr auto BytesPerSample = 2u;
	auto wav = vector<byte>{};
	auto const put = [&](uint32_t value, int size) {
		for (auto i: views::iota(0, size))
			wav.emplace_back(static_cast<byte>((value >> (8 * i)) & 0xFF));
	};
	auto const put_tag = [&](string_view tag) {
		for (auto c: tag) wav.emplace_back(static_cast<byte>(c));
	};

	auto const data_size = static_cast<uint32_t>(frames) * Channels * BytesPerSample;
	put_tag("RIFF");
	put(36 + data_size, 4);
	put_tag("WAVE");
	put_tag("fmt ");
	put(16, 4);
	put(1, 2); // PCM
	put(Channels, 2);
	put(SamplingRate, 4);
	put(SamplingRate * Channels * BytesPerSample, 4);
	put(Channels * BytesPerSample, 2);
	put(BytesPerSample * 8, 2);
	put_tag("data");
	put(data_size, 4);
	for (auto frame = isize{0}; frame < frames; frame += 1) {
		put(0x4000, 2);
		put(0xC000, 2);
	}
	return wav;
}

// Wait up to 5 seconds for a background decode to report its outcome.
static auto wait_for_outcome(Clock::PendingLoad& pending) -> optional<expected<nanoseconds, DecodeError>>
{
	auto outcome = optional<expected<nanoseconds, DecodeError>>{};
	for (auto attempts = 0; !outcome && attempts < 5000; attempts += 1) {
		outcome = pending.poll();
		if (!outcome) sleep_for(1ms);
	}
	return outcome;
}

class ClockTest: public testing::Test {
protected:
	nanoseconds now = 0ns;
	Clock clock{globals::logger->create_category("ClockTest", Logger::Level::Warning), SamplingRate, [this] { return now; }};

	void SetUp() override { EXPECT_EQ(clock.load(make_ramp_track()), 1s); }
};

TEST_F(ClockTest, LoadedTrackState)
{
	EXPECT_TRUE(clock.is_loaded());
	EXPECT_EQ(clock.get_duration(), 1s);
	EXPECT_FALSE(clock.is_playing());
	EXPECT_EQ(clock.get_current_time(), 0ns);
	EXPECT_EQ(clock.get_sampling_rate(), SamplingRate);

	clock.unload();
	EXPECT_FALSE(clock.is_loaded());
	EXPECT_EQ(clock.get_duration(), 0ns);
}

TEST_F(ClockTest, TimeFollowsTimeSource)
{
	now = 100ms;
	clock.play();
	EXPECT_TRUE(clock.is_playing());
	EXPECT_EQ(clock.get_state().start_reference, 100ms);

	auto previous = clock.get_current_time();
	EXPECT_EQ(previous, 0ns);
	for (auto i: views::iota(0, 1000)) {
		now += 997us;
		auto const current = clock.get_current_time();
		EXPECT_GE(current, previous) << "at read " << i;
		EXPECT_EQ(current, now - 100ms);
		EXPECT_EQ(clock.get_current_time(), current); // Reads don't change anything
		previous = current;
	}
}

TEST_F(ClockTest, PauseFreezesAndResumeContinues)
{
	clock.play();
	now = 300ms;
	clock.pause();
	EXPECT_FALSE(clock.is_playing());
	EXPECT_EQ(clock.get_current_time(), 300ms);
	now = 5s;
	EXPECT_EQ(clock.get_current_time(), 300ms);
	EXPECT_FALSE(clock.has_ended());

	clock.resume();
	EXPECT_TRUE(clock.is_playing());
	now = 5s + 100ms;
	EXPECT_EQ(clock.get_current_time(), 400ms);
	now = 5s + 700ms;
	EXPECT_TRUE(clock.has_ended()); // The segment end is unchanged by pausing
}

TEST_F(ClockTest, PauseAndResumeAreIdempotent)
{
	clock.play();
	now = 200ms;
	clock.resume();
	EXPECT_EQ(clock.get_current_time(), 200ms);
	clock.pause();
	now = 300ms;
	clock.pause();
	EXPECT_EQ(clock.get_current_time(), 200ms);
}

TEST_F(ClockTest, PlaybackEndsAtSegmentEnd)
{
	clock.play({.offset = 500ms});
	now = 499ms;
	EXPECT_FALSE(clock.has_ended());
	EXPECT_EQ(clock.get_current_time(), 999ms);
	now = 500ms;
	EXPECT_TRUE(clock.has_ended());
	EXPECT_FALSE(clock.is_playing());

	clock.play({.offset = 200ms, .duration = 300ms});
	now = 799ms;
	EXPECT_FALSE(clock.has_ended());
	now = 800ms;
	EXPECT_TRUE(clock.has_ended());
}

TEST_F(ClockTest, PlayOptionsAreClamped)
{
	clock.play({.offset = 2s});
	EXPECT_EQ(clock.get_current_time(), 1s);
	EXPECT_TRUE(clock.has_ended());

	clock.play({.offset = 800ms, .duration = 5s});
	EXPECT_EQ(clock.get_state().play_duration, 200ms);
}

TEST_F(ClockTest, LoopingWrapsWithinSegment)
{
	clock.play({.offset = 200ms, .duration = 300ms, .loop = true});
	now = 350ms;
	EXPECT_EQ(clock.get_current_time(), 250ms);
	EXPECT_FALSE(clock.has_ended());
	EXPECT_TRUE(clock.is_playing());
	now = 10s;
	EXPECT_FALSE(clock.has_ended());
	EXPECT_GE(clock.get_current_time(), 200ms);
	EXPECT_LT(clock.get_current_time(), 500ms);
}

TEST_F(ClockTest, LoopingResumeKeepsSegment)
{
	clock.play({.offset = 200ms, .duration = 300ms, .loop = true});
	now = 350ms;
	clock.pause();
	EXPECT_EQ(clock.get_current_time(), 250ms);
	now = 1s;
	clock.resume();
	now = 1300ms;
	EXPECT_EQ(clock.get_current_time(), 250ms);
}

TEST_F(ClockTest, NegativeOffsetResumesFromPausedPosition)
{
	clock.play();
	now = 400ms;
	clock.pause();
	clock.play({.offset = -1ns});
	now = 500ms;
	EXPECT_EQ(clock.get_current_time(), 500ms);
}

TEST_F(ClockTest, StopRewinds)
{
	clock.play();
	now = 400ms;
	clock.stop();
	EXPECT_FALSE(clock.is_playing());
	EXPECT_EQ(clock.get_current_time(), 0ns);
	now = 600ms;
	EXPECT_EQ(clock.get_current_time(), 0ns);
}

TEST_F(ClockTest, NewerClaimTakesOver)
{
	auto first = clock.acquire();
	clock.play();
	EXPECT_TRUE(first.is_current());

	auto second = clock.acquire();
	EXPECT_FALSE(clock.is_playing());
	EXPECT_FALSE(first.is_current());
	EXPECT_TRUE(second.is_current());

	clock.play();
	first.release();
	EXPECT_TRUE(clock.is_playing());

	{
		auto moved = move(second);
		EXPECT_TRUE(moved.is_current());
		EXPECT_FALSE(second.is_current());
	}
	EXPECT_FALSE(clock.is_playing());
}

TEST_F(ClockTest, AudioThreadFollowsPosition)
{
	clock.play({.volume = 0.5f});
	now = 10ms;
	clock.begin_buffer();
	auto const sample = clock.next_sample();
	EXPECT_FLOAT_EQ(sample.left, 480.0f / SamplingRate * 0.5f);
	EXPECT_FLOAT_EQ(sample.right, -480.0f / SamplingRate * 0.5f);
	EXPECT_FLOAT_EQ(clock.next_sample().left, 481.0f / SamplingRate * 0.5f);

	clock.pause();
	clock.begin_buffer();
	EXPECT_FLOAT_EQ(clock.next_sample().left, 0.0f);
}

TEST_F(ClockTest, AudioThreadLoops)
{
	clock.play({.offset = 0ns, .duration = 1ms, .loop = true});
	clock.begin_buffer();
	for (auto i: views::iota(0, 48))
		EXPECT_FLOAT_EQ(clock.next_sample().left, static_cast<float>(i) / SamplingRate);
	EXPECT_FLOAT_EQ(clock.next_sample().left, 0.0f);
	EXPECT_FLOAT_EQ(clock.next_sample().left, 1.0f / SamplingRate);
}

TEST(Clock, UnloadedClockIgnoresPlay)
{
	auto log = globals::logger->create_string_logger("ClockUnloaded");
	auto clock = Clock{log, SamplingRate, [] { return 0ns; }};
	clock.play();
	EXPECT_FALSE(clock.is_playing());
	EXPECT_FALSE(clock.has_ended());
	EXPECT_EQ(clock.get_current_time(), 0ns);
	EXPECT_NE(log.get_buffer().find("no track loaded"), string::npos);
}

TEST(Clock, GarbageFailsToDecode)
{
	auto log = globals::logger->create_string_logger("ClockGarbage");
	auto clock = Clock{log, SamplingRate, [] { return 0ns; }};

	auto const result = clock.load(to_bytes("This is not an audio file, just some text."));
	ASSERT_FALSE(result);
	EXPECT_FALSE(result.error().message.empty());
	EXPECT_FALSE(clock.is_loaded());
	EXPECT_NE(log.get_buffer().find("Failed to decode audio"), string::npos);

	auto const empty = clock.load(span<byte const>{});
	ASSERT_FALSE(empty);
	EXPECT_FALSE(clock.is_loaded());
}

TEST(Clock, BackgroundDecodeReportsFailure)
{
	auto clock = Clock{globals::logger->create_category("ClockAsync", Logger::Level::Warning), SamplingRate, [] { return 0ns; }};
	auto const text = to_bytes("Also not an audio file.");
	auto pending = clock.load_async(vector<byte>(text.begin(), text.end()));

	auto const outcome = wait_for_outcome(pending);
	ASSERT_TRUE(outcome);
	EXPECT_FALSE(*outcome);
	EXPECT_FALSE(clock.is_loaded());
	EXPECT_FALSE(pending.poll()); // The outcome is only reported once
}

TEST(Clock, DecodesWav)
{
	auto now = 0ns;
	auto clock = Clock{globals::logger->create_category("ClockDecode", Logger::Level::Warning), SamplingRate, [&] { return now; }};
	auto const wav = make_wav(WavFrames);

	auto const result = clock.load(span<byte const>{wav.data(), wav.size()});
	ASSERT_TRUE(result);
	EXPECT_EQ(*result, 100ms);
	EXPECT_TRUE(clock.is_loaded());
	EXPECT_EQ(clock.get_duration(), 100ms);

	clock.play();
	clock.begin_buffer();
	auto const sample = clock.next_sample();
	EXPECT_FLOAT_EQ(sample.left, 0.5f);
	EXPECT_FLOAT_EQ(sample.right, -0.5f);

	now = 100ms;
	EXPECT_TRUE(clock.has_ended());
}

TEST(Clock, BackgroundDecodeAppliesTrack)
{
	auto clock = Clock{globals::logger->create_category("ClockAsync", Logger::Level::Warning), SamplingRate, [] { return 0ns; }};
	auto pending = clock.load_async(make_wav(WavFrames));
	EXPECT_FALSE(pending.is_abandoned());

	auto const outcome = wait_for_outcome(pending);
	ASSERT_TRUE(outcome);
	ASSERT_TRUE(*outcome);
	EXPECT_EQ(**outcome, 100ms);
	EXPECT_TRUE(clock.is_loaded());
	EXPECT_EQ(clock.get_duration(), 100ms);
	EXPECT_FALSE(pending.is_ready());
	EXPECT_FALSE(pending.poll());
}

TEST(Clock, AbandonedDecodeIsDiscarded)
{
	auto clock = Clock{globals::logger->create_category("ClockAsync", Logger::Level::Warning), SamplingRate, [] { return 0ns; }};
	auto pending = clock.load_async(make_wav(WavFrames));
	pending.abandon();
	EXPECT_TRUE(pending.is_abandoned());

	for (auto attempts = 0; !pending.is_ready() && attempts < 5000; attempts += 1)
		sleep_for(1ms);
	ASSERT_TRUE(pending.is_ready());
	EXPECT_FALSE(pending.poll());
	EXPECT_FALSE(clock.is_loaded());
	EXPECT_EQ(clock.get_duration(), 0ns);
}

}
