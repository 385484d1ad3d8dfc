/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"
#include "utils/logger.hpp"
#include "dev/audio.hpp"
#include "audio/track.hpp"

namespace stepline::audio {

// Reason an audio payload could not be loaded.
struct DecodeError {
	string message;
};

// Playback of a single loaded track, doubling as the time reference for gameplay. The current
// time is derived from an external monotonic time source and the playback state, so that reads
// never drift and have no side effects. Register with the mixer to make it audible.
class Clock {
public:
	using TimeSource = function<nanoseconds()>;

	struct PlayOptions {
		nanoseconds offset = 0ns; // Negative means "resume from the last paused position"
		optional<nanoseconds> duration = nullopt; // Defaults to the rest of the track
		bool loop = false;
		float volume = 1.0f;
	};

	struct State {
		bool is_playing;
		nanoseconds start_reference; // Time source reading when playback (re)started
		nanoseconds start_offset; // Track position at start_reference
		nanoseconds pause_offset;
		bool loop;
		nanoseconds play_duration;
		nanoseconds duration; // Of the whole track, 0 if unloaded
	};

	// Exclusive right to drive the clock. Acquiring a new claim stops playback started under
	// the previous one; a claim that's still current stops playback when destroyed.
	class Claim {
	public:
		Claim(Claim&& other) noexcept: clock{exchange(other.clock, nullptr)}, generation{other.generation} {}
		auto operator=(Claim&& other) noexcept -> Claim&;
		~Claim() noexcept { release(); }

		// true if no other claim was acquired since this one.
		[[nodiscard]] auto is_current() const -> bool;

		// Give up the claim early, stopping playback if it's still current.
		void release() noexcept;

		Claim(Claim const&) = delete;
		auto operator=(Claim const&) -> Claim& = delete;

	private:
		friend class Clock;
		Clock* clock;
		uint64_t generation;

		Claim(Clock& clock, uint64_t generation): clock{&clock}, generation{generation} {}
	};

	// A decode running in the background. Poll it from the thread that owns the clock; the result
	// is applied to the clock at that point. Once abandoned, the result is discarded whenever
	// the decode finishes.
	class PendingLoad {
	public:
		// Returns the outcome once the decode is complete, and nullopt before that. After
		// the outcome was returned, or the load was abandoned, always returns nullopt.
		auto poll() -> optional<expected<nanoseconds, DecodeError>>;

		// true once the decode is complete, even if abandoned. false after poll() returned the outcome.
		[[nodiscard]] auto is_ready() const -> bool;

		void abandon() { abandoned = true; }
		[[nodiscard]] auto is_abandoned() const -> bool { return abandoned; }

		PendingLoad(PendingLoad&&) = default;
		auto operator=(PendingLoad&&) -> PendingLoad& = default;
		~PendingLoad() { abandon(); }

	private:
		friend class Clock;
		Clock* clock;
		future<expected<Track, DecodeError>> result;
		bool abandoned = false;

		PendingLoad(Clock& clock, future<expected<Track, DecodeError>>&& result):
			clock{&clock}, result{move(result)} {}
	};

	// Create an unloaded clock. Tracks will be resampled to the provided sampling rate.
	Clock(Logger::Category, int sampling_rate, TimeSource);

	// Decode an audio file in full and replace the current track with it. Playback is stopped.
	// On failure, the error is logged and the clock is left unloaded.
	auto load(span<byte const> file_contents) -> expected<nanoseconds, DecodeError>;

	// Replace the current track with already decoded audio. Playback is stopped.
	auto load(Track&&) -> nanoseconds;

	// Begin decoding an audio file on the background pool.
	[[nodiscard]] auto load_async(vector<byte> file_contents) -> PendingLoad;

	// Drop the current track, stopping playback.
	void unload();

	// Start playing a segment of the track, replacing any current playback.
	// Logs a warning and does nothing if no track is loaded.
	void play(PlayOptions = {});

	// Freeze playback at the current position. Does nothing if not playing.
	void pause();

	// Continue playback from the paused position. Does nothing if already playing or unloaded.
	void resume();

	// Halt playback and rewind to 0.
	void stop();

	// Position within the track right now.
	[[nodiscard]] auto get_current_time() const -> nanoseconds;

	// true once non-looping playback has reached the end of its segment.
	[[nodiscard]] auto has_ended() const -> bool;

	// true if playback is running and has not ended.
	[[nodiscard]] auto is_playing() const -> bool;

	[[nodiscard]] auto is_loaded() const -> bool;
	[[nodiscard]] auto get_duration() const -> nanoseconds;
	[[nodiscard]] auto get_state() const -> State;
	[[nodiscard]] auto get_sampling_rate() const -> int { return sampling_rate; }

	// Set the gain of the track, clamped to 0.0 - 1.0.
	void set_volume(float);

	// Take exclusive control of the clock.
	[[nodiscard]] auto acquire() -> Claim;

	// Mixer generator interface, called from the audio thread.
	void begin_buffer();
	auto next_sample() -> dev::Sample;

	Clock(Clock const&) = delete;
	auto operator=(Clock const&) -> Clock& = delete;
	Clock(Clock&&) = delete;
	auto operator=(Clock&&) -> Clock& = delete;

private:
	Logger::Category cat;
	int sampling_rate;
	TimeSource time_source;

	mutable mutex state_lock;
	State state{};
	shared_ptr<Track const> track;
	float volume = 1.0f;
	uint64_t segment = 0; // Incremented whenever the playback position jumps
	uint64_t claim_generation = 0;

	// Audio thread state, refreshed at the start of each buffer
	struct BufferState {
		shared_ptr<Track const> track;
		bool playing;
		bool loop;
		float gain;
		isize cursor;
		isize loop_start;
		isize end;
		uint64_t segment;
	};
	BufferState buffer{};

	[[nodiscard]] static auto position_at(State const&, nanoseconds now) -> nanoseconds;
	[[nodiscard]] static auto ended_at(State const&, nanoseconds now) -> bool;
	void play_locked(PlayOptions const&);
	void stop_locked();
};

// Decode an audio file into a track at the provided sampling rate.
auto decode_track(span<byte const> file_contents, int sampling_rate) -> expected<Track, DecodeError>;

}
