/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "audio/clock.hpp"

#include "preamble.hpp"
#include "utils/task_pool.hpp"
#include "utils/assert.hpp"
#include "lib/ffmpeg.hpp"

namespace stepline::audio {

auto decode_track(span<byte const> file_contents, int sampling_rate) -> expected<Track, DecodeError>
try {
	return Track{
		.samples = lib::ffmpeg::decode_and_resample_file_buffer(file_contents, sampling_rate),
		.sampling_rate = sampling_rate,
	};
}
catch (runtime_error const& e) {
	return unexpected{DecodeError{e.what()}};
}

auto Clock::Claim::operator=(Claim&& other) noexcept -> Claim&
{
	if (this == &other) return *this;
	release();
	clock = exchange(other.clock, nullptr);
	generation = other.generation;
	return *this;
}

auto Clock::Claim::is_current() const -> bool
{
	if (!clock) return false;
	auto lock = lock_guard{clock->state_lock};
	return clock->claim_generation == generation;
}

void Clock::Claim::release() noexcept
{
	if (!clock) return;
	auto* const owner = exchange(clock, nullptr);
	auto lock = lock_guard{owner->state_lock};
	if (owner->claim_generation != generation) return;
	owner->stop_locked();
	TRACE_AS(owner->cat, "Clock claim released");
}

auto Clock::PendingLoad::poll() -> optional<expected<nanoseconds, DecodeError>>
{
	if (abandoned || !is_ready()) return nullopt;
	auto decoded = result.get();
	if (!decoded) {
		ERROR_AS(clock->cat, "Failed to decode audio: {}", decoded.error().message);
		return unexpected{move(decoded.error())};
	}
	return clock->load(move(*decoded));
}

auto Clock::PendingLoad::is_ready() const -> bool
{
	return result.valid() && result.wait_for(0s) == future_status::ready;
}

Clock::Clock(Logger::Category cat, int sampling_rate, TimeSource time_source):
	cat{cat},
	sampling_rate{sampling_rate},
	time_source{move(time_source)}
{
	ASSERT(sampling_rate > 0);
	ASSERT(this->time_source);
}

auto Clock::load(span<byte const> file_contents) -> expected<nanoseconds, DecodeError>
{
	lib::ffmpeg::set_thread_log_category(cat);
	auto decoded = decode_track(file_contents, sampling_rate);
	if (!decoded) {
		ERROR_AS(cat, "Failed to decode audio: {}", decoded.error().message);
		return unexpected{move(decoded.error())};
	}
	return load(move(*decoded));
}

auto Clock::load(Track&& new_track) -> nanoseconds
{
	ASSERT(new_track.sampling_rate == sampling_rate);
	auto const duration = new_track.duration();
	auto lock = lock_guard{state_lock};
	stop_locked();
	track = make_shared<Track const>(move(new_track));
	state.duration = duration;
	INFO_AS(cat, "Loaded track: {} samples, {:.3f}s", track->samples.size(), ratio(duration, 1s));
	return duration;
}

auto Clock::load_async(vector<byte> file_contents) -> PendingLoad
{
	auto result = pollable_bg([](vector<byte> contents, int rate, Logger::Category cat) -> task<expected<Track, DecodeError>> {
		lib::ffmpeg::set_thread_log_category(cat);
		co_return decode_track(span<byte const>{contents.data(), contents.size()}, rate);
	}(move(file_contents), sampling_rate, cat));
	DEBUG_AS(cat, "Started background audio decode");
	return PendingLoad{*this, move(result)};
}

void Clock::unload()
{
	auto lock = lock_guard{state_lock};
	stop_locked();
	track.reset();
	state.duration = 0ns;
	DEBUG_AS(cat, "Track unloaded");
}

void Clock::play(PlayOptions opts)
{
	auto lock = lock_guard{state_lock};
	if (!track) {
		WARN_AS(cat, "Ignoring play(): no track loaded");
		return;
	}
	play_locked(opts);
}

void Clock::pause()
{
	auto lock = lock_guard{state_lock};
	if (!state.is_playing) return;
	state.pause_offset = position_at(state, time_source());
	state.is_playing = false;
	segment += 1;
}

void Clock::resume()
{
	auto lock = lock_guard{state_lock};
	if (!track) {
		WARN_AS(cat, "Ignoring resume(): no track loaded");
		return;
	}
	if (state.is_playing) return;
	auto const now = time_source();
	if (state.loop) {
		// Keep wrapping within the original segment
		state.start_reference = now - (state.pause_offset - state.start_offset);
	} else {
		auto const segment_end = state.start_offset + state.play_duration;
		state.start_offset = state.pause_offset;
		state.play_duration = max(segment_end - state.pause_offset, 0ns);
		state.start_reference = now;
	}
	state.is_playing = true;
	segment += 1;
}

void Clock::stop()
{
	auto lock = lock_guard{state_lock};
	stop_locked();
}

auto Clock::get_current_time() const -> nanoseconds
{
	auto lock = lock_guard{state_lock};
	return position_at(state, time_source());
}

auto Clock::has_ended() const -> bool
{
	auto lock = lock_guard{state_lock};
	return ended_at(state, time_source());
}

auto Clock::is_playing() const -> bool
{
	auto lock = lock_guard{state_lock};
	return state.is_playing && !ended_at(state, time_source());
}

auto Clock::is_loaded() const -> bool
{
	auto lock = lock_guard{state_lock};
	return track != nullptr;
}

auto Clock::get_duration() const -> nanoseconds
{
	auto lock = lock_guard{state_lock};
	return state.duration;
}

auto Clock::get_state() const -> State
{
	auto lock = lock_guard{state_lock};
	return state;
}

void Clock::set_volume(float new_volume)
{
	auto lock = lock_guard{state_lock};
	volume = clamp(new_volume, 0.0f, 1.0f);
}

auto Clock::acquire() -> Claim
{
	auto lock = lock_guard{state_lock};
	claim_generation += 1;
	stop_locked();
	TRACE_AS(cat, "Clock claim #{} acquired", claim_generation);
	return Claim{*this, claim_generation};
}

void Clock::begin_buffer()
{
	auto lock = lock_guard{state_lock};
	buffer.track = track;
	buffer.playing = state.is_playing && track;
	buffer.loop = state.loop;
	buffer.gain = volume;
	if (!buffer.playing) return;

	auto const cursor = lib::ns_to_samples(position_at(state, time_source()), sampling_rate);
	if (buffer.segment == segment) {
		auto const drift = cursor - buffer.cursor;
		if (abs(drift) > lib::ns_to_samples(5ms, sampling_rate))
			DEBUG_AS(cat, "Audio playback drifted by {}ms, resyncing",
				duration_cast<milliseconds>(lib::samples_to_ns(drift, sampling_rate)).count());
	}
	buffer.cursor = cursor;
	buffer.segment = segment;
	buffer.loop_start = lib::ns_to_samples(state.start_offset, sampling_rate);
	buffer.end = min(lib::ns_to_samples(state.start_offset + state.play_duration, sampling_rate),
		static_cast<isize>(track->samples.size()));
}

auto Clock::next_sample() -> dev::Sample
{
	if (!buffer.playing) return {};
	if (buffer.loop && buffer.cursor >= buffer.end && buffer.end > buffer.loop_start)
		buffer.cursor = buffer.loop_start;
	auto const pos = buffer.cursor;
	buffer.cursor += 1;
	if (pos < 0 || pos >= buffer.end) return {};
	auto const& sample = buffer.track->samples[pos];
	return {sample.left * buffer.gain, sample.right * buffer.gain};
}

auto Clock::position_at(State const& state, nanoseconds now) -> nanoseconds
{
	if (!state.is_playing) return state.pause_offset;
	auto const position = state.start_offset + (now - state.start_reference);
	if (state.loop && state.play_duration > 0ns)
		return state.start_offset + (position - state.start_offset) % state.play_duration;
	return position;
}

auto Clock::ended_at(State const& state, nanoseconds now) -> bool
{
	if (!state.is_playing || state.loop) return false;
	return position_at(state, now) >= state.start_offset + state.play_duration;
}

void Clock::play_locked(PlayOptions const& opts)
{
	auto const requested = opts.offset < 0ns? state.pause_offset : opts.offset;
	auto const start = min(max(requested, 0ns), state.duration);
	state.start_offset = start;
	state.play_duration = min(max(opts.duration.value_or(state.duration - start), 0ns), state.duration - start);
	state.loop = opts.loop;
	state.start_reference = time_source();
	state.is_playing = true;
	volume = clamp(opts.volume, 0.0f, 1.0f);
	segment += 1;
	DEBUG_AS(cat, "Playing from {:.3f}s for {:.3f}s{}", ratio(start, 1s), ratio(state.play_duration, 1s),
		state.loop? ", looping" : "");
}

void Clock::stop_locked()
{
	state.is_playing = false;
	state.start_offset = 0ns;
	state.pause_offset = 0ns;
	state.play_duration = 0ns;
	state.loop = false;
	segment += 1;
}

}
