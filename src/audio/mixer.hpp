/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"
#include "utils/service.hpp"
#include "utils/logger.hpp"
#include "dev/audio.hpp"

namespace stepline::audio {

// A source of audio. begin_buffer() is called once before each buffer is filled, then
// next_sample() once per sample of that buffer. Both are called from the audio thread.
template<typename T>
concept generator = requires(T& gen) {
	gen.begin_buffer();
	{ gen.next_sample() } -> same_as<dev::Sample>;
};

// Sums every registered generator into the output of the audio device.
class Mixer {
public:
	// Open the audio device. Master volume is read from the config.
	explicit Mixer(Logger::Category);

	// Start mixing in a generator. It must be removed before it's destroyed.
	template<generator T>
	void add_generator(T&);

	// Stop mixing in a generator. Does nothing if it was never added.
	template<generator T>
	void remove_generator(T&);

	[[nodiscard]] auto get_audio() -> dev::Audio& { return audio; }
	[[nodiscard]] auto get_latency() const -> nanoseconds { return audio.get_latency(); }

	// Gain applied to the sum of all generators, clamped to 0.0 - 1.0.
	void set_master_volume(float volume);
	[[nodiscard]] auto get_master_volume() const -> float { return master_volume.load(); }

private:
	struct Channel {
		void const* owner;
		function<void()> begin_buffer;
		function<dev::Sample()> next_sample;
	};

	Logger::Category cat;
	atomic<float> master_volume;
	small_vector<Channel, 4> channels;
	mutex channel_lock;

	dev::Audio audio; // Last, so that mix() can't run before the other members exist

	void mix(span<dev::Sample>);
};

template<generator T>
void Mixer::add_generator(T& gen)
{
	auto lock = lock_guard{channel_lock};
	channels.emplace_back(Channel{
		.owner = &gen,
		.begin_buffer = [&gen] { gen.begin_buffer(); },
		.next_sample = [&gen] { return gen.next_sample(); },
	});
	DEBUG_AS(cat, "Mixer channel added, {} total", channels.size());
}

template<generator T>
void Mixer::remove_generator(T& gen)
{
	auto lock = lock_guard{channel_lock};
	auto const removed = remove_if(channels, [&](auto const& channel) { return channel.owner == &gen; });
	if (removed.empty()) return;
	channels.erase(removed.begin(), removed.end());
	DEBUG_AS(cat, "Mixer channel removed, {} left", channels.size());
}

}

namespace stepline::globals {
inline auto mixer = Service<audio::Mixer>{};
}
