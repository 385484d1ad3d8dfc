/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "audio/mixer.hpp"

#include "preamble.hpp"
#include "utils/config.hpp"

namespace stepline::audio {

Mixer::Mixer(Logger::Category cat):
	cat{cat},
	master_volume{clamp(static_cast<float>(globals::config->get_entry<double>("audio", "master_volume")), 0.0f, 1.0f)},
	audio{cat, [this](span<dev::Sample> buffer) { mix(buffer); }}
{
	INFO_AS(cat, "Mixer ready at {}Hz, master volume {}", audio.get_sampling_rate(), master_volume.load());
}

void Mixer::set_master_volume(float volume)
{
	master_volume.store(clamp(volume, 0.0f, 1.0f));
	DEBUG_AS(cat, "Master volume: {}", master_volume.load());
}

void Mixer::mix(span<dev::Sample> buffer)
{
	auto lock = lock_guard{channel_lock}; // Contended only while channels are added or removed
	if (channels.empty()) return;

	for (auto const& channel: channels)
		channel.begin_buffer();
	auto const gain = master_volume.load();
	for (auto& out: buffer) {
		auto sum = dev::Sample{};
		for (auto const& channel: channels) {
			auto const sample = channel.next_sample();
			sum.left += sample.left;
			sum.right += sample.right;
		}
		out.left = clamp(sum.left * gain, -1.0f, 1.0f);
		out.right = clamp(sum.right * gain, -1.0f, 1.0f);
	}
}

}
