/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"
#include "utils/assert.hpp"
#include "utils/logger.hpp"
#include "lib/audio_common.hpp"
#include "lib/pipewire.hpp"

namespace stepline::dev {

// A single audio sample.
using Sample = lib::Sample;

using lib::ChannelCount;

// The system audio output. Only one can exist at a time.
class Audio {
public:
	// Initialize the audio device. The provided function is called repeatedly on the audio thread
	// to fill in the sample buffer.
	Audio(Logger::Category, function<void(span<Sample>)> processor);
	~Audio() noexcept;

	// Return the sampling rate negotiated with the device.
	[[nodiscard]] auto get_sampling_rate() const -> int { return ASSERT_VAL(context->properties.sampling_rate); }

	// Return current latency of the audio device.
	[[nodiscard]] auto get_latency() const -> nanoseconds { return lib::audio_latency(context->properties); }

	Audio(Audio const&) = delete;
	auto operator=(Audio const&) -> Audio& = delete;
	Audio(Audio&&) = delete;
	auto operator=(Audio&&) -> Audio& = delete;

private:
	InstanceLimit<Audio, 1> instance_limit;
	Logger::Category cat;
	function<void(span<Sample>)> processor;
	lib::pw::Context context;
};

}
