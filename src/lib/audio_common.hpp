/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"

namespace stepline::lib {

inline constexpr auto ChannelCount = 2zu;

// A single stereo audio sample (frame).
struct Sample {
	float left;
	float right;
};

struct AudioProperties {
	int sampling_rate;
	int buffer_size;
};

// Convert a count of samples to their exact duration.
constexpr auto samples_to_ns(isize samples, int sampling_rate) -> nanoseconds
{
	return nanoseconds{samples * 1'000'000'000 / sampling_rate};
}

// Convert a duration to the number of full samples that fit in it.
constexpr auto ns_to_samples(nanoseconds ns, int sampling_rate) -> isize
{
	return ns.count() * sampling_rate / 1'000'000'000;
}

inline auto audio_latency(AudioProperties const& props) -> nanoseconds
{
	return samples_to_ns(props.buffer_size, props.sampling_rate);
}

}
