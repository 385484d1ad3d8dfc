/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"
#include "lib/audio_common.hpp"

namespace stepline::audio {

// A fully decoded piece of audio, ready for playback.
struct Track {
	vector<lib::Sample> samples;
	int sampling_rate;

	[[nodiscard]] auto duration() const -> nanoseconds
	{ return lib::samples_to_ns(static_cast<isize>(samples.size()), sampling_rate); }
};

}
