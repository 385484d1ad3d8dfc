/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "dev/audio.hpp"

#include "preamble.hpp"
#include "utils/config.hpp"

namespace stepline::dev {

Audio::Audio(Logger::Category cat, function<void(span<Sample>)> processor):
	cat{cat},
	processor{move(processor)}
{
	auto const buffer_size = globals::config->get_entry<int>("pipewire", "buffer_size");
	if (buffer_size <= 0) throw runtime_error_fmt("Invalid PipeWire buffer size: {}", buffer_size);
	context = lib::pw::init(AppTitle, buffer_size, [this](span<Sample> buffer) { this->processor(buffer); });
	INFO_AS(cat, "PipeWire audio initialized");
	INFO_AS(cat, "Audio device properties: sample rate: {}Hz, latency: {}ms",
		context->properties.sampling_rate,
		duration_cast<milliseconds>(get_latency()).count());
}

Audio::~Audio() noexcept
{
	lib::pw::cleanup(move(context));
	INFO_AS(cat, "PipeWire audio cleaned up");
}

}
