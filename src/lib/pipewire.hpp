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

// Forward declarations

struct pw_thread_loop;
struct pw_stream;

namespace stepline::lib::pw {

// Context object for PipeWire internal state.
struct Context_t {
	AudioProperties properties;
	pw_thread_loop* loop;
	pw_stream* stream;
	function<void(span<Sample>)> processor;
	atomic<bool> format_known;
};
using Context = unique_ptr<Context_t>;

// Initialize PipeWire and open a stereo float playback stream. The processor function is called
// on the PipeWire thread with a zeroed buffer of samples to fill. The returned Context must be
// passed to cleanup().
// Throws system_error on failure.
auto init(string_view stream_name, int buffer_size, function<void(span<Sample>)>&& processor) -> Context;

// Stop the stream and clean up PipeWire objects.
void cleanup(Context&& context) noexcept;

}
