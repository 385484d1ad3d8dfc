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
#include "lib/audio_common.hpp"

namespace stepline::lib::ffmpeg {

// Set the logger category for ffmpeg to use on the current thread. If not called, will log
// to the global category.
void set_thread_log_category(Logger::Category);

// Decode an entire audio file from a memory buffer, and resample it to stereo float samples
// at the requested sampling rate.
// Throws runtime_error if the buffer is not a decodable audio file, or if ffmpeg fails.
auto decode_and_resample_file_buffer(span<byte const> file_contents, int sampling_rate) -> vector<Sample>;

}
