/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "lib/pipewire.hpp"

#include <spa/param/audio/format-utils.h>
#include <spa/param/audio/raw-utils.h>
#include <spa/param/audio/format.h>
#include <spa/param/format-utils.h>
#include <spa/param/param.h>
#include <spa/pod/builder.h>
#include <pipewire/thread-loop.h>
#include <pipewire/properties.h>
#include <pipewire/pipewire.h>
#include <pipewire/stream.h>
#include <pipewire/keys.h>
#include "preamble.hpp"
#include "lib/audio_common.hpp"

namespace stepline::lib::pw {

// Helper functions for error handling

template<typename T>
static auto ptr_check(T* ptr, string_view message = "libpipewire error") -> T*
{
	if (!ptr) throw system_error_fmt("{}", message);
	return ptr;
}

static void ret_check(int ret, string_view message = "libpipewire error")
{
	if (ret < 0) throw system_error_fmt("{}", message);
}

static void on_process(void* data)
{
	auto& context = *static_cast<Context_t*>(data);

	auto* buffer_outer = pw_stream_dequeue_buffer(context.stream);
	if (!buffer_outer) return;
	auto& buffer = *buffer_outer->buffer;
	auto* output = buffer.datas[0].data;
	if (!output) return;

	constexpr auto Stride = sizeof(float) * ChannelCount;
	auto const max_frames = buffer.datas[0].maxsize / Stride;
	auto const frames = buffer_outer->requested? min<usize>(max_frames, buffer_outer->requested) : max_frames;

	buffer.datas[0].chunk->offset = 0;
	buffer.datas[0].chunk->stride = Stride;
	buffer.datas[0].chunk->size = frames * Stride;
	auto samples = span{static_cast<Sample*>(output), frames};
	fill(samples, Sample{});

	context.processor(samples);

	pw_stream_queue_buffer(context.stream, buffer_outer);
}

static void on_param_changed(void* data, uint32_t id, spa_pod const* param)
{
	if (!param || id != SPA_PARAM_Format) return;
	auto audio_info = spa_audio_info{};
	if (spa_format_parse(param, &audio_info.media_type, &audio_info.media_subtype) < 0) return;
	if (audio_info.media_type != SPA_MEDIA_TYPE_audio || audio_info.media_subtype != SPA_MEDIA_SUBTYPE_raw) return;
	spa_format_audio_raw_parse(param, &audio_info.info.raw);
	auto& context = *static_cast<Context_t*>(data);
	context.properties.sampling_rate = static_cast<int>(audio_info.info.raw.rate);
	context.format_known.store(true);
}

static constexpr auto StreamEvents = pw_stream_events{
	.version = PW_VERSION_STREAM_EVENTS,
	.param_changed = on_param_changed,
	.process = on_process,
};

auto init(string_view stream_name, int buffer_size, function<void(span<Sample>)>&& processor) -> Context
{
	auto context = make_unique<Context_t>();
	context->properties = AudioProperties{
		.sampling_rate = 0, // Unknown until the format is negotiated
		.buffer_size = buffer_size,
	};
	context->processor = move(processor);
	context->format_known.store(false);

	pw_init(nullptr, nullptr);
	context->loop = ptr_check(pw_thread_loop_new("stepline-audio", nullptr), "Failed to create PipeWire loop");
	context->stream = ptr_check(pw_stream_new_simple(
		pw_thread_loop_get_loop(context->loop), string{stream_name}.c_str(),
		pw_properties_new(
			PW_KEY_MEDIA_TYPE, "Audio",
			PW_KEY_MEDIA_CATEGORY, "Playback",
			PW_KEY_MEDIA_ROLE, "Game",
			PW_KEY_NODE_FORCE_QUANTUM, format("{}", buffer_size).c_str(),
		nullptr),
		&StreamEvents, context.get()), "Failed to create PipeWire stream");

	auto params = array<spa_pod const*, 1>{};
	auto pod_buffer = array<uint8_t, 1024>{};
	auto builder = SPA_POD_BUILDER_INIT(pod_buffer.data(), pod_buffer.size());
	auto audio_info = spa_audio_info_raw{
		.format = SPA_AUDIO_FORMAT_F32,
		.channels = static_cast<uint32_t>(ChannelCount),
	};
	params[0] = spa_format_audio_raw_build(&builder, SPA_PARAM_EnumFormat, &audio_info);
	ret_check(pw_stream_connect(context->stream, PW_DIRECTION_OUTPUT, PW_ID_ANY,
		static_cast<pw_stream_flags>(PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS),
		params.data(), params.size()), "Failed to connect PipeWire stream");

	ret_check(pw_thread_loop_start(context->loop), "Failed to start PipeWire loop");
	while (!context->format_known.load()) yield();
	return context;
}

void cleanup(Context&& context) noexcept
{
	if (!context) return;
	pw_thread_loop_lock(context->loop);
	pw_stream_destroy(context->stream);
	pw_thread_loop_unlock(context->loop);
	pw_thread_loop_stop(context->loop);
	pw_thread_loop_destroy(context->loop);
	context.reset();
	pw_deinit();
}

}
