/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "lib/ffmpeg.hpp"

extern "C" {
#include <libswresample/swresample.h>
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/opt.h>
}
#include <cstdarg>
#include <cstdio>
#include "preamble.hpp"
#include "utils/assert.hpp"
#include "utils/logger.hpp"
#include "lib/audio_common.hpp"

namespace stepline::lib::ffmpeg {

// av_err2str relies on C compound literals
static auto error_string(int errnum) -> string
{
	auto str = array<char, AV_ERROR_MAX_STRING_SIZE>{};
	av_make_error_string(str.data(), str.size(), errnum);
	return string{str.data()};
}

static auto ret_check(int ret) -> int
{
	if (ret < 0) throw runtime_error_fmt("ffmpeg error: {}", error_string(ret));
	return ret;
}

template<typename T>
static auto ptr_check(T* ptr, string_view what) -> T*
{
	if (!ptr) throw runtime_error_fmt("ffmpeg error: {} failed", what);
	return ptr;
}

// Logger override support

thread_local Logger::Category cat = nullptr;
static atomic<bool> log_callback_set = false;

static void log_callback(void*, int level, char const* fmt, va_list va_og)
{
	if (level > AV_LOG_WARNING) return;
	if (!globals::logger) return;

	va_list va;
	va_copy(va, va_og);
	auto const msg_size = std::vsnprintf(nullptr, 0, fmt, va);
	va_end(va);
	if (msg_size <= 0) return;
	auto msg = string(msg_size, '\0');
	std::vsnprintf(msg.data(), msg_size + 1, fmt, va_og);
	if (msg.back() == '\n') msg.pop_back();

	auto log_cat = cat? cat : globals::logger->global;
	     if (level <= AV_LOG_FATAL) CRIT_AS(log_cat, "ffmpeg: {}", msg);
	else if (level <= AV_LOG_ERROR) ERROR_AS(log_cat, "ffmpeg: {}", msg);
	else                            WARN_AS(log_cat, "ffmpeg: {}", msg);
}

static void set_log_callback()
{
	if (log_callback_set.exchange(true)) return;
	av_log_set_callback(log_callback);
}

// RAII wrappers for ffmpeg objects

static constexpr auto PageSize = 4096zu;
using AVBuffer = unique_resource<void*, decltype([](auto* buf) { av_free(buf); })>;
using AVIO = unique_resource<AVIOContext*, decltype([](auto* ctx) {
	av_free(ctx->buffer);
	avio_context_free(&ctx);
})>;
using AVFormat = unique_resource<AVFormatContext*, decltype([](auto* ctx) {
	avformat_close_input(&ctx);
})>;
using AVCodec = unique_resource<AVCodecContext*, decltype([](auto* ctx) {
	avcodec_free_context(&ctx);
})>;
using AVPacket = unique_resource<::AVPacket*, decltype([](auto* p) {
	av_packet_free(&p);
})>;
using AVFrame = unique_resource<::AVFrame*, decltype([](auto* f) {
	av_frame_free(&f);
})>;
using SwrContext = unique_resource<::SwrContext*, decltype([](auto* s) {
	swr_free(&s);
})>;

// Data buffer wrapper with a cursor for seeking support.
struct SeekBuffer {
	span<byte const> buffer;
	usize cursor;
};

// Memory buffer IO callbacks

static auto av_io_read(void* opaque, uint8_t* buf, int buf_size) -> int
{
	auto& source = *static_cast<SeekBuffer*>(opaque);
	auto const bytes_available = source.buffer.size() - source.cursor;
	if (!bytes_available) return AVERROR_EOF;
	auto const bytes_to_read = min<usize>(buf_size, bytes_available);
	copy(source.buffer.subspan(source.cursor, bytes_to_read), reinterpret_cast<byte*>(buf));
	source.cursor += bytes_to_read;
	return static_cast<int>(bytes_to_read);
}

static auto av_io_seek(void* opaque, int64_t offset, int whence) -> int64_t
{
	auto& source = *static_cast<SeekBuffer*>(opaque);
	auto const size = static_cast<int64_t>(source.buffer.size());
	auto new_cursor = int64_t{0};
	switch (whence & ~AVSEEK_FORCE) {
	case SEEK_SET: new_cursor = offset; break;
	case SEEK_CUR: new_cursor = static_cast<int64_t>(source.cursor) + offset; break;
	case SEEK_END: new_cursor = size + offset; break;
	case AVSEEK_SIZE: return size;
	default: return -1;
	}

	if (new_cursor < 0 || new_cursor > size) return -1;
	source.cursor = static_cast<usize>(new_cursor);
	return new_cursor;
}

// Feed every decoded frame of the file's first audio stream into the resampler, appending
// the converted samples to output.
static void decode_into(AVFormatContext* format, AVCodecContext* codec_ctx, int stream_id,
	::SwrContext* swr, vector<Sample>& output)
{
	auto packet = AVPacket{ptr_check(av_packet_alloc(), "av_packet_alloc")};
	auto frame = AVFrame{ptr_check(av_frame_alloc(), "av_frame_alloc")};

	auto const convert = [&](::AVFrame const* in) {
		auto const in_samples = in? in->nb_samples : 0;
		auto const max_out = ret_check(swr_get_out_samples(swr, in_samples));
		if (max_out == 0) return;
		auto const prev_size = output.size();
		output.resize(prev_size + max_out);
		auto* out_ptr = reinterpret_cast<uint8_t*>(output.data() + prev_size);
		auto const converted = ret_check(swr_convert(swr, &out_ptr, max_out,
			in? const_cast<uint8_t const**>(in->extended_data) : nullptr, in_samples));
		output.resize(prev_size + converted);
	};

	auto const drain_frames = [&] {
		while (true) {
			auto const ret = avcodec_receive_frame(codec_ctx, frame.get());
			if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return;
			ret_check(ret);
			convert(frame.get());
			av_frame_unref(frame.get());
		}
	};

	while (true) {
		auto const ret = av_read_frame(format, packet.get());
		if (ret == AVERROR_EOF) break;
		ret_check(ret);
		if (packet->stream_index == stream_id)
			ret_check(avcodec_send_packet(codec_ctx, packet.get()));
		av_packet_unref(packet.get());
		drain_frames();
	}
	ret_check(avcodec_send_packet(codec_ctx, nullptr));
	drain_frames();
	convert(nullptr); // Flush samples buffered inside the resampler
}

void set_thread_log_category(Logger::Category new_cat)
{
	cat = new_cat;
}

auto decode_and_resample_file_buffer(span<byte const> file_contents, int sampling_rate) -> vector<Sample>
{
	ASSERT(sampling_rate > 0);
	set_log_callback();
	if (file_contents.empty()) throw runtime_error{"Audio buffer is empty"};

	auto source = SeekBuffer{ .buffer = file_contents, .cursor = 0 };
	auto io_buffer = AVBuffer{ptr_check(av_malloc(PageSize), "av_malloc")};
	auto io = AVIO{ptr_check(avio_alloc_context(static_cast<unsigned char*>(io_buffer.get()), PageSize, 0,
		&source, &av_io_read, nullptr, &av_io_seek), "avio_alloc_context")};
	io_buffer.release(); // AVIOContext takes control over the buffer from now on

	auto* format_rw = ptr_check(avformat_alloc_context(), "avformat_alloc_context");
	format_rw->pb = io.get();
	ret_check(avformat_open_input(&format_rw, "", nullptr, nullptr)); // Frees the context on failure
	auto format = AVFormat{format_rw};
	ret_check(avformat_find_stream_info(format.get(), nullptr));

	auto const stream_id = av_find_best_stream(format.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
	if (stream_id < 0) throw runtime_error{"No audio stream found"};
	auto* stream = format->streams[stream_id];

	auto const* codec = ptr_check(avcodec_find_decoder(stream->codecpar->codec_id), "avcodec_find_decoder");
	auto codec_ctx = AVCodec{ptr_check(avcodec_alloc_context3(codec), "avcodec_alloc_context3")};
	ret_check(avcodec_parameters_to_context(codec_ctx.get(), stream->codecpar));
	codec_ctx->pkt_timebase = stream->time_base;
	ret_check(avcodec_open2(codec_ctx.get(), codec, nullptr));

	auto* swr_rw = static_cast<::SwrContext*>(nullptr);
	auto const out_layout = AVChannelLayout AV_CHANNEL_LAYOUT_STEREO;
	ret_check(swr_alloc_set_opts2(&swr_rw,
		&out_layout, AV_SAMPLE_FMT_FLT, sampling_rate,
		&codec_ctx->ch_layout, codec_ctx->sample_fmt, codec_ctx->sample_rate, 0, nullptr));
	auto swr = SwrContext{swr_rw};
	ret_check(av_opt_set_int(swr.get(), "resampler", SWR_ENGINE_SOXR, 0));
	ret_check(swr_init(swr.get()));

	auto output = vector<Sample>{};
	if (stream->duration > 0)
		output.reserve(av_rescale_q(stream->duration, stream->time_base, AVRational{1, sampling_rate}) + PageSize);
	decode_into(format.get(), codec_ctx.get(), stream_id, swr.get(), output);
	if (output.empty()) throw runtime_error{"Audio stream contains no samples"};
	return output;
}

}
