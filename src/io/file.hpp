/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"
#include "lib/mio.hpp"

namespace stepline::io {

// Extensions of the audio formats a song is expected to come in.
inline constexpr auto AudioExtensions = to_array({
	".wav"sv, ".mp3"sv, ".ogg"sv, ".flac"sv, ".m4a"sv, ".opus"sv, ".aac"sv, ".aiff"sv
});

// A file mapped into memory. contents stays valid for as long as the mapping is alive.
struct MappedFile {
	fs::path path;
	lib::mio::ReadMapping mapping;
	span<byte const> contents;
};

// Map a whole file for reading.
// Throws runtime_error if the path is not an existing regular file, or system_error if
// the mapping fails.
auto read_file(fs::path const&) -> MappedFile;

// Copy a whole file into memory. Throws like read_file().
auto read_file_bytes(fs::path const&) -> vector<byte>;

// Replace the contents of a file, creating it if needed.
void write_file(fs::path const&, span<byte const> contents);

// true if the path's extension is one of the provided ones, ignoring case.
[[nodiscard]] auto has_extension(fs::path const&, span<string_view const> extensions) -> bool;

}
