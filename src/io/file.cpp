/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "io/file.hpp"

#include <fstream>
#include <ios>
#include "preamble.hpp"

namespace stepline::io {

auto read_file(fs::path const& path) -> MappedFile
{
	auto const status = fs::status(path);
	if (!fs::exists(status)) throw runtime_error_fmt("{} does not exist", path);
	if (!fs::is_regular_file(status)) throw runtime_error_fmt("{} is not a regular file", path);

	auto file = MappedFile{
		.path = path,
		.mapping = lib::mio::ReadMapping{path.c_str()},
		.contents = {},
	};
	file.contents = span{file.mapping.data(), file.mapping.size()};
	return file;
}

auto read_file_bytes(fs::path const& path) -> vector<byte>
{
	auto const file = read_file(path);
	return vector<byte>(file.contents.begin(), file.contents.end());
}

void write_file(fs::path const& path, span<byte const> contents)
{
	auto out = std::ofstream{};
	out.exceptions(std::ios::failbit | std::ios::badbit);
	out.open(path, std::ios::binary | std::ios::trunc);
	out.write(reinterpret_cast<char const*>(contents.data()), static_cast<std::streamsize>(contents.size()));
}

auto has_extension(fs::path const& path, span<string_view const> extensions) -> bool
{
	auto const extension = path.extension().string();
	return any_of(extensions, [&](string_view candidate) { return iequals(candidate, extension); });
}

}
