/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include <string_view> // IWYU pragma: export
#include <filesystem>
#include <string> // IWYU pragma: export
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include "quill/bundled/fmt/format.h"
#include "quill/DeferredFormatCodec.h"
#include "preamble/types.hpp"

namespace stepline {

using std::string;
using std::string_view;
using std::literals::operator""s;
using std::literals::operator""sv;
using fmtquill::format_string;
using fmtquill::format;
using boost::iequals;
using boost::lexical_cast;

}

template<>
struct fmtquill::formatter<std::filesystem::path>: formatter<std::string_view> {
	auto format(std::filesystem::path const& p, format_context& ctx) const -> format_context::iterator
	{
		return formatter<std::string_view>::format(p.string(), ctx);
	}
};
template<>
struct quill::Codec<std::filesystem::path>: DeferredFormatCodec<std::filesystem::path> {};
