/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "lib/debug.hpp"

#include <cstdio>
#include "libassert/assert.hpp"
#include "preamble.hpp"

namespace stepline::lib::dbg {

void set_assert_handler()
{
	libassert::set_failure_handler([](auto const& info) {
		throw runtime_error{info.to_string()};
	});
	libassert::set_color_scheme(libassert::color_scheme::blank);
}

void syserror(string_view message) noexcept
{
	std::fprintf(stderr, "%.*s\n", static_cast<int>(message.size()), message.data());
}

}
