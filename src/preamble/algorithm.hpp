/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include <functional>
#include <algorithm>
#include <ranges>

namespace stepline {

namespace views {
	using std::ranges::views::iota;
	using std::ranges::views::zip;
	using std::ranges::views::enumerate;
}
using std::ranges::all_of;
using std::ranges::any_of;
using std::ranges::contains;
using std::ranges::fill;
using std::ranges::copy;
using std::ranges::transform;
using std::ranges::find;
using std::ranges::find_if;
using std::ranges::remove_if;
using std::ranges::stable_sort;
using std::ranges::lower_bound;
using std::ranges::count_if;

using std::distance;
using std::function;

}
