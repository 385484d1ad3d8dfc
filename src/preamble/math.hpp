/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include <type_traits>
#include <algorithm>
#include <cmath>

namespace stepline {

using std::min;
using std::max;
using std::abs;

// A built-in type with defined arithmetic operations (+, -, *, /)
template<typename T>
concept arithmetic = std::is_arithmetic_v<T>;

// GLSL-style scalar clamp
template<arithmetic T>
[[nodiscard]] constexpr auto clamp(T val, T vmin, T vmax) -> T
{
	return max(vmin, min(val, vmax));
}

}
