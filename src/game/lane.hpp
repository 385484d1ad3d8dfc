/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"

namespace stepline::game {

// One of the four arrow columns of the playfield.
enum class Lane: isize {
	Left,
	Down,
	Up,
	Right,
};

inline constexpr auto LaneCount = enum_count<Lane>();

// A value stored for each lane, indexed by +Lane.
template<typename T>
using PerLane = array<T, LaneCount>;

}
