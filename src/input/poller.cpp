/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "input/poller.hpp"

#include "preamble.hpp"

namespace stepline::input {

auto Poller::poll(nanoseconds timestamp) -> static_vector<LaneEdge, game::LaneCount>
{
	auto current = game::PerLane<bool>{};
	for (auto const& source: sources) {
		auto const state = source();
		for (auto [lane_held, source_held]: views::zip(current, state))
			lane_held = lane_held || source_held;
	}

	auto edges = static_vector<LaneEdge, game::LaneCount>{};
	for (auto lane: enum_values<game::Lane>()) {
		if (current[+lane] == held[+lane]) continue;
		edges.emplace_back(LaneEdge{
			.lane = lane,
			.pressed = current[+lane],
			.timestamp = timestamp,
		});
		TRACE_AS(cat, "Lane {} {} at {}ms", enum_name(lane), current[+lane]? "pressed" : "released",
			duration_cast<milliseconds>(timestamp).count());
	}
	held = current;
	return edges;
}

}
