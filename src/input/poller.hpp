/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"
#include "utils/logger.hpp"
#include "game/lane.hpp"

namespace stepline::input {

// A lane changing between held and released.
struct LaneEdge {
	game::Lane lane;
	bool pressed; // true = pressed, false = released
	nanoseconds timestamp;
};

// Reads the held state of every lane from a set of input devices, and reports presses and releases.
// A lane is held if it's held on any source.
class Poller {
public:
	using Source = function<game::PerLane<bool>()>;

	explicit Poller(Logger::Category cat): cat{cat} {}

	// Add a device to read lane state from.
	void add_source(Source source) { sources.emplace_back(move(source)); }

	// Read all sources, and return every lane whose state changed since the previous poll.
	auto poll(nanoseconds timestamp) -> static_vector<LaneEdge, game::LaneCount>;

	// Lanes held as of the latest poll.
	[[nodiscard]] auto get_held() const -> game::PerLane<bool> const& { return held; }

	// Forget the held state, as if every lane was released. Does not generate any edges.
	void reset() { held = {}; }

private:
	Logger::Category cat;
	vector<Source> sources;
	game::PerLane<bool> held{};
};

}
