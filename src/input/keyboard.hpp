/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"
#include "dev/window.hpp"
#include "game/lane.hpp"

namespace stepline::input {

// Parse the name of a key, as used in the controls config.
// Throws runtime_error if there is no such key.
[[nodiscard]] auto parse_key(string_view name) -> dev::Window::KeyCode;

// Keyboard as a lane input source. Each lane has a primary and an alternate key.
class Keyboard {
public:
	struct Bindings {
		game::PerLane<dev::Window::KeyCode> primary;
		game::PerLane<dev::Window::KeyCode> alternate;
	};

	// Read the key bindings from the "controls" section of the global config.
	static auto bindings_from_config() -> Bindings;

	Keyboard(dev::Window&, Bindings);

	// Lanes currently held on the keyboard.
	[[nodiscard]] auto get_state() const -> game::PerLane<bool>;

private:
	dev::Window& window;
	Bindings bindings;
};

}
