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
#include "lib/glfw.hpp"
#include "game/lane.hpp"

namespace stepline::dev {

// Translate a gamepad snapshot into held lanes. D-pad directions map to their lanes, face buttons
// map by position (X left, A down, Y up, B right), and the left stick is read against
// the deadzone threshold.
[[nodiscard]] auto map_gamepad(lib::glfw::GamepadState const&, float axis_threshold) -> game::PerLane<bool>;

// Tracker of connected gamepads. Logs connections and disconnections, and reads the combined
// lane state of all connected gamepads.
class Gamepads {
public:
	// Only one can exist at a time, since joystick events are global.
	explicit Gamepads(Logger::Category);
	~Gamepads() noexcept;

	// Lanes held on any connected gamepad.
	[[nodiscard]] auto get_state(float axis_threshold) const -> game::PerLane<bool>;

	Gamepads(Gamepads const&) = delete;
	auto operator=(Gamepads const&) -> Gamepads& = delete;
	Gamepads(Gamepads&&) = delete;
	auto operator=(Gamepads&&) -> Gamepads& = delete;

private:
	InstanceLimit<Gamepads, 1> instance_limit;
	static inline Gamepads* instance;
	Logger::Category cat;
	array<string, lib::glfw::JoystickCount> names;

	static void joystick_event_callback(int jid, int event);
};

}
