/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "dev/gamepad.hpp"

#include "preamble.hpp"
#include "lib/glfw.hpp"

namespace stepline::dev {

using lib::glfw::GamepadButton;
using lib::glfw::GamepadAxis;
using game::Lane;

auto map_gamepad(lib::glfw::GamepadState const& state, float axis_threshold) -> game::PerLane<bool>
{
	auto lanes = game::PerLane<bool>{};
	auto const set = [&](Lane lane, bool held) { lanes[+lane] = lanes[+lane] || held; };

	set(Lane::Left, state.button(GamepadButton::DpadLeft));
	set(Lane::Down, state.button(GamepadButton::DpadDown));
	set(Lane::Up, state.button(GamepadButton::DpadUp));
	set(Lane::Right, state.button(GamepadButton::DpadRight));

	set(Lane::Left, state.button(GamepadButton::X));
	set(Lane::Down, state.button(GamepadButton::A));
	set(Lane::Up, state.button(GamepadButton::Y));
	set(Lane::Right, state.button(GamepadButton::B));

	auto const x = state.axis(GamepadAxis::LeftX);
	auto const y = state.axis(GamepadAxis::LeftY);
	set(Lane::Left, x < -axis_threshold);
	set(Lane::Right, x > axis_threshold);
	set(Lane::Up, y < -axis_threshold);
	set(Lane::Down, y > axis_threshold);
	return lanes;
}

Gamepads::Gamepads(Logger::Category cat):
	cat{cat}
{
	instance = this;
	for (auto jid: views::iota(0, lib::glfw::JoystickCount))
		if (lib::glfw::is_gamepad(jid)) joystick_event_callback(jid, +lib::glfw::JoystickEvent::Connected);
	lib::glfw::set_joystick_handler(joystick_event_callback);
}

Gamepads::~Gamepads() noexcept
{
	lib::glfw::set_joystick_handler([](int, int) {});
	instance = nullptr;
}

auto Gamepads::get_state(float axis_threshold) const -> game::PerLane<bool>
{
	auto lanes = game::PerLane<bool>{};
	for (auto jid: views::iota(0, lib::glfw::JoystickCount)) {
		auto const state = lib::glfw::get_gamepad_state(jid);
		if (!state) continue;
		auto const pad_lanes = map_gamepad(*state, axis_threshold);
		for (auto [held, pad_held]: views::zip(lanes, pad_lanes))
			held = held || pad_held;
	}
	return lanes;
}

void Gamepads::joystick_event_callback(int jid, int event)
{
	if (!instance) return;
	auto& self = *instance;
	auto& name = self.names[jid];
	if (event == +lib::glfw::JoystickEvent::Disconnected) {
		if (name.empty()) return;
		INFO_AS(self.cat, "Gamepad disconnected: \"{}\"", name);
		name.clear();
		return;
	}

	if (!lib::glfw::is_gamepad(jid)) {
		INFO_AS(self.cat, "Ignoring joystick without a gamepad mapping: \"{}\"", lib::glfw::get_joystick_name(jid));
		return;
	}
	name = lib::glfw::get_joystick_name(jid);
	INFO_AS(self.cat, "Gamepad connected: \"{}\"", name);
}

}
