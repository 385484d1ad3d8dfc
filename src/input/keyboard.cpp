/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "input/keyboard.hpp"

#include "preamble.hpp"
#include "utils/config.hpp"

namespace stepline::input {

using game::Lane;

auto parse_key(string_view name) -> dev::Window::KeyCode
{
	return *enum_cast<dev::Window::KeyCode>(name).or_else([&] -> optional<dev::Window::KeyCode> {
		throw runtime_error_fmt("Unknown keycode: {}", name);
	});
}

auto Keyboard::bindings_from_config() -> Bindings
{
	auto get_key = [](string_view conf) {
		return parse_key(globals::config->get_entry<string>("controls", conf));
	};

	auto bindings = Bindings{};
	bindings.primary[+Lane::Left] = get_key("kb_left");
	bindings.primary[+Lane::Down] = get_key("kb_down");
	bindings.primary[+Lane::Up] = get_key("kb_up");
	bindings.primary[+Lane::Right] = get_key("kb_right");
	bindings.alternate[+Lane::Left] = get_key("kb_left_alt");
	bindings.alternate[+Lane::Down] = get_key("kb_down_alt");
	bindings.alternate[+Lane::Up] = get_key("kb_up_alt");
	bindings.alternate[+Lane::Right] = get_key("kb_right_alt");
	return bindings;
}

Keyboard::Keyboard(dev::Window& window, Bindings bindings):
	window{window},
	bindings{bindings}
{}

auto Keyboard::get_state() const -> game::PerLane<bool>
{
	auto lanes = game::PerLane<bool>{};
	for (auto [held, primary, alternate]: views::zip(lanes, bindings.primary, bindings.alternate))
		held = window.is_key_pressed(primary) || window.is_key_pressed(alternate);
	return lanes;
}

}
