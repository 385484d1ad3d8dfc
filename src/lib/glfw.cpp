/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "lib/glfw.hpp"

#include "GLFW/glfw3.h"
#include "preamble.hpp"
#include "utils/assert.hpp"

namespace stepline::lib::glfw {

static_assert(+KeyCode::Escape == GLFW_KEY_ESCAPE);
static_assert(+KeyCode::Up == GLFW_KEY_UP);
static_assert(+KeyCode::Minus == GLFW_KEY_MINUS);
static_assert(+KeyCode::Equal == GLFW_KEY_EQUAL);
static_assert(JoystickCount == GLFW_JOYSTICK_LAST + 1);
static_assert(+GamepadButton::DpadLeft == GLFW_GAMEPAD_BUTTON_DPAD_LEFT);
static_assert(+GamepadAxis::RightTrigger == GLFW_GAMEPAD_AXIS_RIGHT_TRIGGER);

void detail::set_window_user_pointer_raw(Window window, void* ptr)
{
	ASSERT(window);
	glfwSetWindowUserPointer(window, ptr);
}

auto detail::get_window_user_pointer_raw(Window window) -> void*
{
	ASSERT(window);
	return glfwGetWindowUserPointer(window);
}

void detail::set_window_key_handler_raw(Window window, void (*func)(Window, int, int, int, int))
{
	ASSERT(window);
	glfwSetKeyCallback(window, func);
}

void detail::set_window_framebuffer_size_handler_raw(Window window, void (*func)(Window, int, int))
{
	ASSERT(window);
	glfwSetFramebufferSizeCallback(window, func);
}

void detail::set_joystick_handler_raw(void (*func)(int, int))
{
	glfwSetJoystickCallback(func);
}

void register_error_handler()
{
	glfwSetErrorCallback([](int code, char const* str) {
		throw runtime_error_fmt("[GLFW] Error #{}: {}", code, str);
	});
}

void init() { glfwInit(); }

void cleanup() noexcept try { glfwTerminate(); }
catch (runtime_error const&) {}

auto time_since_init() -> nanoseconds
try {
	return seconds_to_ns(glfwGetTime());
}
catch (runtime_error const&) {
	return nanoseconds{0};
}

void process_events() { glfwPollEvents(); }

auto get_window_closing_flag(Window window) -> bool
{
	ASSERT(window);
	auto const result = glfwWindowShouldClose(window);
	ASSUME(result == 0 || result == 1);
	return result;
}

void set_window_closing_flag(Window window, bool flag_value)
{
	ASSERT(window);
	glfwSetWindowShouldClose(window, flag_value);
}

void set_window_creation_hints()
{
	glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
	glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);
}

auto create_window(int width, int height, string_view title) -> Window
{
	return ASSUME_VAL(glfwCreateWindow(width, height, string{title}.c_str(), nullptr, nullptr));
}

void destroy_window(Window window) noexcept
try {
	if (!window) return;
	glfwDestroyWindow(window);
}
catch (runtime_error const&) {}

auto is_key_pressed(Window window, KeyCode key) -> bool
{
	ASSERT(window);
	return glfwGetKey(window, +key) == GLFW_PRESS;
}

auto get_window_framebuffer_size(Window window) -> pair<int, int>
{
	ASSERT(window);
	auto w = 0;
	auto h = 0;
	glfwGetFramebufferSize(window, &w, &h);
	return {w, h};
}

auto is_gamepad(int jid) -> bool
{
	ASSERT(jid >= 0 && jid < JoystickCount);
	return glfwJoystickIsGamepad(jid) == GLFW_TRUE;
}

auto get_joystick_name(int jid) -> string_view
{
	ASSERT(jid >= 0 && jid < JoystickCount);
	auto const* name = glfwGetJoystickName(jid);
	return name? string_view{name} : string_view{};
}

auto get_gamepad_state(int jid) -> optional<GamepadState>
{
	ASSERT(jid >= 0 && jid < JoystickCount);
	auto raw = GLFWgamepadstate{};
	if (!glfwGetGamepadState(jid, &raw)) return nullopt;
	auto state = GamepadState{};
	transform(raw.buttons, state.buttons.begin(), [](auto b) { return b == GLFW_PRESS; });
	copy(raw.axes, state.axes.begin());
	return state;
}

}
