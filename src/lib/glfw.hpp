/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"

// Forward declaration
struct GLFWwindow;

namespace stepline::lib::glfw {

// Opaque handle to a window.
using Window = GLFWwindow*;

namespace detail {

void set_window_user_pointer_raw(Window window, void* ptr);
[[nodiscard]] auto get_window_user_pointer_raw(Window window) -> void*;
void set_window_key_handler_raw(Window window, void (*func)(Window, int, int, int, int));
void set_window_framebuffer_size_handler_raw(Window window, void (*func)(Window, int, int));
void set_joystick_handler_raw(void (*func)(int, int));

}

// Make GLFW throw on any error. Can be called anytime.
void register_error_handler();

// Initialize GLFW.
// Throws runtime_error on failure.
void init();

// Clean up GLFW.
// Errors are ignored.
void cleanup() noexcept;

// Return the time passed since the call to init(). If GLFW is not initialized, returns 0.
[[nodiscard]] auto time_since_init() -> nanoseconds;

// Check for all open windows' events, and dispatch registered callbacks.
// Throws runtime_error on failure, or if a callback throws.
void process_events();

// Return the current value of the window's "closing" flag. This flag is set automatically
// if the user presses the "X" in the corner, or programmatically via set_window_closing_flag.
[[nodiscard]] auto get_window_closing_flag(Window window) -> bool;

// Set the current value of the window's "closing" flag.
void set_window_closing_flag(Window window, bool flag_value);

// Set window creation hints to the expected values. No client API context is created,
// the playfield is presented by an external renderer.
void set_window_creation_hints();

// Open a new window and return the handle. Close it once done.
// Throws runtime_error on failure.
auto create_window(int width, int height, string_view title) -> Window;

// Destroy a previously opened window.
// Errors are ignored.
void destroy_window(Window window) noexcept;

// Set the custom pointer value that gets passed to event handlers.
template<typename T>
void set_window_user_pointer(Window window, T* ptr) {
	detail::set_window_user_pointer_raw(window, ptr);
}

// Retrieve the previously set custom pointer.
template<typename T>
[[nodiscard]] auto get_window_user_pointer(Window window) -> T*
{
	return static_cast<T*>(detail::get_window_user_pointer_raw(window));
}

// Values match GLFW_KEY_*.
enum class KeyCode: int {
	Space = 32,
	Minus = 45,
	Zero = 48, One, Two, Three, Four, Five, Six, Seven, Eight, Nine,
	Equal = 61,
	A = 65, B, C, D, E, F, G, H, I, J, K, L, M, N, O, P, Q, R, S, T, U, V, W, X, Y, Z,
	Escape = 256,
	Enter = 257,
	Tab = 258,
	Backspace = 259,
	Right = 262,
	Left = 263,
	Down = 264,
	Up = 265,
	F1 = 290, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
	KP0 = 320, KP1, KP2, KP3, KP4, KP5, KP6, KP7, KP8, KP9,
	LeftShift = 340,
	LeftControl = 341,
	LeftAlt = 342,
	RightShift = 344,
	RightControl = 345,
	RightAlt = 346,
};

enum class KeyAction: int {
	Release = 0, // GLFW_RELEASE
	Press = 1, // GLFW_PRESS
	Repeat = 2, // GLFW_REPEAT
};

// Set the handler for keyboard inputs.
// Param 2 is KeyCode, param 4 is KeyAction
template<callable<void(Window, int, int, int, int)> Func>
void set_window_key_handler(Window window, Func&& func)
{
	detail::set_window_key_handler_raw(window, func);
}

// Set the handler for framebuffer resizes.
// Params 2 and 3 are the new width and height in pixels
template<callable<void(Window, int, int)> Func>
void set_window_framebuffer_size_handler(Window window, Func&& func)
{
	detail::set_window_framebuffer_size_handler_raw(window, func);
}

// Return true if the key is currently held down in the window.
[[nodiscard]] auto is_key_pressed(Window window, KeyCode key) -> bool;

// Return the size of the window's framebuffer in pixels.
// Throws runtime_error on failure.
[[nodiscard]] auto get_window_framebuffer_size(Window window) -> pair<int, int>;

// Joystick IDs range from 0 to JoystickCount - 1.
inline constexpr auto JoystickCount = 16;

enum class JoystickEvent: int {
	Connected = 0x00040001, // GLFW_CONNECTED
	Disconnected = 0x00040002, // GLFW_DISCONNECTED
};

// Values match GLFW_GAMEPAD_BUTTON_*, using the Xbox layout names.
enum class GamepadButton: int {
	A, B, X, Y,
	LeftBumper, RightBumper,
	Back, Start, Guide,
	LeftThumb, RightThumb,
	DpadUp, DpadRight, DpadDown, DpadLeft,
};

// Values match GLFW_GAMEPAD_AXIS_*.
enum class GamepadAxis: int {
	LeftX, LeftY,
	RightX, RightY,
	LeftTrigger, RightTrigger,
};

// Snapshot of a joystick with a standard gamepad mapping. Axis values are in the -1.0 to 1.0
// range, with positive Y pointing down.
struct GamepadState {
	array<bool, 15> buttons;
	array<float, 6> axes;

	[[nodiscard]] auto button(GamepadButton b) const -> bool { return buttons[+b]; }
	[[nodiscard]] auto axis(GamepadAxis a) const -> float { return axes[+a]; }
};

// Set the handler for joystick connections and disconnections.
// Param 1 is the joystick ID, param 2 is JoystickEvent
template<callable<void(int, int)> Func>
void set_joystick_handler(Func&& func)
{
	detail::set_joystick_handler_raw(func);
}

// Return true if a joystick is connected at the ID and has a gamepad mapping.
[[nodiscard]] auto is_gamepad(int jid) -> bool;

// Return the human-readable name of the connected joystick, or an empty string if none.
[[nodiscard]] auto get_joystick_name(int jid) -> string_view;

// Retrieve the current state of a gamepad, if one is connected at the ID.
[[nodiscard]] auto get_gamepad_state(int jid) -> optional<GamepadState>;

}

// KeyCodes extend past the default reflection range
template<>
struct magic_enum::customize::enum_range<stepline::lib::glfw::KeyCode> {
	static constexpr int min = 0;
	static constexpr int max = 350;
};
