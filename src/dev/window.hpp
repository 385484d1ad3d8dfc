/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"
#include "utils/service.hpp"
#include "utils/logger.hpp"
#include "lib/glfw.hpp"

namespace stepline::dev {

// Owner of the GLFW library state. Also the source of timestamps for the whole application.
class GLFW {
public:
	GLFW();
	~GLFW() noexcept;

	// Monotonic time elapsed since GLFW was initialized.
	[[nodiscard]] auto get_time() const -> nanoseconds { return lib::glfw::time_since_init(); }

	// Process pending window and input events, running their callbacks.
	void poll() { lib::glfw::process_events(); }

	GLFW(GLFW const&) = delete;
	auto operator=(GLFW const&) -> GLFW& = delete;
	GLFW(GLFW&&) = delete;
	auto operator=(GLFW&&) -> GLFW& = delete;

private:
	InstanceLimit<GLFW, 1> instance_limit;
};

// The game window. Receives keyboard focus and defines the size of the playfield viewport.
class Window {
public:
	using KeyCode = lib::glfw::KeyCode;
	using KeyAction = lib::glfw::KeyAction;

	Window(string_view title, int width, int height);

	// true once the user asked to close the window, or request_close() was called.
	[[nodiscard]] auto is_closing() const -> bool { return lib::glfw::get_window_closing_flag(window_handle.get()); }
	void request_close() { lib::glfw::set_window_closing_flag(window_handle.get(), true); }

	// Framebuffer size in pixels, as width and height.
	[[nodiscard]] auto size() const -> pair<int, int> { return lib::glfw::get_window_framebuffer_size(window_handle.get()); }

	[[nodiscard]] auto is_key_pressed(KeyCode key) const -> bool { return lib::glfw::is_key_pressed(window_handle.get(), key); }

	// Called with the key and true on press, false on release. Key repeats are not reported.
	void register_key_callback(function<void(KeyCode, bool)> func) { listeners.key.emplace_back(move(func)); }

	// Called with the new framebuffer width and height.
	void register_resize_callback(function<void(int, int)> func) { listeners.resize.emplace_back(move(func)); }

	auto handle() -> lib::glfw::Window { return window_handle.get(); }

	Window(Window const&) = delete;
	auto operator=(Window const&) -> Window& = delete;
	Window(Window&&) = delete;
	auto operator=(Window&&) -> Window& = delete;

private:
	using WindowHandle = unique_resource<lib::glfw::Window, decltype([](auto* w) noexcept {
		lib::glfw::destroy_window(w);
		DEBUG("Window destroyed");
	})>;

	struct Listeners {
		small_vector<function<void(KeyCode, bool)>, 2> key;
		small_vector<function<void(int, int)>, 2> resize;
	};

	WindowHandle window_handle{};
	Listeners listeners;
};

}

namespace stepline::globals {
inline auto glfw = Service<dev::GLFW>{};
}
