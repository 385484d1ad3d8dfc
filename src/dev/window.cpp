/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "dev/window.hpp"

#include "preamble.hpp"
#include "utils/assert.hpp"

namespace stepline::dev {

GLFW::GLFW()
{
	lib::glfw::register_error_handler(); // GLFW errors throw from here on
	lib::glfw::init();
	lib::glfw::set_window_creation_hints();
	DEBUG("GLFW initialized");
}

GLFW::~GLFW() noexcept
{
	lib::glfw::cleanup();
	DEBUG("GLFW cleaned up");
}

Window::Window(string_view title, int width, int height)
{
	ASSERT(width > 0 && height > 0);
	window_handle = WindowHandle{lib::glfw::create_window(width, height, title)};
	lib::glfw::set_window_user_pointer(window_handle.get(), this);

	lib::glfw::set_window_key_handler(window_handle.get(), [](lib::glfw::Window handle, int key, int, int action, int) {
		if (action == +KeyAction::Repeat) return;
		auto const& self = *lib::glfw::get_window_user_pointer<Window>(handle);
		for (auto const& func: self.listeners.key)
			func(KeyCode{key}, action == +KeyAction::Press);
	});
	lib::glfw::set_window_framebuffer_size_handler(window_handle.get(), [](lib::glfw::Window handle, int w, int h) {
		auto const& self = *lib::glfw::get_window_user_pointer<Window>(handle);
		for (auto const& func: self.listeners.resize)
			func(w, h);
	});

	INFO("Opened window \"{}\" at {}x{}", title, width, height);
}

}
