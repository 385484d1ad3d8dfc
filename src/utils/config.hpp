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

namespace stepline {
inline constexpr auto AppTitle = "Stepline";
inline constexpr auto AppVersion = to_array({0u, 1u, 0u});

#ifndef __linux__
#error Unsupported target platform
#endif

// Logfile location
#ifdef BUILD_DEBUG
inline constexpr auto LogfilePath = "stepline-debug.log"sv;
#else
inline constexpr auto LogfilePath = "stepline.log"sv;
#endif

// Config file location
inline constexpr auto ConfigPath = "config.toml"sv;

// Global runtime configuration. If created with a file path, it's kept in sync with that file.
class Config {
public:
	using Value = variant<int, double, bool, string>;
	struct Entry {
		string category;
		string name;
		Value value;
	};

	// Create an in-memory config object, with entries at their default values.
	Config() { create_defaults(); }

	// Create a config object bound to a file. Entries start at default values until
	// load_from_file() is called.
	explicit Config(fs::path file_path): path{move(file_path)} { create_defaults(); }

	// Overwrite the config file with current entries, if there is one.
	~Config() noexcept;

	// Update all entries with values from the config file. A missing file is not an error.
	// Throws runtime_error if the file exists but can't be parsed.
	void load_from_file();

	// Flush the config to file, overwriting it.
	void save_to_file() const;

	// Get the value of an entry.
	template<variant_alternative<Value> T>
	[[nodiscard]] auto get_entry(string_view category, string_view name) const -> T const&
	{ return get<T>(find_entry(category, name).value); }

	// Set an entry to a new value. The value must be of the same type as the default.
	void set_entry(Entry&&);

	Config(Config const&) = delete;
	auto operator=(Config const&) -> Config& = delete;
	Config(Config&&) = delete;
	auto operator=(Config&&) -> Config& = delete;

private:
	optional<fs::path> path;
	vector<Entry> entries;

	[[nodiscard]] auto find_entry(string_view category, string_view name) -> Entry&;
	[[nodiscard]] auto find_entry(string_view category, string_view name) const -> Entry const&;
	void create_defaults();
};

namespace globals {
inline auto config = Service<Config>{};
}

}
