/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"
#include "utils/assert.hpp"

namespace stepline {

// A global slot for an RAII-managed service. Provisioning returns a stub that owns the instance;
// once the stub is destroyed, whichever instance was provisioned before it becomes visible again.
template<typename T>
class Service {
	class Stub;
public:
	// Construct an instance of the service in place, and make it the current one.
	template<typename... Args>
	[[nodiscard]] auto provide(Args&&... args) -> Stub
	{
		return Stub(*this, forward<Args>(args)...);
	}

	// Access the currently provisioned instance.
	auto operator*() -> T& { return *ASSUME_VAL(handle); }
	auto operator->() -> T* { return ASSUME_VAL(handle); }

	// true if an instance is currently provisioned.
	explicit operator bool() const { return handle != nullptr; }

private:
	class Stub {
	public:
		template<typename... Args>
		explicit Stub(Service<T>& service, Args&&... args):
			service{service},
			instance(forward<Args>(args)...),
			prev_instance{service.handle}
		{
			service.handle = &instance;
		}

		~Stub() { service.handle = prev_instance; }

		Stub(Stub const&) = delete;
		auto operator=(Stub const&) -> Stub& = delete;
		Stub(Stub&&) = delete;
		auto operator=(Stub&&) -> Stub& = delete;

	private:
		Service<T>& service;
		T instance;
		T* prev_instance;
	};

	T* handle = nullptr;
};

}
