/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include <type_traits>
#include <concepts>
#include "preamble/utility.hpp"

namespace stepline {

using std::same_as;

template<class T, class Variant>
inline constexpr auto is_variant_alternative_v = false;

template<class T, class... Ts>
inline constexpr auto is_variant_alternative_v<T, variant<Ts...>> =
	(... || std::is_same_v<T, Ts>);

// Constrain type T to one of a std::variant's available alternatives
template<class T, class Variant>
concept variant_alternative = is_variant_alternative_v<T, Variant>;

// Analogous to std::invocable, but with the whole function signature checked
template<class F, typename Sig>
struct is_callable: std::false_type {};

template<class F, typename R, typename... Args>
struct is_callable<F, R(Args...)>: std::bool_constant<std::is_invocable_r_v<R, F, Args...>> {};

template<class F, typename Sig>
concept callable = is_callable<F, Sig>::value;

}
