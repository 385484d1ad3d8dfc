/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble/algorithm.hpp" // IWYU pragma: export
#include "preamble/container.hpp" // IWYU pragma: export
#include "preamble/concepts.hpp" // IWYU pragma: export
#include "preamble/utility.hpp" // IWYU pragma: export
#include "preamble/string.hpp" // IWYU pragma: export
#include "preamble/except.hpp" // IWYU pragma: export
#include "preamble/types.hpp" // IWYU pragma: export
#include "preamble/coro.hpp" // IWYU pragma: export
#include "preamble/math.hpp" // IWYU pragma: export
#include "preamble/time.hpp" // IWYU pragma: export
#include "preamble/os.hpp" // IWYU pragma: export
