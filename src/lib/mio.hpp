/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "mio/mmap.hpp"
#include "preamble.hpp"

namespace stepline::lib::mio {

// Read-only memory mapping of a file, viewed as bytes.
using ReadMapping = ::mio::basic_mmap_source<byte>;

}
