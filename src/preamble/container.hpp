/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include <array>
#include <span>
#include <boost/container/static_vector.hpp>
#include <boost/container/small_vector.hpp>
#include <boost/container/vector.hpp>
#include "readerwriterqueue.h"
#include "preamble/types.hpp"

namespace stepline {

using boost::container::vector;
using boost::container::static_vector;
using boost::container::small_vector;
using std::array;
using std::to_array;
using std::span;

// Lock-free queue for a single producer and a single consumer
template<typename T>
using spsc_queue = moodycamel::ReaderWriterQueue<T>;

}
