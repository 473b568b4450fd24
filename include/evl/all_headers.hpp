// Copyright (c) 2023-2025 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

// This header includes all of the EVL headers

#include "evl/event.hpp"        // IWYU pragma: export
#include "evl/ex_any.hpp"       // IWYU pragma: export
#include "evl/notification.hpp" // IWYU pragma: export
#include "evl/version.hpp"      // IWYU pragma: export
#include "evl/waker.hpp"        // IWYU pragma: export

#ifndef EVL_ASYNC_ONLY
#include "evl/parker.hpp" // IWYU pragma: export
#endif
