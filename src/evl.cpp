// Copyright (c) 2023-2025 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

// Emits the non-template definitions for the `evl` library target.
#define EVL_IMPL

#include "evl/all_headers.hpp"
