// Copyright (c) 2023-2026 Logan McDougall
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

// When EVL_STANDALONE_COMPILATION is defined, the user must #define EVL_IMPL
// and #include the necessary headers (easiest to #include
// "evl/all_headers.hpp") in exactly one translation unit. This provides
// definitions for non-template functions in that translation unit. The CMake
// target `evl` does this in src/evl.cpp.

// When EVL_WINDOWS_DLL is defined, this also implies
// EVL_STANDALONE_COMPILATION. The user must provide the impl translation unit,
// which also dllexports the necessary symbols. Other DLLs / files which do not
// define EVL_IMPL will dllimport those symbols.

// When neither are defined, the library is header-only, and all symbols are
// declared "inline".

#ifdef EVL_WINDOWS_DLL
#ifndef EVL_STANDALONE_COMPILATION
#define EVL_STANDALONE_COMPILATION
#endif
#endif

#ifdef EVL_STANDALONE_COMPILATION
#ifdef EVL_WINDOWS_DLL
#ifdef EVL_IMPL
#define EVL_DECL __declspec(dllexport)
#else // !EVL_IMPL
#define EVL_DECL __declspec(dllimport)
#endif
#else // !EVL_WINDOWS_DLL
#define EVL_DECL
#endif
#else // !EVL_STANDALONE_COMPILATION
#define EVL_DECL inline
#endif
