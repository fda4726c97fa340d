#pragma once

#include <wrapbin/repr/array.hpp>
#include <wrapbin/repr/color.hpp>
#include <wrapbin/repr/error.hpp>
#include <wrapbin/repr/format.hpp>
#include <wrapbin/repr/radix.hpp>

#ifdef WRAPBIN_REPR_BASE64
#include <wrapbin/repr/base64.hpp>
#endif

#ifdef WRAPBIN_REPR_DUMP
#include <wrapbin/repr/dump.hpp>
#endif

#ifdef WRAPBIN_REPR_STRING
#include <wrapbin/repr/string.hpp>
#endif
