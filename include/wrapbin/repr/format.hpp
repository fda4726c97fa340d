#pragma once

#include <ostream>
#include <string>
#include <variant>

#include <wrapbin/binary/binary.hpp>
#include <wrapbin/repr/array.hpp>
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

namespace wrapbin::repr {

/// Base specifier for the default array rendering of a binary.
struct format_spec
{
  radix base   = radix::decimal;
  bool compact = false;
  bool colored = false;
};

std::string to_string( const binary& value, const format_spec& spec = {} );

/// One alternative per representation style available in this build.
using format_options = std::variant< array_options
#ifdef WRAPBIN_REPR_BASE64
                                     ,
                                     base64_options
#endif
#ifdef WRAPBIN_REPR_DUMP
                                     ,
                                     dump_options
#endif
#ifdef WRAPBIN_REPR_STRING
                                     ,
                                     string_options
#endif
                                     >;

std::string format( const binary& value, const format_options& options );

} // namespace wrapbin::repr

namespace wrapbin {

/// Writes the padded decimal array representation.
std::ostream& operator<<( std::ostream& os, const binary& value );

} // namespace wrapbin
