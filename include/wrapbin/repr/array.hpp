#pragma once

#include <string>
#include <string_view>

#include <wrapbin/binary/binary.hpp>
#include <wrapbin/repr/error.hpp>
#include <wrapbin/repr/radix.hpp>

namespace wrapbin::repr {

/*
 * Array representation: comma separated byte values enclosed in brackets behind a radix
 * prefix, e.g. 0x[01, 0e, b2, 8c]. The compact form drops the space after each comma
 * and the zero padding of each value, e.g. 0x[1,e,b2,8c].
 */
struct array_options
{
  radix base   = radix::upper_hex;
  bool compact = false;
  bool colored = false;
};

std::string array_representation( const binary& value, const array_options& options = {} );

/// Parses padded or compact array representations, whitespace around values is ignored.
result< binary > parse_array_representation( std::string_view s );

} // namespace wrapbin::repr
