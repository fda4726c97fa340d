#pragma once

#ifdef WRAPBIN_REPR_STRING

#include <string>
#include <string_view>

#include <wrapbin/binary/binary.hpp>
#include <wrapbin/repr/error.hpp>
#include <wrapbin/repr/radix.hpp>

namespace wrapbin::repr {

/*
 * String representation: underscore separated byte values enclosed in double quotes
 * behind a radix prefix, e.g. 0x"01_0e_b2_8c". The compact form drops the underscores,
 * every value keeps its full zero padded width so the bytes can be split again,
 * e.g. 0x"010eb28c".
 */
struct string_options
{
  radix base   = radix::upper_hex;
  bool compact = false;
  bool colored = false;
};

std::string string_representation( const binary& value, const string_options& options = {} );

/**
 * Parses string representations. With underscores present each value may have any width
 * up to the radix width, without them the body must be a sequence of full width values.
 */
result< binary > parse_string_representation( std::string_view s );

} // namespace wrapbin::repr

#endif
