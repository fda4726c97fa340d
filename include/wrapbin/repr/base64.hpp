#pragma once

#ifdef WRAPBIN_REPR_BASE64

#include <string>
#include <string_view>

#include <wrapbin/binary/binary.hpp>
#include <wrapbin/repr/error.hpp>

namespace wrapbin::repr {

/// Standard alphabet base64 without line wrapping. Compact output omits the '=' padding.
struct base64_options
{
  bool compact = false;
};

std::string base64_representation( const binary& value, const base64_options& options = {} );

/// Accepts padded and unpadded input.
result< binary > parse_base64_representation( std::string_view s );

} // namespace wrapbin::repr

#endif
