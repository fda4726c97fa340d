#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <wrapbin/repr/error.hpp>

namespace wrapbin::repr {

enum class radix : std::uint8_t
{
  binary,
  octal,
  decimal,
  lower_hex,
  upper_hex
};

/// Literal prefix identifying the radix, e.g. "0x".
std::string_view prefix( radix r ) noexcept;

unsigned int base( radix r ) noexcept;

/// Number of digits a byte occupies when zero padded.
std::size_t width( radix r ) noexcept;

result< radix > radix_from_specifier( char specifier ) noexcept;

/**
 * Renders a single byte. Padded output always has width( r ) digits, compact output
 * has no leading zeros but keeps at least one digit.
 */
std::string format_byte( std::byte b, radix r, bool compact );

std::string format_number( std::size_t value, radix r, std::size_t min_width );

result< std::byte > parse_byte( std::string_view digits, radix r ) noexcept;

} // namespace wrapbin::repr
