#include <wrapbin/repr/radix.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <limits>
#include <utility>

namespace wrapbin::repr {

std::string_view prefix( radix r ) noexcept
{
  using namespace std::string_view_literals;
  switch( r )
  {
    case radix::binary:
      return "0b"sv;
    case radix::octal:
      return "0o"sv;
    case radix::decimal:
      return "0d"sv;
    case radix::lower_hex:
      return "0x"sv;
    case radix::upper_hex:
      return "0X"sv;
  }
  std::unreachable();
}

unsigned int base( radix r ) noexcept
{
  switch( r )
  {
    case radix::binary:
      return 2;
    case radix::octal:
      return 8;
    case radix::decimal:
      return 10;
    case radix::lower_hex:
    case radix::upper_hex:
      return 16;
  }
  std::unreachable();
}

std::size_t width( radix r ) noexcept
{
  switch( r )
  {
    case radix::binary:
      return 8;
    case radix::octal:
    case radix::decimal:
      return 3;
    case radix::lower_hex:
    case radix::upper_hex:
      return 2;
  }
  std::unreachable();
}

result< radix > radix_from_specifier( char specifier ) noexcept
{
  switch( specifier )
  {
    case 'b':
      return radix::binary;
    case 'o':
      return radix::octal;
    case 'd':
      return radix::decimal;
    case 'x':
      return radix::lower_hex;
    case 'X':
      return radix::upper_hex;
    default:
      return std::unexpected( repr_errc::invalid_radix_prefix );
  }
}

std::string format_number( std::size_t value, radix r, std::size_t min_width )
{
  std::array< char, std::numeric_limits< std::size_t >::digits > buffer{};
  auto [ ptr, ec ] = std::to_chars( buffer.data(), buffer.data() + buffer.size(), value, static_cast< int >( base( r ) ) );

  std::string digits( buffer.data(), ptr );
  if( r == radix::upper_hex )
    std::ranges::transform( digits,
                            digits.begin(),
                            []( char c )
                            {
                              return static_cast< char >( std::toupper( static_cast< unsigned char >( c ) ) );
                            } );

  if( digits.size() < min_width )
    digits.insert( 0, min_width - digits.size(), '0' );

  return digits;
}

std::string format_byte( std::byte b, radix r, bool compact )
{
  return format_number( std::to_integer< std::size_t >( b ), r, compact ? 1 : width( r ) );
}

result< std::byte > parse_byte( std::string_view digits, radix r ) noexcept
{
  if( digits.empty() )
    return std::unexpected( repr_errc::invalid_digit );

  unsigned int value = 0;
  auto [ ptr, ec ] =
    std::from_chars( digits.data(), digits.data() + digits.size(), value, static_cast< int >( base( r ) ) );

  if( ec == std::errc::result_out_of_range )
    return std::unexpected( repr_errc::byte_overflow );

  if( ec != std::errc() || ptr != digits.data() + digits.size() )
    return std::unexpected( repr_errc::invalid_digit );

  if( value > std::numeric_limits< std::uint8_t >::max() )
    return std::unexpected( repr_errc::byte_overflow );

  return static_cast< std::byte >( value );
}

} // namespace wrapbin::repr
