#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <wrapbin/repr/color.hpp>
#include <wrapbin/repr/error.hpp>
#include <wrapbin/repr/radix.hpp>

namespace wrapbin::repr::detail {

inline std::string paint_value( std::byte b, radix r, bool compact, bool colored )
{
  return paint( format_byte( b, r, compact ), style( classify( b ), colored ) );
}

inline std::string paint_part( std::string_view text, component part, bool colored )
{
  return paint( text, style( part, colored ) );
}

struct enclosed
{
  radix base;
  std::string_view body;
};

/**
 * Splits "0<specifier><open><body><close>" into its radix and body.
 */
inline result< enclosed > split_enclosed( std::string_view s, char open, char close, repr_errc enclosing_error ) noexcept
{
  if( !s.starts_with( '0' ) )
    return std::unexpected( repr_errc::missing_radix_prefix );

  s.remove_prefix( 1 );
  if( s.empty() )
    return std::unexpected( repr_errc::invalid_radix_prefix );

  auto base = radix_from_specifier( s.front() );
  if( !base )
    return std::unexpected( base.error() );

  s.remove_prefix( 1 );
  if( s.size() < 2 || !s.starts_with( open ) || !s.ends_with( close ) )
    return std::unexpected( enclosing_error );

  return enclosed{ *base, s.substr( 1, s.size() - 2 ) };
}

inline std::string_view trim( std::string_view s ) noexcept
{
  constexpr std::string_view whitespace = " \t\r\n";

  auto first = s.find_first_not_of( whitespace );
  if( first == std::string_view::npos )
    return {};

  auto last = s.find_last_not_of( whitespace );
  return s.substr( first, last - first + 1 );
}

} // namespace wrapbin::repr::detail
