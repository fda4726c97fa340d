#include <wrapbin/repr/array.hpp>

#include <vector>

#include <wrapbin/log/log.hpp>

#include "detail.hpp"

namespace wrapbin::repr {

std::string array_representation( const binary& value, const array_options& options )
{
  const auto comma = detail::paint_part( ",", component::separator, options.colored ) + ( options.compact ? "" : " " );

  std::string repr = detail::paint_part( prefix( options.base ), component::prefix, options.colored );
  repr += detail::paint_part( "[", component::delimiter, options.colored );

  bool first = true;
  for( auto b: value )
  {
    if( !first )
      repr += comma;

    repr  += detail::paint_value( b, options.base, options.compact, options.colored );
    first  = false;
  }

  repr += detail::paint_part( "]", component::delimiter, options.colored );
  return repr;
}

result< binary > parse_array_representation( std::string_view s )
{
  auto enclosed = detail::split_enclosed( s, '[', ']', repr_errc::invalid_array_brackets );
  if( !enclosed )
  {
    LOG_DEBUG( log::instance(), "Rejected array representation: {}", enclosed.error().message() );
    return std::unexpected( enclosed.error() );
  }

  std::vector< std::byte > bytes;
  if( detail::trim( enclosed->body ).empty() )
    return binary( std::move( bytes ) );

  auto body = enclosed->body;
  while( true )
  {
    auto comma = body.find( ',' );
    auto b     = parse_byte( detail::trim( body.substr( 0, comma ) ), enclosed->base );
    if( !b )
    {
      LOG_DEBUG( log::instance(), "Rejected array representation value: {}", b.error().message() );
      return std::unexpected( b.error() );
    }

    bytes.push_back( *b );

    if( comma == std::string_view::npos )
      break;

    body.remove_prefix( comma + 1 );
  }

  return binary( std::move( bytes ) );
}

} // namespace wrapbin::repr
