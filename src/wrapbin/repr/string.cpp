#include <wrapbin/repr/string.hpp>

#include <vector>

#include <wrapbin/log/log.hpp>

#include "detail.hpp"

namespace wrapbin::repr {

std::string string_representation( const binary& value, const string_options& options )
{
  const auto quote      = detail::paint_part( "\"", component::delimiter, options.colored );
  const auto underscore = detail::paint_part( "_", component::separator, options.colored );

  std::string repr = detail::paint_part( prefix( options.base ), component::prefix, options.colored );
  repr += quote;

  bool first = true;
  for( auto b: value )
  {
    if( !first && !options.compact )
      repr += underscore;

    repr  += detail::paint_value( b, options.base, false, options.colored );
    first  = false;
  }

  repr += quote;
  return repr;
}

result< binary > parse_string_representation( std::string_view s )
{
  auto enclosed = detail::split_enclosed( s, '"', '"', repr_errc::invalid_string_quotes );
  if( !enclosed )
  {
    LOG_DEBUG( log::instance(), "Rejected string representation: {}", enclosed.error().message() );
    return std::unexpected( enclosed.error() );
  }

  auto body = enclosed->body;
  std::vector< std::byte > bytes;

  if( body.find( '_' ) != std::string_view::npos )
  {
    while( true )
    {
      auto underscore = body.find( '_' );
      auto b          = parse_byte( body.substr( 0, underscore ), enclosed->base );
      if( !b )
      {
        LOG_DEBUG( log::instance(), "Rejected string representation value: {}", b.error().message() );
        return std::unexpected( b.error() );
      }

      bytes.push_back( *b );

      if( underscore == std::string_view::npos )
        break;

      body.remove_prefix( underscore + 1 );
    }
  }
  else
  {
    const auto value_width = width( enclosed->base );
    while( !body.empty() )
    {
      if( body.size() < value_width )
      {
        LOG_DEBUG( log::instance(), "Rejected compact string representation with {} trailing digits", body.size() );
        return std::unexpected( repr_errc::invalid_representation );
      }

      auto b = parse_byte( body.substr( 0, value_width ), enclosed->base );
      if( !b )
      {
        LOG_DEBUG( log::instance(), "Rejected string representation value: {}", b.error().message() );
        return std::unexpected( b.error() );
      }

      bytes.push_back( *b );
      body.remove_prefix( value_width );
    }
  }

  return binary( std::move( bytes ) );
}

} // namespace wrapbin::repr
