#include <wrapbin/repr/base64.hpp>

#include <algorithm>
#include <string_view>
#include <vector>

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>

#include <wrapbin/log/log.hpp>

namespace wrapbin::repr {

namespace {

using namespace boost::archive::iterators;

using base64_encoder = base64_from_binary< transform_width< const char*, 6, 8 > >;
using base64_decoder = transform_width< binary_from_base64< const char* >, 8, 6 >;

constexpr std::size_t group_size = 4;

bool is_alphabet( char c ) noexcept
{
  return ( c >= 'A' && c <= 'Z' ) || ( c >= 'a' && c <= 'z' ) || ( c >= '0' && c <= '9' ) || c == '+' || c == '/';
}

unsigned int sextet( char c ) noexcept
{
  if( c >= 'A' && c <= 'Z' )
    return c - 'A';
  if( c >= 'a' && c <= 'z' )
    return c - 'a' + 26;
  if( c >= '0' && c <= '9' )
    return c - '0' + 52;
  return c == '+' ? 62 : 63;
}

// A partial final group carries 12 or 18 bits, the bits past the last whole byte must be zero.
bool has_trailing_bits( std::string_view payload ) noexcept
{
  switch( payload.size() % group_size )
  {
    case 2:
      return ( sextet( payload.back() ) & 0x0f ) != 0;
    case 3:
      return ( sextet( payload.back() ) & 0x03 ) != 0;
    default:
      return false;
  }
}

} // namespace

std::string base64_representation( const binary& value, const base64_options& options )
{
  auto text = value.as_string_view();

  std::string repr( base64_encoder( text.data() ), base64_encoder( text.data() + text.size() ) );
  if( !options.compact )
    repr.append( ( group_size - repr.size() % group_size ) % group_size, '=' );

  return repr;
}

result< binary > parse_base64_representation( std::string_view s )
{
  auto payload = s.substr( 0, s.find_last_not_of( '=' ) + 1 );
  auto padding = s.size() - payload.size();

  if( !std::ranges::all_of( payload, is_alphabet ) || padding > 2 || payload.size() % group_size == 1
      || ( padding && s.size() % group_size != 0 ) || has_trailing_bits( payload ) )
  {
    LOG_DEBUG( log::instance(), "Rejected base64 representation of {} characters", s.size() );
    return std::unexpected( repr_errc::invalid_base64 );
  }

  // The decoder only consumes whole groups, pad with zero bits and drop the surplus bytes.
  std::string groups( payload );
  auto missing = ( group_size - groups.size() % group_size ) % group_size;
  groups.append( missing, 'A' );

  std::string decoded( base64_decoder( groups.data() ), base64_decoder( groups.data() + groups.size() ) );
  decoded.resize( decoded.size() - missing );

  return binary( std::move( decoded ) );
}

} // namespace wrapbin::repr
