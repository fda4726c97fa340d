// NOLINTBEGIN

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <unordered_set>
#include <vector>

#include <wrapbin/binary.hpp>

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace {

std::vector< std::byte > make_bytes( std::initializer_list< std::uint8_t > values )
{
  std::vector< std::byte > bytes;
  for( auto v: values )
    bytes.push_back( std::byte{ v } );
  return bytes;
}

} // namespace

TEST( binary, borrowed_sources )
{
  constexpr auto text = "Hello, World!"sv;

  wrapbin::binary from_view( text );
  EXPECT_TRUE( from_view.is_borrowed() );
  EXPECT_EQ( from_view.size(), 13 );
  EXPECT_EQ( from_view.data(), reinterpret_cast< const std::byte* >( text.data() ) );

  wrapbin::binary from_literal( "Hello, World!" );
  EXPECT_TRUE( from_literal.is_borrowed() );
  EXPECT_EQ( from_literal.size(), 13 );

  std::string str( text );
  wrapbin::binary from_string( str );
  EXPECT_TRUE( from_string.is_borrowed() );
  EXPECT_EQ( from_string.data(), reinterpret_cast< const std::byte* >( str.data() ) );

  auto bytes = make_bytes( { 1, 2, 3 } );
  wrapbin::binary from_vector( bytes );
  EXPECT_TRUE( from_vector.is_borrowed() );
  EXPECT_EQ( from_vector.data(), bytes.data() );

  std::array< std::byte, 4 > array{ std::byte{ 0xde }, std::byte{ 0xad }, std::byte{ 0xbe }, std::byte{ 0xef } };
  wrapbin::binary from_array( array );
  EXPECT_TRUE( from_array.is_borrowed() );
  EXPECT_EQ( from_array.size(), 4 );

  std::array< std::uint8_t, 2 > octets{ 0x0a, 0x0b };
  wrapbin::binary from_octets( octets );
  EXPECT_TRUE( from_octets.is_borrowed() );
  EXPECT_EQ( from_octets.kind(), wrapbin::storage_kind::borrowed );

  const std::byte c_array[ 3 ]{ std::byte{ 1 }, std::byte{ 2 }, std::byte{ 3 } };
  wrapbin::binary from_c_array( c_array );
  EXPECT_TRUE( from_c_array.is_borrowed() );
  EXPECT_EQ( from_c_array.data(), &c_array[ 0 ] );
  EXPECT_EQ( from_c_array.size(), 3 );

  wrapbin::binary from_span( std::span< const std::byte >( bytes ).subspan( 1 ) );
  EXPECT_TRUE( from_span.is_borrowed() );
  EXPECT_EQ( from_span.size(), 2 );
}

TEST( binary, owned_sources_are_moved )
{
  std::string str      = "a string long enough to avoid the small string optimisation";
  const auto* str_data = str.data();
  wrapbin::binary from_string( std::move( str ) );
  EXPECT_TRUE( from_string.is_owned() );
  EXPECT_EQ( from_string.data(), reinterpret_cast< const std::byte* >( str_data ) );

  auto bytes            = make_bytes( { 1, 2, 3, 4 } );
  const auto* byte_data = bytes.data();
  wrapbin::binary from_vector( std::move( bytes ) );
  EXPECT_TRUE( from_vector.is_owned() );
  EXPECT_EQ( from_vector.kind(), wrapbin::storage_kind::owned );
  EXPECT_EQ( from_vector.data(), byte_data );

  std::vector< std::uint8_t > octets{ 9, 8, 7 };
  const auto* octet_data = octets.data();
  wrapbin::binary from_octets( std::move( octets ) );
  EXPECT_TRUE( from_octets.is_owned() );
  EXPECT_EQ( from_octets.data(), reinterpret_cast< const std::byte* >( octet_data ) );

  std::vector< std::uint8_t > source{ 1, 2, 3 };
  wrapbin::binary from_iterators( source.begin(), source.end() );
  EXPECT_TRUE( from_iterators.is_owned() );
  EXPECT_EQ( from_iterators, wrapbin::binary( source ) );
}

TEST( binary, round_trip )
{
  auto bytes = make_bytes( { 0x00, 0x7f, 0x80, 0xff, 0x21 } );

  EXPECT_EQ( wrapbin::binary( bytes ).to_vector(), bytes );
  EXPECT_EQ( wrapbin::binary( std::vector< std::byte >( bytes ) ).to_vector(), bytes );
  EXPECT_EQ( wrapbin::binary( std::vector< std::byte >( bytes ) ).into_vector(), bytes );
  EXPECT_EQ( wrapbin::binary( bytes ).into_vector(), bytes );

  auto owned       = make_bytes( { 5, 6, 7 } );
  const auto* data = owned.data();
  auto moved_out   = wrapbin::binary( std::move( owned ) ).into_vector();
  EXPECT_EQ( moved_out.data(), data );

  EXPECT_EQ( wrapbin::binary( "Hi"s ).into_vector(), make_bytes( { 0x48, 0x69 } ) );
  EXPECT_EQ( wrapbin::binary( std::vector< std::uint8_t >{ 0x01, 0x02 } ).into_vector(), make_bytes( { 0x01, 0x02 } ) );
}

TEST( binary, to_owned )
{
  auto bytes = make_bytes( { 1, 2, 3 } );
  wrapbin::binary borrowed( bytes );
  auto owned = borrowed.to_owned();

  EXPECT_TRUE( borrowed.is_borrowed() );
  EXPECT_TRUE( owned.is_owned() );
  EXPECT_NE( owned.data(), borrowed.data() );
  EXPECT_EQ( owned, borrowed );

  wrapbin::binary copy = borrowed;
  EXPECT_TRUE( copy.is_borrowed() );
  EXPECT_EQ( copy.data(), borrowed.data() );
}

TEST( binary, empty )
{
  wrapbin::binary empty( ""sv );
  EXPECT_TRUE( empty.empty() );
  EXPECT_EQ( empty.size(), 0 );
  EXPECT_EQ( empty, wrapbin::binary( std::vector< std::byte >{} ) );
  EXPECT_FALSE( empty.at( 0 ) );
}

TEST( binary, at )
{
  wrapbin::binary value( "abc"sv );

  auto b = value.at( 1 );
  ASSERT_TRUE( b );
  EXPECT_EQ( *b, std::byte{ 'b' } );

  auto out_of_range = value.at( 3 );
  ASSERT_FALSE( out_of_range );
  EXPECT_EQ( out_of_range.error(), wrapbin::binary_errc::index_out_of_range );
  EXPECT_EQ( out_of_range.error().message(), "index out of range" );
  EXPECT_STREQ( out_of_range.error().category().name(), "binary" );
}

TEST( binary, slice )
{
  std::string text = "Hello World!";
  wrapbin::binary value( std::move( text ) );

  auto world = value.slice( 6, 11 );
  ASSERT_TRUE( world );
  EXPECT_TRUE( world->is_borrowed() );
  EXPECT_EQ( world->as_string_view(), "World" );
  EXPECT_EQ( world->data(), value.data() + 6 );

  auto kept = world->to_owned();
  EXPECT_TRUE( kept.is_owned() );
  EXPECT_NE( kept.data(), world->data() );
  EXPECT_EQ( kept, *world );

  auto whole = value.slice( 0, value.size() );
  ASSERT_TRUE( whole );
  EXPECT_EQ( *whole, value );

  auto none = value.slice( 12, 12 );
  ASSERT_TRUE( none );
  EXPECT_TRUE( none->empty() );

  auto past_end = value.slice( 4, 13 );
  ASSERT_FALSE( past_end );
  EXPECT_EQ( past_end.error(), wrapbin::binary_errc::range_out_of_bounds );

  auto reversed = value.slice( 5, 4 );
  ASSERT_FALSE( reversed );
  EXPECT_EQ( reversed.error(), wrapbin::binary_errc::range_out_of_bounds );
  EXPECT_EQ( reversed.error().message(), "range out of bounds" );
}

TEST( binary, equality_ignores_ownership )
{
  auto bytes = make_bytes( { 0x10, 0x20, 0x30 } );
  wrapbin::binary borrowed( bytes );
  wrapbin::binary owned{ std::vector< std::byte >( bytes ) };

  EXPECT_TRUE( borrowed.is_borrowed() );
  EXPECT_TRUE( owned.is_owned() );
  EXPECT_EQ( borrowed, owned );
  EXPECT_EQ( std::hash< wrapbin::binary >()( borrowed ), std::hash< wrapbin::binary >()( owned ) );

  EXPECT_EQ( wrapbin::binary( "abc"s ), wrapbin::binary( "abc"sv ) );
  EXPECT_NE( wrapbin::binary( "abc"sv ), wrapbin::binary( "abd"sv ) );
  EXPECT_NE( wrapbin::binary( "abc"sv ), wrapbin::binary( "ab"sv ) );
}

TEST( binary, ordering )
{
  wrapbin::binary a( make_bytes( { 0x01 } ) );
  wrapbin::binary b( make_bytes( { 0x01, 0x00 } ) );
  wrapbin::binary c( make_bytes( { 0x02 } ) );
  wrapbin::binary high( make_bytes( { 0xff } ) );
  wrapbin::binary empty( std::vector< std::byte >{} );

  EXPECT_LT( a, b );
  EXPECT_LT( b, c );
  EXPECT_LT( a, c );
  EXPECT_LT( c, high );
  EXPECT_LT( empty, a );
  EXPECT_EQ( a <=> wrapbin::binary( make_bytes( { 0x01 } ) ), std::strong_ordering::equal );

  std::vector< wrapbin::binary > sorted{ high, c, empty, b, a };
  std::ranges::sort( sorted );
  EXPECT_EQ( sorted, ( std::vector< wrapbin::binary >{ empty, a, b, c, high } ) );
}

TEST( binary, container_keys )
{
  auto bytes = make_bytes( { 1, 2 } );

  std::unordered_set< wrapbin::binary > set;
  set.insert( wrapbin::binary( bytes ) );
  set.insert( wrapbin::binary( std::vector< std::byte >( bytes ) ) );
  set.insert( wrapbin::binary( "xyz"sv ) );
  EXPECT_EQ( set.size(), 2 );

  std::map< wrapbin::binary, int > map;
  map.emplace( wrapbin::binary( "b"sv ), 2 );
  map.emplace( wrapbin::binary( "a"sv ), 1 );
  EXPECT_EQ( map.begin()->second, 1 );
}

TEST( binary, text_is_not_normalized )
{
  EXPECT_EQ( wrapbin::binary( "Hello World!"sv ).size(), 12 );

  // "Z" followed by five combining marks.
  constexpr auto zalgo = "Z\u0351\u036b\u0343\u036a\u0302"sv;
  wrapbin::binary value( zalgo );

  EXPECT_EQ( value.size(), 11 );
  EXPECT_EQ( value.as_string_view(), zalgo );

  // Precomposed and decomposed forms stay distinct.
  EXPECT_NE( wrapbin::binary( "\u00e9"sv ), wrapbin::binary( "e\u0301"sv ) );
}

TEST( binary, numeric_primitives_are_big_endian )
{
  EXPECT_EQ( wrapbin::binary( std::uint8_t{ 0 } ), wrapbin::binary( make_bytes( { 0x00 } ) ) );
  EXPECT_EQ( wrapbin::binary( std::uint8_t{ 0x0f } ), wrapbin::binary( make_bytes( { 0x0f } ) ) );
  EXPECT_EQ( wrapbin::binary( std::uint8_t{ 0xff } ), wrapbin::binary( make_bytes( { 0xff } ) ) );
  EXPECT_EQ( wrapbin::binary( std::int8_t{ -1 } ), wrapbin::binary( make_bytes( { 0xff } ) ) );
  EXPECT_EQ( wrapbin::binary( std::int8_t{ -128 } ), wrapbin::binary( make_bytes( { 0x80 } ) ) );

  EXPECT_EQ( wrapbin::binary( std::uint16_t{ 0x0102 } ), wrapbin::binary( make_bytes( { 0x01, 0x02 } ) ) );
  EXPECT_EQ( wrapbin::binary( std::uint32_t{ 0x01020304 } ), wrapbin::binary( make_bytes( { 0x01, 0x02, 0x03, 0x04 } ) ) );
  EXPECT_EQ( wrapbin::binary( std::uint64_t{ 0x0102030405060708 } ),
             wrapbin::binary( make_bytes( { 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08 } ) ) );
  EXPECT_EQ( wrapbin::binary( std::int32_t{ -2 } ), wrapbin::binary( make_bytes( { 0xff, 0xff, 0xff, 0xfe } ) ) );

  EXPECT_EQ( wrapbin::binary( 1.0f ), wrapbin::binary( make_bytes( { 0x3f, 0x80, 0x00, 0x00 } ) ) );
  EXPECT_EQ( wrapbin::binary( 1.0 ), wrapbin::binary( make_bytes( { 0x3f, 0xf0, 0, 0, 0, 0, 0, 0 } ) ) );

  EXPECT_EQ( wrapbin::binary( true ), wrapbin::binary( make_bytes( { 0x01 } ) ) );
  EXPECT_EQ( wrapbin::binary( false ), wrapbin::binary( make_bytes( { 0x00 } ) ) );
  EXPECT_EQ( wrapbin::binary( 'A' ), wrapbin::binary( make_bytes( { 0x41 } ) ) );

  wrapbin::binary number( std::uint32_t{ 42 } );
  EXPECT_TRUE( number.is_owned() );
  EXPECT_EQ( number.size(), sizeof( std::uint32_t ) );
}

TEST( binary, code_points )
{
  EXPECT_EQ( wrapbin::binary( U'A' ), wrapbin::binary( make_bytes( { 0x41 } ) ) );
  EXPECT_EQ( wrapbin::binary( U'\u00e9' ), wrapbin::binary( make_bytes( { 0xc3, 0xa9 } ) ) );
  EXPECT_EQ( wrapbin::binary( U'\u20ac' ), wrapbin::binary( make_bytes( { 0xe2, 0x82, 0xac } ) ) );
  EXPECT_EQ( wrapbin::binary( U'\U0001f600' ), wrapbin::binary( make_bytes( { 0xf0, 0x9f, 0x98, 0x80 } ) ) );
  EXPECT_TRUE( wrapbin::binary( U'A' ).is_owned() );

  // Surrogates are not code points.
  EXPECT_EQ( wrapbin::binary( static_cast< char32_t >( 0xd800 ) ), wrapbin::binary( make_bytes( { 0xef, 0xbf, 0xbd } ) ) );
}

TEST( binary, network_addresses )
{
  wrapbin::binary v4( boost::asio::ip::make_address_v4( "192.168.1.10" ) );
  EXPECT_TRUE( v4.is_owned() );
  EXPECT_EQ( v4, wrapbin::binary( make_bytes( { 192, 168, 1, 10 } ) ) );

  wrapbin::binary v6( boost::asio::ip::make_address_v6( "::1" ) );
  EXPECT_EQ( v6.size(), 16 );
  EXPECT_EQ( *v6.at( 15 ), std::byte{ 1 } );
  EXPECT_EQ( *v6.at( 0 ), std::byte{ 0 } );
}

TEST( binary, with_terminator )
{
  auto value = wrapbin::binary::with_terminator( "abc" );
  EXPECT_TRUE( value.is_borrowed() );
  EXPECT_EQ( value.size(), 4 );
  EXPECT_EQ( *value.at( 3 ), std::byte{ 0 } );
}

TEST( binary, iteration )
{
  auto bytes = make_bytes( { 3, 1, 4, 1, 5 } );
  wrapbin::binary value( bytes );

  std::vector< std::byte > visited;
  for( auto b: value )
    visited.push_back( b );

  EXPECT_EQ( visited, bytes );
  EXPECT_TRUE( std::ranges::equal( value.view(), bytes ) );
}

// NOLINTEND

