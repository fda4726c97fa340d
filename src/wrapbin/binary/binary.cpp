#include <wrapbin/binary/binary.hpp>

#include <algorithm>
#include <iterator>

#include <boost/locale/utf.hpp>

namespace wrapbin {

namespace {

constexpr char32_t replacement_character = U'\uFFFD';

template< typename T >
std::vector< std::uint8_t > octets( const T& address )
{
  auto bytes = address.to_bytes();
  return std::vector< std::uint8_t >( bytes.begin(), bytes.end() );
}

template< typename T >
std::span< const std::byte > bytes_of( const T& container ) noexcept
{
  return std::as_bytes( std::span( container.data(), container.size() ) );
}

} // namespace

binary::binary( std::span< const std::byte > bytes ) noexcept:
    _storage( bytes )
{}

binary::binary( std::span< const std::uint8_t > bytes ) noexcept:
    _storage( std::as_bytes( bytes ) )
{}

binary::binary( std::string_view text ) noexcept:
    _storage( bytes_of( text ) )
{}

binary::binary( const char* text ) noexcept:
    binary( std::string_view( text ) )
{}

binary::binary( const std::string& text ) noexcept:
    binary( std::string_view( text ) )
{}

binary::binary( std::string&& text ) noexcept:
    _storage( std::move( text ) )
{}

binary::binary( const std::vector< std::byte >& bytes ) noexcept:
    _storage( std::span< const std::byte >( bytes ) )
{}

binary::binary( std::vector< std::byte >&& bytes ) noexcept:
    _storage( std::move( bytes ) )
{}

binary::binary( const std::vector< std::uint8_t >& bytes ) noexcept:
    _storage( bytes_of( bytes ) )
{}

binary::binary( std::vector< std::uint8_t >&& bytes ) noexcept:
    _storage( std::move( bytes ) )
{}

binary::binary( char32_t code_point )
{
  using traits = boost::locale::utf::utf_traits< char >;

  auto cp = static_cast< boost::locale::utf::code_point >( code_point );
  if( !boost::locale::utf::is_valid_codepoint( cp ) )
    cp = static_cast< boost::locale::utf::code_point >( replacement_character );

  std::string encoded;
  traits::encode( cp, std::back_inserter( encoded ) );
  _storage = std::move( encoded );
}

binary::binary( const boost::asio::ip::address_v4& address ):
    binary( octets( address ) )
{}

binary::binary( const boost::asio::ip::address_v6& address ):
    binary( octets( address ) )
{}

binary binary::with_terminator( const char* text ) noexcept
{
  return binary( std::as_bytes( std::span( text, std::strlen( text ) + 1 ) ) );
}

bool binary::operator==( const binary& rhs ) const noexcept
{
  return std::ranges::equal( view(), rhs.view() );
}

std::strong_ordering binary::operator<=>( const binary& rhs ) const noexcept
{
  auto lhs_view = view();
  auto rhs_view = rhs.view();
  return std::lexicographical_compare_three_way( lhs_view.begin(),
                                                 lhs_view.end(),
                                                 rhs_view.begin(),
                                                 rhs_view.end() );
}

std::size_t binary::size() const noexcept
{
  return view().size();
}

bool binary::empty() const noexcept
{
  return view().empty();
}

storage_kind binary::kind() const noexcept
{
  return std::holds_alternative< std::span< const std::byte > >( _storage ) ? storage_kind::borrowed
                                                                            : storage_kind::owned;
}

bool binary::is_borrowed() const noexcept
{
  return kind() == storage_kind::borrowed;
}

bool binary::is_owned() const noexcept
{
  return kind() == storage_kind::owned;
}

result< std::byte > binary::at( std::size_t index ) const noexcept
{
  auto bytes = view();
  if( index >= bytes.size() )
    return std::unexpected( binary_errc::index_out_of_range );

  return bytes[ index ];
}

result< binary > binary::slice( std::size_t start, std::size_t end ) const noexcept
{
  auto bytes = view();
  if( start > end || end > bytes.size() )
    return std::unexpected( binary_errc::range_out_of_bounds );

  return binary( bytes.subspan( start, end - start ) );
}

std::span< const std::byte > binary::view() const noexcept
{
  return std::visit(
    []< typename T >( const T& storage ) -> std::span< const std::byte >
    {
      if constexpr( std::is_same_v< T, std::span< const std::byte > > )
        return storage;
      else
        return bytes_of( storage );
    },
    _storage );
}

const std::byte* binary::data() const noexcept
{
  return view().data();
}

std::string_view binary::as_string_view() const noexcept
{
  auto bytes = view();
  return std::string_view( reinterpret_cast< const char* >( bytes.data() ), // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
                           bytes.size() );
}

binary::const_iterator binary::begin() const noexcept
{
  return view().begin();
}

binary::const_iterator binary::end() const noexcept
{
  return view().end();
}

binary binary::to_owned() const
{
  return binary( to_vector() );
}

std::vector< std::byte > binary::to_vector() const&
{
  auto bytes = view();
  return std::vector< std::byte >( bytes.begin(), bytes.end() );
}

std::vector< std::byte > binary::into_vector() &&
{
  if( auto owned = std::get_if< std::vector< std::byte > >( &_storage ); owned )
    return std::move( *owned );

  return to_vector();
}

} // namespace wrapbin
