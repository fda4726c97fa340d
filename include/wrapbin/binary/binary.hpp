#pragma once

#include <array>
#include <bit>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/address_v6.hpp>
#include <boost/endian/conversion.hpp>

#include <wrapbin/binary/error.hpp>

namespace wrapbin {

enum class storage_kind : std::uint8_t
{
  borrowed,
  owned
};

template< typename T >
concept numeric_primitive = std::is_arithmetic_v< T > && !std::is_same_v< T, long double >
                            && !std::is_same_v< T, char16_t > && !std::is_same_v< T, char32_t >
                            && !std::is_same_v< T, wchar_t >;

template< typename T >
concept byte_like = std::is_same_v< T, std::byte > || std::is_same_v< T, std::uint8_t >;

/**
 * An immutable byte sequence whose storage is either borrowed from its source or owned.
 *
 * Sources that already own a contiguous buffer (rvalue strings and vectors) are moved in,
 * views (string views, spans, lvalue containers, arrays) are borrowed. Numeric primitives
 * are stored owned in big-endian byte order.
 *
 * A borrowed binary does not extend the lifetime of the bytes it views. Using it after the
 * source has been destroyed is undefined behavior.
 */
class binary
{
public:
  using value_type     = std::byte;
  using size_type      = std::size_t;
  using const_iterator = std::span< const std::byte >::iterator;

  binary( std::span< const std::byte > bytes ) noexcept;
  binary( std::span< const std::uint8_t > bytes ) noexcept;
  binary( std::string_view text ) noexcept;
  binary( const char* text ) noexcept;
  binary( const std::string& text ) noexcept;
  binary( std::string&& text ) noexcept;
  binary( const std::vector< std::byte >& bytes ) noexcept;
  binary( std::vector< std::byte >&& bytes ) noexcept;
  binary( const std::vector< std::uint8_t >& bytes ) noexcept;
  binary( std::vector< std::uint8_t >&& bytes ) noexcept;

  template< byte_like T, std::size_t N >
  binary( const std::array< T, N >& bytes ) noexcept:
      binary( std::span< const T >( bytes.data(), bytes.size() ) )
  {}

  template< byte_like T, std::size_t N >
  binary( std::array< T, N >&& bytes ) = delete;

  template< byte_like T, std::size_t N >
  binary( const T ( &bytes )[ N ] ) noexcept: // NOLINT(cppcoreguidelines-avoid-c-arrays)
      binary( std::span< const T >( bytes, N ) )
  {}

  template< std::input_iterator It, std::sentinel_for< It > S >
    requires byte_like< std::iter_value_t< It > >
  binary( It first, S last )
  {
    std::vector< std::byte > bytes;
    for( ; first != last; ++first )
      bytes.push_back( static_cast< std::byte >( *first ) );
    _storage = std::move( bytes );
  }

  template< numeric_primitive T >
  explicit binary( T value ):
      _storage( big_endian_bytes( value ) )
  {}

  explicit binary( char32_t code_point );
  explicit binary( const boost::asio::ip::address_v4& address );
  explicit binary( const boost::asio::ip::address_v6& address );

  binary( binary&& ) noexcept      = default;
  binary( const binary& )          = default;
  ~binary() noexcept               = default;

  binary& operator=( binary&& ) noexcept = default;
  binary& operator=( const binary& )     = default;

  /// Borrows a NUL terminated C string, terminator included.
  static binary with_terminator( const char* text ) noexcept;

  bool operator==( const binary& rhs ) const noexcept;
  std::strong_ordering operator<=>( const binary& rhs ) const noexcept;

  std::size_t size() const noexcept;
  bool empty() const noexcept;

  storage_kind kind() const noexcept;
  bool is_borrowed() const noexcept;
  bool is_owned() const noexcept;

  result< std::byte > at( std::size_t index ) const noexcept;

  /**
   * Returns the bytes in [start, end) as a borrowed view into this binary.
   *
   * The slice is borrowed even when this binary is owned. It must not outlive this binary.
   * Call to_owned() on the result to keep it independently.
   */
  result< binary > slice( std::size_t start, std::size_t end ) const noexcept;

  std::span< const std::byte > view() const noexcept;
  const std::byte* data() const noexcept;
  std::string_view as_string_view() const noexcept;

  const_iterator begin() const noexcept;
  const_iterator end() const noexcept;

  binary to_owned() const;
  std::vector< std::byte > to_vector() const&;

  /**
   * Consumes this binary into a byte vector.
   *
   * Only an owned std::vector< std::byte > is moved out. Borrowed bytes and bytes owned
   * as a std::string or a std::vector< std::uint8_t > are copied.
   */
  std::vector< std::byte > into_vector() &&;

private:
  using storage_type = std::variant< std::span< const std::byte >,
                                     std::vector< std::byte >,
                                     std::vector< std::uint8_t >,
                                     std::string >;

  template< numeric_primitive T >
  static std::vector< std::byte > big_endian_bytes( T value )
  {
    if constexpr( std::is_floating_point_v< T > )
    {
      using bits_type = std::conditional_t< sizeof( T ) == sizeof( std::uint32_t ), std::uint32_t, std::uint64_t >;
      return big_endian_bytes( std::bit_cast< bits_type >( value ) );
    }
    else if constexpr( sizeof( T ) == 1 )
    {
      return { static_cast< std::byte >( value ) };
    }
    else
    {
      auto big = boost::endian::native_to_big( value );
      std::vector< std::byte > bytes( sizeof( T ) );
      std::memcpy( bytes.data(), &big, sizeof( T ) );
      return bytes;
    }
  }

  storage_type _storage;
};

} // namespace wrapbin

namespace std {
template<>
struct hash< wrapbin::binary >
{
  std::size_t operator()( const wrapbin::binary& b ) const noexcept
  {
    std::size_t seed = b.size();
    for( const auto& value: b )
    {
      seed ^= std::hash< std::byte >()( value ) + 0x9e3779b9 + ( seed << 6 ) + ( seed >> 2 );
    }
    return seed;
  }
};
} // namespace std
