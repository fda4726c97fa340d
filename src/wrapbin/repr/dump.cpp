#include <wrapbin/repr/dump.hpp>

#include <algorithm>
#include <iterator>
#include <span>
#include <utility>
#include <vector>

#include <boost/locale/utf.hpp>

#include "detail.hpp"

namespace wrapbin::repr {

namespace {

constexpr unsigned int first_control_picture = 0x2400;
constexpr char32_t delete_picture            = U'\u2421';
constexpr char32_t nbsp_picture              = U'\u237D';

std::size_t display_width( std::string_view text ) noexcept
{
  constexpr unsigned char continuation_mask = 0xc0;
  constexpr unsigned char continuation      = 0x80;

  return static_cast< std::size_t >( std::ranges::count_if( text,
                                                            []( char c )
                                                            {
                                                              return ( static_cast< unsigned char >( c ) & continuation_mask )
                                                                     != continuation;
                                                            } ) );
}

radix to_radix( index_radix r ) noexcept
{
  switch( r )
  {
    case index_radix::decimal:
      return radix::decimal;
    case index_radix::octal:
      return radix::octal;
    case index_radix::lower_hex:
      return radix::lower_hex;
    case index_radix::upper_hex:
      return radix::upper_hex;
  }
  std::unreachable();
}

std::size_t line_index_width( index_radix r ) noexcept
{
  constexpr std::size_t octal_decimal_width = 8;
  constexpr std::size_t hex_width           = 6;

  return r == index_radix::decimal || r == index_radix::octal ? octal_decimal_width : hex_width;
}

std::string encode_utf8( char32_t code_point )
{
  std::string encoded;
  boost::locale::utf::utf_traits< char >::encode( static_cast< boost::locale::utf::code_point >( code_point ),
                                                  std::back_inserter( encoded ) );
  return encoded;
}

// Character shown in place of a byte, following ISO 8859-1.
std::optional< char32_t > ascii_char( std::byte b, bool extended ) noexcept
{
  auto value = std::to_integer< unsigned int >( b );

  if( value >= 0x21 && value <= 0x7e )
    return static_cast< char32_t >( value );
  if( ( value >= 0xa1 && value <= 0xac ) || value >= 0xae )
    return static_cast< char32_t >( value );

  if( !extended )
    return std::nullopt;

  if( value <= 0x20 )
    return static_cast< char32_t >( first_control_picture + value );
  if( value == 0x7f )
    return delete_picture;
  if( value == 0xa0 )
    return nbsp_picture;

  return std::nullopt;
}

class dump_writer
{
public:
  explicit dump_writer( const dump_options& options ):
      _options( options ),
      _per_column( static_cast< std::size_t >( options.columns ) ),
      _per_line( options.two_columns ? _per_column * 2 : _per_column ),
      _value_width( width( options.base ) ),
      _cell_width( _value_width + display_width( options.value_spacing ) ),
      _separator_width( display_width( options.column_separator ) + display_width( options.value_spacing ) )
  {}

  std::string write( const binary& value ) const
  {
    std::vector< std::string > lines;

    if( _options.header_line )
    {
      lines.push_back( header_line() );
      if( _options.column_index_underline )
        lines.push_back( underline_line( *_options.column_index_underline ) );
    }

    auto bytes = value.view();
    for( std::size_t offset = 0; offset < bytes.size(); offset += _per_line )
      lines.push_back( data_line( offset, bytes.subspan( offset, std::min( _per_line, bytes.size() - offset ) ) ) );

    std::string repr;
    for( std::size_t i = 0; i < lines.size(); ++i )
    {
      if( i )
        repr += '\n';
      repr += lines[ i ];
    }

    return repr;
  }

private:
  std::string header_line() const
  {
    auto pfx         = prefix( _options.base );
    std::string line = detail::paint_part( pfx, component::prefix, _options.colored );
    line.append( line_index_width( _options.index_base ) - pfx.size() + display_width( _options.line_index_spacing ),
                 ' ' );

    for( std::size_t i = 0; i < _per_line; ++i )
    {
      if( _options.two_columns && i == _per_column )
        line += separator();

      line += detail::paint_part( format_number( i, _options.base, _value_width ), component::index, _options.colored );
      line += _options.value_spacing;
    }

    return line;
  }

  std::string underline_line( const std::string& underline ) const
  {
    std::string rule;
    for( std::size_t i = 0; i < _cell_width * _per_column; ++i )
      rule += underline;

    std::string line( line_index_width( _options.index_base ) + display_width( _options.line_index_spacing ), ' ' );
    line += detail::paint_part( rule, component::separator, _options.colored );
    if( _options.two_columns )
    {
      line += separator();
      line += detail::paint_part( rule, component::separator, _options.colored );
    }

    return line;
  }

  std::string data_line( std::size_t offset, std::span< const std::byte > bytes ) const
  {
    std::string line;
    if( _options.line_numbers )
      line = detail::paint_part(
        format_number( offset, to_radix( _options.index_base ), line_index_width( _options.index_base ) )
          + _options.line_index_spacing,
        component::index,
        _options.colored );

    for( std::size_t i = 0; i < bytes.size(); ++i )
    {
      if( _options.two_columns && i == _per_column )
        line += separator();

      line += value_cell( bytes[ i ] );
    }

    if( _options.ascii_gutter )
    {
      auto full_width = _per_line * _cell_width + ( _options.two_columns ? _separator_width : 0 );
      auto used_width =
        bytes.size() * _cell_width + ( _options.two_columns && bytes.size() > _per_column ? _separator_width : 0 );

      line.append( full_width - used_width, ' ' );
      line += gutter( bytes );
    }

    return line;
  }

  std::string value_cell( std::byte b ) const
  {
    std::string text;
    if( _options.show_ascii )
    {
      if( auto c = ascii_char( b, _options.show_extended_ascii ); c )
        text = encode_utf8( *c );
      else
        text = format_byte( b, radix::upper_hex, false );

      auto text_width = display_width( text );
      if( text_width < _value_width )
        text.append( _value_width - text_width, ' ' );
    }
    else
    {
      text = format_byte( b, _options.base, false );
    }

    return paint( text, style( classify( b ), _options.colored ) ) + _options.value_spacing;
  }

  std::string separator() const
  {
    return detail::paint_part( _options.column_separator + _options.value_spacing,
                               component::separator,
                               _options.colored );
  }

  std::string gutter( std::span< const std::byte > bytes ) const
  {
    constexpr unsigned int first_printable = 0x20;
    constexpr unsigned int last_printable  = 0x7e;

    std::string text = detail::paint_part( "|", component::delimiter, _options.colored );
    for( auto b: bytes )
    {
      auto value = std::to_integer< unsigned int >( b );
      char c     = value >= first_printable && value <= last_printable ? static_cast< char >( value ) : '.';
      text      += paint( std::string_view( &c, 1 ), style( classify( b ), _options.colored ) );
    }
    text += detail::paint_part( "|", component::delimiter, _options.colored );

    return text;
  }

  const dump_options& _options;
  std::size_t _per_column;
  std::size_t _per_line;
  std::size_t _value_width;
  std::size_t _cell_width;
  std::size_t _separator_width;
};

} // namespace

dump_options dump_options::classic_hex_dump()
{
  dump_options options;
  options.base                   = radix::upper_hex;
  options.index_base             = index_radix::upper_hex;
  options.columns                = column_width::eight;
  options.two_columns            = true;
  options.column_index_underline = std::nullopt;
  options.column_separator       = "-";
  options.ascii_gutter           = false;
  return options;
}

dump_options dump_options::ascii_hex_dump()
{
  auto options                = classic_hex_dump();
  options.show_ascii          = true;
  options.show_extended_ascii = true;
  return options;
}

dump_options dump_options::hex_dump()
{
  dump_options options;
  options.base       = radix::upper_hex;
  options.index_base = index_radix::upper_hex;
  return options;
}

dump_options dump_options::lower_hex_dump()
{
  dump_options options;
  options.base       = radix::lower_hex;
  options.index_base = index_radix::lower_hex;
  return options;
}

dump_options dump_options::octal_dump()
{
  dump_options options;
  options.base       = radix::octal;
  options.index_base = index_radix::octal;
  return options;
}

dump_options dump_options::decimal_dump()
{
  dump_options options;
  options.base       = radix::decimal;
  options.index_base = index_radix::decimal;
  return options;
}

dump_options dump_options::binary_dump()
{
  dump_options options;
  options.base       = radix::binary;
  options.index_base = index_radix::upper_hex;
  return options;
}

std::string dump_representation( const binary& value, const dump_options& options )
{
  return dump_writer( options ).write( value );
}

} // namespace wrapbin::repr
