#include <wrapbin/repr/color.hpp>

#include <utility>

namespace wrapbin::repr {

namespace {

using namespace std::string_view_literals;

constexpr auto no_style      = ""sv;
constexpr auto reset         = "\033[0m"sv;
constexpr auto escape_prefix = "\033["sv;

#ifdef WRAPBIN_REPR_COLOR
constexpr auto dimmed               = "\033[2m"sv;
constexpr auto ascii_control        = "\033[1;91m"sv;
constexpr auto ascii_7bit_printable = "\033[1;32m"sv;
constexpr auto ascii_8bit_printable = "\033[32m"sv;
constexpr auto ascii_8bit_undefined = "\033[33m"sv;
#endif

} // namespace

byte_kind classify( std::byte b ) noexcept
{
  auto value = std::to_integer< unsigned int >( b );

  if( value <= 0x20 || value == 0x7f || value == 0xa0 || value == 0xad )
    return byte_kind::control;
  if( value < 0x7f )
    return byte_kind::printable;
  if( value < 0xa0 )
    return byte_kind::undefined;

  return byte_kind::printable_extended;
}

bool color_enabled() noexcept
{
#ifdef WRAPBIN_REPR_COLOR
  return true;
#else
  return false;
#endif
}

std::string_view style( byte_kind kind, bool colored ) noexcept
{
#ifdef WRAPBIN_REPR_COLOR
  if( !colored )
    return no_style;

  switch( kind )
  {
    case byte_kind::control:
      return ascii_control;
    case byte_kind::printable:
      return ascii_7bit_printable;
    case byte_kind::printable_extended:
      return ascii_8bit_printable;
    case byte_kind::undefined:
      return ascii_8bit_undefined;
  }
  std::unreachable();
#else
  (void)kind;
  (void)colored;
  return no_style;
#endif
}

std::string_view style( component part, bool colored ) noexcept
{
#ifdef WRAPBIN_REPR_COLOR
  if( !colored )
    return no_style;

  switch( part )
  {
    case component::prefix:
      return no_style;
    case component::delimiter:
    case component::separator:
    case component::index:
      return dimmed;
  }
  std::unreachable();
#else
  (void)part;
  (void)colored;
  return no_style;
#endif
}

std::string paint( std::string_view text, std::string_view style )
{
  std::string painted;
  if( style.empty() )
  {
    painted.assign( text );
    return painted;
  }

  painted.reserve( style.size() + text.size() + reset.size() );
  painted.append( style );
  painted.append( text );
  painted.append( reset );
  return painted;
}

std::string strip_color( std::string_view text )
{
  std::string stripped;
  stripped.reserve( text.size() );

  while( !text.empty() )
  {
    if( text.starts_with( escape_prefix ) )
    {
      auto end = text.find( 'm', escape_prefix.size() );
      if( end == std::string_view::npos )
      {
        stripped.append( text );
        break;
      }

      text.remove_prefix( end + 1 );
      continue;
    }

    stripped.push_back( text.front() );
    text.remove_prefix( 1 );
  }

  return stripped;
}

} // namespace wrapbin::repr
