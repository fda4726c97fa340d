#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace wrapbin::repr {

/// Classification of a byte following ISO 8859-1.
enum class byte_kind : std::uint8_t
{
  control,
  printable,
  printable_extended,
  undefined
};

/// The non-value parts of a rendered representation.
enum class component : std::uint8_t
{
  prefix,
  delimiter,
  separator,
  index
};

byte_kind classify( std::byte b ) noexcept;

/// True when the library was built with color support.
bool color_enabled() noexcept;

/**
 * ANSI escape sequence opening the style of a byte or component. Returns an empty
 * sequence when colored is false, when the library is built without color support, or
 * when the element is rendered unstyled.
 */
std::string_view style( byte_kind kind, bool colored ) noexcept;
std::string_view style( component part, bool colored ) noexcept;

/// Wraps text in the given style and the matching reset sequence.
std::string paint( std::string_view text, std::string_view style );

/// Removes every ANSI SGR escape sequence from text.
std::string strip_color( std::string_view text );

} // namespace wrapbin::repr
