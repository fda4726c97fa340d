#pragma once

#ifdef WRAPBIN_REPR_DUMP

#include <cstdint>
#include <optional>
#include <string>

#include <wrapbin/binary/binary.hpp>
#include <wrapbin/repr/radix.hpp>

namespace wrapbin::repr {

enum class column_width : std::uint8_t
{
  eight      = 8,
  sixteen    = 16,
  thirty_two = 32
};

/// Radix of the line offsets. Binary offsets are not supported.
enum class index_radix : std::uint8_t
{
  decimal,
  octal,
  lower_hex,
  upper_hex
};

/*
 * Multi-line dump representation.
 *
 *   HeaderLine    ::= Prefix Spaces { ColumnIndex ValueSpacing } [ Separator ... ]
 *   UnderlineLine ::= Spaces Underline [ Separator Underline ]
 *   DataLine      ::= LineIndex IndexSpacing { Value ValueSpacing } [ Separator ... ] [ Gutter ]
 *   Gutter        ::= '|' { Printable | '.' } '|'
 *
 * A line holds one column, or two columns split by the column separator. Lines are joined
 * with '\n', the last line has no trailing newline.
 */
struct dump_options
{
  radix base                                          = radix::upper_hex;
  index_radix index_base                              = index_radix::upper_hex;
  column_width columns                                = column_width::eight;
  bool two_columns                                    = true;
  bool header_line                                    = true;
  bool line_numbers                                   = true;
  bool ascii_gutter                                   = true;
  bool show_ascii                                     = false;
  bool show_extended_ascii                            = false;
  std::string line_index_spacing                      = ":  ";
  std::string value_spacing                           = " ";
  std::string column_separator                        = "│";
  std::optional< std::string > column_index_underline = "─";
  bool colored                                        = false;

  /// Upper hex values, '-' between two columns of eight, no underline, no gutter.
  static dump_options classic_hex_dump();

  /// Classic layout with printable characters in place of their values.
  static dump_options ascii_hex_dump();

  static dump_options hex_dump();
  static dump_options lower_hex_dump();
  static dump_options octal_dump();
  static dump_options decimal_dump();
  static dump_options binary_dump();
};

std::string dump_representation( const binary& value, const dump_options& options = {} );

} // namespace wrapbin::repr

#endif
