#pragma once

#include <span>
#include <string>

#include <quill/BinaryDataDeferredFormatCodec.h>
#include <quill/DirectFormatCodec.h>

#include <wrapbin/binary/binary.hpp>
#include <wrapbin/repr/format.hpp>

namespace wrapbin::log {

struct hex_tag
{};

/// Raw bytes copied into the log record and rendered as a compact lower hex array.
using hex = quill::BinaryData< hex_tag >;

} // namespace wrapbin::log

/*
 * Accepts the same specifiers as the integer formatters: {}, {:d}, {:b}, {:o}, {:x}, {:X},
 * with '#' selecting the compact representation.
 */
template<>
struct fmtquill::formatter< wrapbin::binary >
{
  wrapbin::repr::format_spec spec;

  constexpr auto parse( format_parse_context& ctx )
  {
    auto it = ctx.begin();
    if( it != ctx.end() && *it == '#' )
    {
      spec.compact = true;
      ++it;
    }

    if( it != ctx.end() && *it != '}' )
    {
      switch( *it )
      {
        case 'b':
          spec.base = wrapbin::repr::radix::binary;
          break;
        case 'o':
          spec.base = wrapbin::repr::radix::octal;
          break;
        case 'd':
          spec.base = wrapbin::repr::radix::decimal;
          break;
        case 'x':
          spec.base = wrapbin::repr::radix::lower_hex;
          break;
        case 'X':
          spec.base = wrapbin::repr::radix::upper_hex;
          break;
        default:
          throw fmtquill::format_error( "invalid binary format specifier" );
      }
      ++it;
    }

    if( it != ctx.end() && *it != '}' )
      throw fmtquill::format_error( "invalid binary format specifier" );

    return it;
  }

  auto format( const wrapbin::binary& value, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{}", wrapbin::repr::to_string( value, spec ) );
  }
};

// A borrowed binary may not outlive the call, so it is formatted on the calling thread.
template<>
struct quill::Codec< wrapbin::binary >: quill::DirectFormatCodec< wrapbin::binary >
{};

template<>
struct fmtquill::formatter< wrapbin::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const wrapbin::log::hex& bin_data, format_context& ctx ) const
  {
    wrapbin::binary value( std::span( bin_data.data(), bin_data.size() ) );
    return fmtquill::format_to(
      ctx.out(),
      "{}",
      wrapbin::repr::to_string( value, { .base = wrapbin::repr::radix::lower_hex, .compact = true } ) );
  }
};

template<>
struct quill::Codec< wrapbin::log::hex >: quill::BinaryDataDeferredFormatCodec< wrapbin::log::hex >
{};
