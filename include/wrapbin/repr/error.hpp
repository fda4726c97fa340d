#pragma once

#include <expected>
#include <system_error>

#include <wrapbin/binary/error.hpp>

namespace wrapbin::repr {

enum class repr_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_representation,
  missing_radix_prefix,
  invalid_radix_prefix,
  invalid_string_quotes,
  invalid_array_brackets,
  invalid_digit,
  byte_overflow,
  invalid_base64
};

const std::error_category& repr_category() noexcept;

std::error_code make_error_code( repr_errc e );

using wrapbin::result;

} // namespace wrapbin::repr

template<>
struct std::is_error_code_enum< wrapbin::repr::repr_errc >: public std::true_type
{};
