#pragma once

#include <expected>
#include <system_error>

namespace wrapbin {

enum class binary_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  index_out_of_range,
  range_out_of_bounds
};

const std::error_category& binary_category() noexcept;

std::error_code make_error_code( binary_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace wrapbin

template<>
struct std::is_error_code_enum< wrapbin::binary_errc >: public std::true_type
{};
