#include <wrapbin/repr/error.hpp>

#include <string>
#include <utility>

namespace wrapbin::repr {

struct _repr_category final: std::error_category
{
  const char* name() const noexcept final;
  std::string message( int condition ) const noexcept final;
};

const char* _repr_category::name() const noexcept
{
  return "repr";
}

std::string _repr_category::message( int condition ) const noexcept
{
  using namespace std::string_literals;
  switch( static_cast< repr_errc >( condition ) )
  {
    case repr_errc::ok:
      return "ok"s;
    case repr_errc::invalid_representation:
      return "invalid representation"s;
    case repr_errc::missing_radix_prefix:
      return "missing radix prefix"s;
    case repr_errc::invalid_radix_prefix:
      return "invalid radix prefix"s;
    case repr_errc::invalid_string_quotes:
      return "string representation must be enclosed in double quotes"s;
    case repr_errc::invalid_array_brackets:
      return "array representation must be enclosed in brackets"s;
    case repr_errc::invalid_digit:
      return "invalid digit in byte representation"s;
    case repr_errc::byte_overflow:
      return "byte representation out of range"s;
    case repr_errc::invalid_base64:
      return "invalid base64"s;
  }
  std::unreachable();
}

const std::error_category& repr_category() noexcept
{
  static _repr_category category;
  return category;
}

std::error_code make_error_code( repr_errc e )
{
  return std::error_code( static_cast< int >( e ), repr_category() );
}

} // namespace wrapbin::repr
