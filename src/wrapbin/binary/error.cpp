#include <wrapbin/binary/error.hpp>

#include <string>
#include <utility>

namespace wrapbin {

struct _binary_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "binary";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< binary_errc >( condition ) )
    {
      case binary_errc::ok:
        return "ok"s;
      case binary_errc::index_out_of_range:
        return "index out of range"s;
      case binary_errc::range_out_of_bounds:
        return "range out of bounds"s;
    }
    std::unreachable();
  }
};

const std::error_category& binary_category() noexcept
{
  static _binary_category category;
  return category;
}

std::error_code make_error_code( binary_errc e )
{
  return std::error_code( static_cast< int >( e ), binary_category() );
}

} // namespace wrapbin
