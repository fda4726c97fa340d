#include <wrapbin/repr/format.hpp>

namespace wrapbin::repr {

namespace {

template< typename... Ts >
struct overloaded: Ts...
{
  using Ts::operator()...;
};

} // namespace

std::string to_string( const binary& value, const format_spec& spec )
{
  return array_representation( value, array_options{ .base = spec.base, .compact = spec.compact, .colored = spec.colored } );
}

std::string format( const binary& value, const format_options& options )
{
  return std::visit( overloaded{ [ & ]( const array_options& o )
                                 {
                                   return array_representation( value, o );
                                 },
#ifdef WRAPBIN_REPR_BASE64
                                 [ & ]( const base64_options& o )
                                 {
                                   return base64_representation( value, o );
                                 },
#endif
#ifdef WRAPBIN_REPR_DUMP
                                 [ & ]( const dump_options& o )
                                 {
                                   return dump_representation( value, o );
                                 },
#endif
#ifdef WRAPBIN_REPR_STRING
                                 [ & ]( const string_options& o )
                                 {
                                   return string_representation( value, o );
                                 },
#endif
                               },
                     options );
}

} // namespace wrapbin::repr

namespace wrapbin {

std::ostream& operator<<( std::ostream& os, const binary& value )
{
  return os << repr::to_string( value );
}

} // namespace wrapbin
