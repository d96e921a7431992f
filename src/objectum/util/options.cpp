#include <objectum/util/options.hpp>

namespace objectum::util {

std::string option_key( std::string_view option )
{
  return std::string( option.substr( 0, option.find( ',' ) ) );
}

} // namespace objectum::util
