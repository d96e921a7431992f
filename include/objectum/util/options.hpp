#pragma once

#include <string>
#include <string_view>

#include <boost/program_options.hpp>
#include <yaml-cpp/yaml.h>

namespace objectum::util {

namespace service {

constexpr auto replay = "replay";

} // namespace service

/**
 * Strips the short alias from a program_options key, "log-level,l" becomes
 * "log-level".
 */
std::string option_key( std::string_view option );

/**
 * Reads an option from, in order of precedence, the command line, the
 * service's section of the config file, its global section or the default.
 */
template< typename T >
T get_option( std::string_view option,
              T default_value,
              const boost::program_options::variables_map& cli_args,
              const YAML::Node& service_config = YAML::Node(),
              const YAML::Node& global_config  = YAML::Node() )
{
  auto key = option_key( option );

  if( cli_args.count( key ) )
    return cli_args[ key ].as< T >();

  if( service_config && service_config[ key ] )
    return service_config[ key ].as< T >();

  if( global_config && global_config[ key ] )
    return global_config[ key ].as< T >();

  return default_value;
}

} // namespace objectum::util
