#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>
#include <yaml-cpp/yaml.h>

namespace mutual::util {

// "name,n" option specs are looked up by their long name.
inline std::string option_name( std::string_view descriptor )
{
  return std::string( descriptor.substr( 0, descriptor.find( ',' ) ) );
}

// Command line first, then the service section, then the global section, then the default.
template< typename T >
T get_option( std::string_view descriptor,
              const T& default_value,
              const boost::program_options::variables_map& args,
              const YAML::Node& service_config = YAML::Node(),
              const YAML::Node& global_config  = YAML::Node() )
{
  auto key = option_name( descriptor );

  if( args.count( key ) )
    return args[ key ].as< T >();

  if( service_config && service_config[ key ] )
    return service_config[ key ].as< T >();

  if( global_config && global_config[ key ] )
    return global_config[ key ].as< T >();

  return default_value;
}

template< typename T >
std::vector< T > get_options( std::string_view descriptor,
                              const boost::program_options::variables_map& args,
                              const YAML::Node& service_config = YAML::Node(),
                              const YAML::Node& global_config  = YAML::Node() )
{
  return get_option< std::vector< T > >( descriptor, std::vector< T >{}, args, service_config, global_config );
}

} // namespace mutual::util
