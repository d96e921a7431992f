#include <objectum/package/manifest.hpp>

#include <fstream>
#include <sstream>

#include <yaml-cpp/yaml.h>

#include <objectum/log.hpp>

namespace objectum::package {

result< manifest > parse_manifest( std::string_view yaml )
{
  YAML::Node root;
  try
  {
    root = YAML::Load( std::string( yaml ) );
  }
  catch( const YAML::Exception& e )
  {
    LOG_WARNING( objectum::log::instance(), "Unable to parse package manifest: {}", e.what() );
    return std::unexpected( package_errc::invalid_manifest );
  }

  if( !root.IsMap() )
    return std::unexpected( package_errc::invalid_manifest );

  auto package_node = root[ "package" ];
  if( !package_node.IsMap() )
    return std::unexpected( package_errc::invalid_manifest );

  manifest m;

  auto name_node = package_node[ "name" ];
  if( !name_node.IsScalar() || name_node.Scalar().empty() )
    return std::unexpected( package_errc::missing_package_name );

  m.name = name_node.Scalar();

  if( auto published = package_node[ "published-at" ]; published )
  {
    if( !published.IsScalar() )
      return std::unexpected( package_errc::invalid_published_address );

    auto addr = protocol::address_from_string( published.Scalar() );
    if( !addr )
      return std::unexpected( package_errc::invalid_published_address );

    m.published_at = *addr;
  }

  if( auto dependencies = root[ "dependencies" ]; dependencies )
  {
    if( !dependencies.IsMap() )
      return std::unexpected( package_errc::invalid_manifest );

    for( const auto& entry: dependencies )
    {
      if( !entry.first.IsScalar() || !entry.second.IsMap() )
        return std::unexpected( package_errc::invalid_manifest );

      auto local = entry.second[ "local" ];
      if( !local || !local.IsScalar() || local.Scalar().empty() )
        return std::unexpected( package_errc::invalid_manifest );

      m.dependencies.emplace( entry.first.Scalar(), dependency_spec{ .local = local.Scalar() } );
    }
  }

  return m;
}

result< manifest > load_manifest( const std::filesystem::path& package_dir )
{
  auto path = package_dir / manifest_file_name;

  std::ifstream ifs( path );
  if( !ifs )
    return std::unexpected( package_errc::manifest_not_found );

  std::stringstream ss;
  ss << ifs.rdbuf();

  return parse_manifest( ss.str() );
}

} // namespace objectum::package
