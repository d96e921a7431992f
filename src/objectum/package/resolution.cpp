#include <objectum/package/resolution.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <set>
#include <stdexcept>

#include <objectum/log.hpp>
#include <objectum/package/module.hpp>

namespace objectum::package {

const resolved_package& resolution_graph::root_package() const
{
  auto itr = packages.find( root );
  if( itr == packages.end() )
    throw std::runtime_error( "resolution graph is missing its root package" );

  return itr->second;
}

std::vector< std::string > resolution_graph::transitive_dependencies() const
{
  std::vector< std::string > names;
  for( const auto& [ name, pkg ]: packages )
    if( name != root )
      names.push_back( name );

  return names;
}

result< std::vector< std::vector< std::byte > > > read_modules( const std::filesystem::path& package_dir )
{
  std::vector< std::vector< std::byte > > modules;

  auto dir = package_dir / modules_directory;
  std::error_code ec;
  if( !std::filesystem::is_directory( dir, ec ) )
    return modules;

  std::vector< std::filesystem::path > files;
  for( const auto& entry: std::filesystem::directory_iterator( dir, ec ) )
    if( entry.is_regular_file() && entry.path().extension() == module_extension )
      files.push_back( entry.path() );

  if( ec )
    return std::unexpected( package_errc::module_read_failure );

  std::ranges::sort( files );

  for( const auto& file: files )
  {
    std::ifstream ifs( file, std::ios::binary );
    if( !ifs )
      return std::unexpected( package_errc::module_read_failure );

    std::vector< char > raw( ( std::istreambuf_iterator< char >( ifs ) ), std::istreambuf_iterator< char >() );
    std::vector< std::byte > bytes( raw.size() );
    std::ranges::transform( raw,
                            bytes.begin(),
                            []( char c )
                            {
                              return static_cast< std::byte >( c );
                            } );

    if( !decode_module_header( bytes ) )
    {
      LOG_WARNING( objectum::log::instance(), "Malformed module {}", file.string() );
      return std::unexpected( package_errc::invalid_module_header );
    }

    modules.push_back( std::move( bytes ) );
  }

  return modules;
}

namespace {

struct resolver
{
  std::size_t max_depth;
  resolution_graph graph;
  std::set< std::string > in_progress;

  std::error_code visit( const std::filesystem::path& dir, const std::string* expected_name, std::size_t depth )
  {
    if( depth > max_depth )
      return package_errc::resolution_too_deep;

    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical( dir, ec );
    if( ec )
      return package_errc::dependency_not_found;

    auto m = load_manifest( canonical );
    if( !m )
    {
      if( expected_name && m.error() == package_errc::manifest_not_found )
        return package_errc::dependency_not_found;

      return m.error();
    }

    if( expected_name && m->name != *expected_name )
      return package_errc::conflicting_dependency;

    if( in_progress.contains( m->name ) )
      return package_errc::dependency_cycle;

    if( auto itr = graph.packages.find( m->name ); itr != graph.packages.end() )
    {
      if( itr->second.path != canonical )
        return package_errc::conflicting_dependency;

      return {};
    }

    auto modules = read_modules( canonical );
    if( !modules )
      return modules.error();

    in_progress.insert( m->name );

    for( const auto& [ name, spec ]: m->dependencies )
    {
      auto dep_dir = spec.local.is_relative() ? canonical / spec.local : spec.local;
      if( auto err = visit( dep_dir, &name, depth + 1 ); err )
        return err;
    }

    in_progress.erase( m->name );

    auto name = m->name;
    graph.packages.emplace(
      name,
      resolved_package{ .manifest = std::move( *m ), .path = canonical, .modules = std::move( *modules ) } );

    return {};
  }
};

} // namespace

result< resolution_graph > resolve_package( const std::filesystem::path& package_dir, std::size_t max_depth )
{
  resolver r{ .max_depth = max_depth, .graph = {}, .in_progress = {} };

  auto root = load_manifest( package_dir );
  if( !root )
    return std::unexpected( root.error() );

  if( auto ec = r.visit( package_dir, nullptr, 0 ); ec )
    return std::unexpected( ec );

  r.graph.root = root->name;

  LOG_DEBUG( objectum::log::instance(),
             "Resolved package {} with {} dependencies",
             r.graph.root,
             r.graph.packages.size() - 1 );

  return std::move( r.graph );
}

} // namespace objectum::package
