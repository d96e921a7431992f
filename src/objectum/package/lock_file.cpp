#include <objectum/package/lock_file.hpp>

#include <fstream>
#include <sstream>

namespace objectum::package {

namespace {

void write_dependencies( std::ostream& os, const manifest& m )
{
  if( m.dependencies.empty() )
    return;

  os << "\ndependencies = [\n";
  for( const auto& [ name, spec ]: m.dependencies )
    os << "  { name = \"" << name << "\" },\n";
  os << "]\n";
}

} // namespace

std::string lock_file( const resolution_graph& graph )
{
  const auto& root = graph.root_package();

  std::stringstream ss;
  ss << "# @generated by Move, please check-in and do not edit manually.\n";
  ss << "\n[move]\n";
  ss << "version = 0\n";
  write_dependencies( ss, root.manifest );

  for( const auto& name: graph.transitive_dependencies() )
  {
    const auto& pkg = graph.packages.at( name );
    auto source     = std::filesystem::relative( pkg.path, root.path ).generic_string();

    ss << "\n[[move.package]]\n";
    ss << "name = \"" << name << "\"\n";
    ss << "source = { local = \"" << source << "\" }\n";
    write_dependencies( ss, pkg.manifest );
  }

  return ss.str();
}

std::error_code write_lock_file( const resolution_graph& graph, const std::filesystem::path& path )
{
  std::ofstream ofs( path, std::ios::binary | std::ios::trunc );
  if( !ofs )
    return std::make_error_code( std::errc::permission_denied );

  ofs << lock_file( graph );
  if( !ofs )
    return std::make_error_code( std::errc::io_error );

  return {};
}

} // namespace objectum::package
