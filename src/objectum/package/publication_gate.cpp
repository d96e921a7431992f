#include <objectum/package/publication_gate.hpp>

#include <algorithm>
#include <set>

#include <objectum/encode/bcs.hpp>
#include <objectum/log.hpp>
#include <objectum/package/module.hpp>
#include <objectum/protocol/error.hpp>

namespace objectum::package {

std::error_code check_modules( const std::vector< module_bytes >& modules )
{
  if( modules.empty() )
    return protocol::user_input_errc::empty_command_input;

  std::set< module_bytes > seen_bytes;
  std::set< std::string > seen_names;

  for( const auto& m: modules )
  {
    if( m.empty() )
    {
      LOG_DEBUG( objectum::log::instance(), "Rejecting publish of an empty module" );
      return protocol::execution_errc::vm_verification_or_deserialization_error;
    }

    auto header = decode_module_header( m );
    if( !header )
    {
      LOG_DEBUG( objectum::log::instance(), "Rejecting publish of an undecodable module" );
      return protocol::execution_errc::vm_verification_or_deserialization_error;
    }

    if( !seen_bytes.insert( m ).second || !seen_names.insert( header->name ).second )
    {
      LOG_DEBUG( objectum::log::instance(), "Rejecting publish of duplicate module {}", header->name );
      return protocol::execution_errc::vm_verification_or_deserialization_error;
    }
  }

  return {};
}

dependency_split gather_dependencies( const resolution_graph& graph )
{
  dependency_split split;

  for( const auto& name: graph.transitive_dependencies() )
  {
    const auto& pkg = graph.packages.at( name );
    if( pkg.manifest.published_at )
      split.published.emplace( name, *pkg.manifest.published_at );
    else
      split.unpublished.push_back( name );
  }

  return split;
}

std::optional< module_publish_failure > check_unpublished_dependencies( const std::vector< std::string >& unpublished )
{
  if( unpublished.empty() )
    return std::nullopt;

  const auto& name = unpublished.front();

  return module_publish_failure{
    .code   = publish_errc::unpublished_dependency,
    .reason = "Package dependency \"" + name + "\" does not specify a published address (the manifest for \"" + name
              + "\" does not contain a published-at field).\nIf this is intentional, you may use the "
                "--with-unpublished-dependencies flag to continue publishing these dependencies as part of your "
                "package (they won't be linked against existing packages on-chain)." };
}

compiled_package::compiled_package( resolution_graph graph ):
    _graph( std::move( graph ) ),
    _dependencies( gather_dependencies( _graph ) )
{}

const resolution_graph& compiled_package::graph() const noexcept
{
  return _graph;
}

const dependency_split& compiled_package::dependencies() const noexcept
{
  return _dependencies;
}

std::vector< module_bytes > compiled_package::package_bytes( bool with_unpublished_dependencies ) const
{
  std::vector< module_bytes > bytes;

  if( with_unpublished_dependencies )
    for( const auto& name: _dependencies.unpublished )
      bytes.append_range( _graph.packages.at( name ).modules );

  bytes.append_range( _graph.root_package().modules );

  return bytes;
}

std::vector< protocol::object_id > compiled_package::dependency_ids() const
{
  std::set< protocol::object_id > ids;
  for( const auto& [ name, addr ]: _dependencies.published )
    ids.insert( addr );

  return { ids.begin(), ids.end() };
}

std::expected< protocol::publish, module_publish_failure >
compiled_package::publish_command( bool with_unpublished_dependencies ) const
{
  if( !with_unpublished_dependencies )
    if( auto failure = check_unpublished_dependencies( _dependencies.unpublished ); failure )
      return std::unexpected( std::move( *failure ) );

  return protocol::publish{ .modules      = package_bytes( with_unpublished_dependencies ),
                            .dependencies = dependency_ids() };
}

result< published_package > publish( const protocol::publish& command,
                                     const protocol::address& sender,
                                     const protocol::transaction_digest& digest,
                                     protocol::id_generator& ids,
                                     const package_lookup& lookup )
{
  package_contents contents;

  for( const auto& dependency: command.dependencies )
  {
    const auto* obj = lookup( dependency );
    if( !obj || !obj->is_package() )
    {
      LOG_DEBUG( objectum::log::instance(),
                 "Publish dependency {} not found",
                 objectum::log::hex{ dependency.data(), dependency.size() } );
      return std::unexpected( publish_errc::dependency_not_found );
    }

    contents.linkage.push_back( dependency );
  }

  for( const auto& m: command.modules )
  {
    auto header = decode_module_header( m );
    if( !header )
      return std::unexpected( protocol::execution_errc::vm_verification_or_deserialization_error );

    contents.modules.emplace( header->name, m );
  }

  published_package out;

  out.package.id                   = ids.next();
  out.package.owner                = protocol::immutable{};
  out.package.type                 = protocol::package_type();
  out.package.contents             = encode::bcs::to_bytes( contents );
  out.package.previous_transaction = digest;

  package::upgrade_cap cap{ .id = ids.next(), .package = out.package.id };

  out.upgrade_cap.id                   = cap.id;
  out.upgrade_cap.owner                = protocol::address_owner{ .address = sender };
  out.upgrade_cap.type                 = protocol::upgrade_cap_type();
  out.upgrade_cap.contents             = encode::bcs::to_bytes( cap );
  out.upgrade_cap.previous_transaction = digest;

  return out;
}

result< package_contents > decode_package( const protocol::object& obj )
{
  if( !obj.is_package() )
    return std::unexpected( package_errc::invalid_module_header );

  encode::bcs::reader r( obj.contents );
  package_contents contents;

  auto module_count = r.read_uleb128();
  if( !module_count )
    return std::unexpected( module_count.error() );

  for( std::uint32_t i = 0; i < *module_count; ++i )
  {
    auto name = r.read_string();
    if( !name )
      return std::unexpected( name.error() );

    auto bytes = r.read_sequence();
    if( !bytes )
      return std::unexpected( bytes.error() );

    contents.modules.emplace( std::move( *name ), std::move( *bytes ) );
  }

  auto linkage_count = r.read_uleb128();
  if( !linkage_count )
    return std::unexpected( linkage_count.error() );

  for( std::uint32_t i = 0; i < *linkage_count; ++i )
  {
    auto id = r.read_fixed< protocol::address_length >();
    if( !id )
      return std::unexpected( id.error() );

    contents.linkage.push_back( *id );
  }

  if( auto ec = r.finish(); ec )
    return std::unexpected( ec );

  return contents;
}

} // namespace objectum::package
