// NOLINTBEGIN

#include <test/fixture.hpp>

#include <algorithm>
#include <fstream>
#include <random>
#include <stdexcept>

#include <objectum/encode.hpp>
#include <objectum/log.hpp>

namespace test {

fixture::fixture( const std::string& name, const std::string& log_level, objectum::controller::options opts )
{
  objectum::log::initialize( objectum::log::level_from_string( log_level ).value_or( quill::LogLevel::Info ) );

  _store      = std::make_shared< objectum::store::memory_store >();
  _executor   = std::make_shared< objectum::execution::scripted_executor >();
  _controller = std::make_unique< objectum::controller::controller >( _store, _executor, opts );

  std::random_device rd;
  _package_dir = std::filesystem::temp_directory_path() / ( name + "-" + std::to_string( rd() ) );
  LOG_INFO( objectum::log::instance(), "Using temporary directory: {}", _package_dir.string() );
  std::filesystem::create_directories( _package_dir );
}

fixture::~fixture()
{
  std::error_code ec;
  std::filesystem::remove_all( _package_dir, ec );
}

objectum::protocol::type_tag fixture::thing_type()
{
  return objectum::protocol::type_tag::structure( objectum::protocol::make_address( 0xee ), "things", "Thing" );
}

objectum::protocol::object fixture::add_gas( const objectum::protocol::address& owner, std::uint64_t balance )
{
  auto coin = objectum::execution::make_gas_coin( objectum::protocol::make_address( _next_id++ ), owner, balance );
  _store->put( coin );
  return coin;
}

objectum::protocol::object fixture::add_object( objectum::protocol::owner owner,
                                                objectum::protocol::type_tag type,
                                                std::vector< std::byte > contents )
{
  objectum::protocol::object obj;
  obj.id       = objectum::protocol::make_address( _next_id++ );
  obj.version  = 1;
  obj.owner    = std::move( owner );
  obj.type     = std::move( type );
  obj.contents = std::move( contents );

  if( auto* s = std::get_if< objectum::protocol::shared >( &obj.owner ) )
    s->initial_shared_version = obj.version;

  _store->put( obj );
  return obj;
}

objectum::protocol::object fixture::latest( const objectum::protocol::object_id& id ) const
{
  auto obj = _store->get_latest( id );
  if( !obj )
    throw std::runtime_error( "object " + objectum::protocol::to_string( id ) + " is not live" );

  return *obj;
}

objectum::protocol::object_ref fixture::latest_ref( const objectum::protocol::object_id& id ) const
{
  auto ref = _store->get_latest_ref( id );
  if( !ref )
    throw std::runtime_error( "object " + objectum::protocol::to_string( id ) + " is unknown" );

  return *ref;
}

objectum::protocol::transaction fixture::make_transaction( objectum::protocol::transaction_builder& builder,
                                                           const objectum::protocol::address& sender,
                                                           const objectum::protocol::object_id& gas,
                                                           std::uint64_t budget,
                                                           std::uint64_t price ) const
{
  return builder.finish( sender, latest_ref( gas ), budget, price );
}

std::vector< objectum::protocol::object_id >
fixture::created_ids( const objectum::protocol::transaction& transaction, std::size_t count )
{
  objectum::protocol::id_generator ids( objectum::protocol::make_id( transaction ) );

  std::vector< objectum::protocol::object_id > out;
  for( std::size_t i = 0; i < count; ++i )
    out.push_back( ids.next() );

  return out;
}

objectum::controller::result< objectum::protocol::transaction_effects >
fixture::process( const objectum::protocol::transaction& transaction, objectum::execution::script s )
{
  bool executes = std::ranges::any_of( transaction.commands,
                                      []( const objectum::protocol::command& c )
                                      {
                                        return !std::holds_alternative< objectum::protocol::publish >( c );
                                      } );
  if( executes )
    _executor->push( std::move( s ) );

  auto effects = _controller->process( transaction );

  // A rejected transaction never reaches the executor
  _executor->clear();

  return effects;
}

std::filesystem::path fixture::write_package( const std::string& name,
                                              const std::vector< std::string >& modules,
                                              const std::map< std::string, std::string >& dependencies,
                                              const std::string& published_at ) const
{
  auto dir = _package_dir / name;
  std::filesystem::create_directories( dir / objectum::package::modules_directory );

  std::ofstream manifest( dir / objectum::package::manifest_file_name );
  manifest << "package:\n  name: " << name << "\n";
  if( !published_at.empty() )
    manifest << "  published-at: \"" << published_at << "\"\n";

  if( !dependencies.empty() )
  {
    manifest << "dependencies:\n";
    for( const auto& [ dep, path ]: dependencies )
      manifest << "  " << dep << ":\n    local: \"" << path << "\"\n";
  }

  for( const auto& m: modules )
  {
    auto bytes = objectum::package::make_module( m );
    std::ofstream out( dir / objectum::package::modules_directory / ( m + std::string( objectum::package::module_extension ) ),
                       std::ios::binary );
    out.write( reinterpret_cast< const char* >( bytes.data() ), static_cast< std::streamsize >( bytes.size() ) );
  }

  return dir;
}

bool fixture::verify( const objectum::controller::result< objectum::protocol::transaction_effects >& effects,
                      std::uint64_t flags ) const
{
  if( flags == verification::none )
    return true;

  if( !effects.has_value() )
  {
    LOG_ERROR( objectum::log::instance(), "Transaction submission has failed with: {}", effects.error().message() );
    return false;
  }

  if( flags & verification::succeeded )
  {
    if( !effects->status.success() )
    {
      LOG_ERROR( objectum::log::instance(),
                 "Transaction ID {} failed with: {}",
                 objectum::log::hex{ effects->transaction.data(), effects->transaction.size() },
                 effects->status.failure->error.message() );
      return false;
    }
  }

  return true;
}

} // namespace test

// NOLINTEND
