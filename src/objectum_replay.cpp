#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <objectum/controller.hpp>
#include <objectum/encode.hpp>
#include <objectum/execution.hpp>
#include <objectum/log.hpp>
#include <objectum/package.hpp>
#include <objectum/protocol.hpp>
#include <objectum/store.hpp>
#include <objectum/util/options.hpp>

namespace constants {

using namespace std::string_literals;

constexpr auto help_option                = "help,h"s;
constexpr auto version_option             = "version,v"s;
constexpr auto basedir_option             = "basedir,d"s;
constexpr auto basedir_default            = "."s;
constexpr auto scenario_option            = "scenario,s"s;
constexpr auto log_level_option           = "log-level,l"s;
constexpr auto log_level_default          = "info"s;
constexpr auto gas_price_option           = "gas-price"s;
constexpr auto command_cost_option        = "command-cost"s;
constexpr auto publish_cost_option        = "publish-cost"s;
const auto max_cascade_size_option        = "max-cascade-size"s;
const auto max_ownership_depth_option     = "max-ownership-depth"s;
constexpr auto lock_file_option           = "lock-file"s;
constexpr auto lock_file_default          = false;

} // namespace constants

using namespace boost;
using namespace objectum;

const std::string& version_string();

namespace {

template< typename T >
T required( const YAML::Node& node, const std::string& key )
{
  auto value = node[ key ];
  if( !value )
    throw std::runtime_error( "missing field '" + key + "'" );

  return value.as< T >();
}

protocol::address parse_address( const std::string& s )
{
  auto addr = protocol::address_from_string( s );
  if( !addr )
    throw std::runtime_error( "invalid address '" + s + "'" );

  return *addr;
}

std::vector< std::byte > parse_bytes( const std::string& s )
{
  auto bytes = encode::from_hex( s );
  if( !bytes )
    throw std::runtime_error( "invalid hex string '" + s + "': " + bytes.error().message() );

  return *bytes;
}

protocol::type_tag parse_type( const std::string& s )
{
  auto t = protocol::parse_type_tag( s );
  if( !t )
    throw std::runtime_error( "invalid type '" + s + "': " + t.error().message() );

  return *t;
}

protocol::owner parse_owner( const YAML::Node& node )
{
  if( node.IsScalar() )
  {
    if( node.Scalar() == "immutable" )
      return protocol::immutable{};

    if( node.Scalar() == "shared" )
      return protocol::shared{};

    throw std::runtime_error( "unknown owner '" + node.Scalar() + "'" );
  }

  if( node[ "address" ] )
    return protocol::address_owner{ .address = parse_address( node[ "address" ].as< std::string >() ) };

  if( node[ "object" ] )
    return protocol::object_owner{ .parent = parse_address( node[ "object" ].as< std::string >() ) };

  if( node[ "shared" ] )
    return protocol::shared{ .initial_shared_version = node[ "shared" ].as< protocol::sequence_number >() };

  throw std::runtime_error( "owner must name an address, an object, shared or immutable" );
}

execution::object_handle parse_handle( const std::string& s )
{
  constexpr std::string_view created_prefix = "created:";

  if( s.starts_with( created_prefix ) )
    return execution::created_index{ .index = std::stoul( s.substr( created_prefix.size() ) ) };

  return parse_address( s );
}

protocol::argument parse_argument( const std::string& s )
{
  if( s == "gas" )
    return protocol::gas_coin{};

  auto index = []( const std::string& n )
  {
    auto value = std::stoul( n );
    if( value > std::numeric_limits< std::uint16_t >::max() )
      throw std::runtime_error( "argument index " + n + " is out of range" );

    return static_cast< std::uint16_t >( value );
  };

  if( s.starts_with( "input:" ) )
    return protocol::input{ .index = index( s.substr( 6 ) ) };

  if( s.starts_with( "result:" ) )
  {
    auto rest = s.substr( 7 );
    if( auto pos = rest.find( ':' ); pos != std::string::npos )
      return protocol::nested_result{ .command = index( rest.substr( 0, pos ) ), .index = index( rest.substr( pos + 1 ) ) };

    return protocol::command_result{ .command = index( rest ) };
  }

  throw std::runtime_error( "unknown argument '" + s + "'" );
}

std::vector< protocol::argument > parse_arguments( const YAML::Node& node )
{
  std::vector< protocol::argument > args;
  for( const auto& a: node )
    args.push_back( parse_argument( a.as< std::string >() ) );

  return args;
}

void load_genesis( store::object_store& db, const YAML::Node& objects )
{
  for( const auto& node: objects )
  {
    auto id = parse_address( required< std::string >( node, "id" ) );

    if( auto gas = node[ "gas" ] )
    {
      db.put( execution::make_gas_coin( id,
                                        parse_address( required< std::string >( gas, "owner" ) ),
                                        required< std::uint64_t >( gas, "balance" ) ) );
      continue;
    }

    protocol::object obj;
    obj.id      = id;
    obj.version = node[ "version" ] ? node[ "version" ].as< protocol::sequence_number >() : 1;
    obj.owner   = parse_owner( required< YAML::Node >( node, "owner" ) );
    obj.type    = parse_type( required< std::string >( node, "type" ) );
    if( node[ "contents" ] )
      obj.contents = parse_bytes( node[ "contents" ].as< std::string >() );

    if( auto* s = std::get_if< protocol::shared >( &obj.owner ); s && !s->initial_shared_version )
      s->initial_shared_version = obj.version;

    db.put( std::move( obj ) );
  }
}

protocol::publish
parse_publish( const YAML::Node& node, const std::filesystem::path& scenario_dir, bool write_lock )
{
  if( node[ "modules" ] )
  {
    protocol::publish command;
    for( const auto& m: node[ "modules" ] )
      command.modules.push_back( parse_bytes( m.as< std::string >() ) );

    if( node[ "dependencies" ] )
      for( const auto& d: node[ "dependencies" ] )
        command.dependencies.push_back( parse_address( d.as< std::string >() ) );

    return command;
  }

  auto dir = std::filesystem::path( required< std::string >( node, "package" ) );
  if( dir.is_relative() )
    dir = scenario_dir / dir;

  auto graph = package::resolve_package( dir );
  if( !graph )
    throw std::runtime_error( "unable to resolve package at " + dir.string() + ": " + graph.error().message() );

  if( write_lock )
  {
    if( auto ec = package::write_lock_file( *graph, dir / package::lock_file_name ); ec )
      throw std::runtime_error( "unable to write lock file: " + ec.message() );
  }

  bool with_unpublished =
    node[ "with-unpublished-dependencies" ] && node[ "with-unpublished-dependencies" ].as< bool >();

  package::compiled_package compiled( std::move( *graph ) );
  auto command = compiled.publish_command( with_unpublished );
  if( !command )
    throw std::runtime_error( command.error().reason );

  return *command;
}

protocol::command parse_command( const YAML::Node& node, const std::filesystem::path& scenario_dir, bool write_lock )
{
  if( auto call = node[ "move_call" ] )
  {
    protocol::move_call c;
    c.package     = parse_address( required< std::string >( call, "package" ) );
    c.module_name = required< std::string >( call, "module" );
    c.function    = required< std::string >( call, "function" );
    c.arguments   = parse_arguments( call[ "arguments" ] );
    for( const auto& t: call[ "type_arguments" ] )
      c.type_arguments.push_back( parse_type( t.as< std::string >() ) );

    return c;
  }

  if( auto vec = node[ "make_move_vec" ] )
  {
    protocol::make_move_vec c;
    if( vec[ "type" ] )
      c.type = parse_type( vec[ "type" ].as< std::string >() );
    c.elements = parse_arguments( vec[ "elements" ] );
    return c;
  }

  if( auto transfer = node[ "transfer_objects" ] )
  {
    protocol::transfer_objects c;
    c.objects   = parse_arguments( transfer[ "objects" ] );
    c.recipient = parse_argument( required< std::string >( transfer, "recipient" ) );
    return c;
  }

  if( auto publish = node[ "publish" ] )
    return parse_publish( publish, scenario_dir, write_lock );

  throw std::runtime_error( "unknown command" );
}

protocol::call_arg parse_input( const store::object_store& db, const YAML::Node& node )
{
  if( node[ "pure" ] )
    return protocol::pure_arg{ .bytes = parse_bytes( node[ "pure" ].as< std::string >() ) };

  if( node[ "object" ] )
  {
    auto id  = parse_address( node[ "object" ].as< std::string >() );
    auto ref = db.get_latest_ref( id );
    if( !ref )
      throw std::runtime_error( "unknown input object " + protocol::to_string( id ) );

    return protocol::owned_object_arg{ .ref = *ref };
  }

  if( node[ "shared" ] )
  {
    auto id  = parse_address( node[ "shared" ].as< std::string >() );
    auto obj = db.get_latest( id );
    if( !obj )
      throw std::runtime_error( "unknown shared object " + protocol::to_string( id ) );

    const auto* shared = std::get_if< protocol::shared >( &obj->owner );

    return protocol::shared_object_arg{ .id                     = id,
                                        .initial_shared_version = shared ? shared->initial_shared_version : 0,
                                        .is_mutable = !node[ "mutable" ] || node[ "mutable" ].as< bool >() };
  }

  throw std::runtime_error( "input must be pure, object or shared" );
}

execution::script parse_script( const YAML::Node& node )
{
  execution::script s;
  if( !node )
    return s;

  if( node[ "computation_units" ] )
    s.computation_units = node[ "computation_units" ].as< std::uint64_t >();

  if( auto failure = node[ "abort" ] )
    s.failure = protocol::execution_failure{ .error    = protocol::execution_errc::executor_aborted,
                                             .command  = failure[ "command" ].as< std::uint16_t >(),
                                             .argument = std::nullopt };

  for( const auto& w: node[ "writes" ] )
  {
    execution::scripted_write write{ .id = parse_address( required< std::string >( w, "id" ) ) };
    if( w[ "owner" ] )
      write.owner = parse_owner( w[ "owner" ] );
    if( w[ "type" ] )
      write.type = parse_type( w[ "type" ].as< std::string >() );
    if( w[ "contents" ] )
      write.contents = parse_bytes( w[ "contents" ].as< std::string >() );

    s.writes.push_back( std::move( write ) );
  }

  for( const auto& c: node[ "creations" ] )
  {
    execution::scripted_creation creation;
    creation.type = parse_type( required< std::string >( c, "type" ) );
    if( c[ "owner" ] )
      creation.owner = parse_owner( c[ "owner" ] );
    if( c[ "contents" ] )
      creation.contents = parse_bytes( c[ "contents" ].as< std::string >() );
    if( c[ "wrapped_in" ] )
      creation.wrapped_in = parse_handle( c[ "wrapped_in" ].as< std::string >() );
    creation.deleted  = c[ "deleted" ] && c[ "deleted" ].as< bool >();
    creation.surfaced = c[ "surfaced" ] && c[ "surfaced" ].as< bool >();

    s.creations.push_back( std::move( creation ) );
  }

  for( const auto& w: node[ "wraps" ] )
    s.wraps.emplace_back( parse_handle( required< std::string >( w, "object" ) ),
                          parse_handle( required< std::string >( w, "container" ) ) );

  for( const auto& d: node[ "deletions" ] )
    s.deletions.push_back( parse_handle( d.as< std::string >() ) );

  return s;
}

protocol::transaction parse_transaction( const store::object_store& db,
                                         const YAML::Node& node,
                                         const std::filesystem::path& scenario_dir,
                                         bool write_lock )
{
  protocol::transaction tx;
  tx.sender = parse_address( required< std::string >( node, "sender" ) );

  for( const auto& input: node[ "inputs" ] )
    tx.inputs.push_back( parse_input( db, input ) );

  for( const auto& command: node[ "commands" ] )
    tx.commands.push_back( parse_command( command, scenario_dir, write_lock ) );

  auto gas_id = parse_address( required< std::string >( node, "gas" ) );
  auto gas    = db.get_latest_ref( gas_id );
  if( !gas )
    throw std::runtime_error( "unknown gas object " + protocol::to_string( gas_id ) );

  tx.gas.payment = *gas;
  tx.gas.owner   = tx.sender;
  tx.gas.budget  = required< std::uint64_t >( node, "budget" );
  tx.gas.price   = node[ "price" ] ? node[ "price" ].as< std::uint64_t >() : 1;

  return tx;
}

void emit_refs( YAML::Emitter& out, const char* key, const std::vector< protocol::owned_ref >& refs )
{
  if( refs.empty() )
    return;

  out << YAML::Key << key << YAML::Value << YAML::BeginSeq;
  for( const auto& [ ref, owner ]: refs )
    out << YAML::Flow << YAML::BeginSeq << protocol::to_string( ref.id ) << ref.version << protocol::to_string( owner )
        << YAML::EndSeq;
  out << YAML::EndSeq;
}

void emit_refs( YAML::Emitter& out, const char* key, const std::vector< protocol::object_ref >& refs )
{
  if( refs.empty() )
    return;

  out << YAML::Key << key << YAML::Value << YAML::BeginSeq;
  for( const auto& ref: refs )
    out << YAML::Flow << YAML::BeginSeq << protocol::to_string( ref.id ) << ref.version << YAML::EndSeq;
  out << YAML::EndSeq;
}

std::string render( const protocol::transaction_effects& effects )
{
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "transaction" << YAML::Value << encode::to_hex( effects.transaction );
  out << YAML::Key << "digest" << YAML::Value << encode::to_hex( effects.digest() );

  out << YAML::Key << "status" << YAML::Value;
  if( effects.status.success() )
    out << "success";
  else
  {
    const auto& failure = *effects.status.failure;
    out << YAML::BeginMap;
    out << YAML::Key << "error" << YAML::Value << failure.error.message();
    if( failure.command )
      out << YAML::Key << "command" << YAML::Value << *failure.command;
    if( failure.argument )
      out << YAML::Key << "argument" << YAML::Value << *failure.argument;
    out << YAML::EndMap;
  }

  out << YAML::Key << "lamport_version" << YAML::Value << effects.lamport_version;
  out << YAML::Key << "gas_used" << YAML::Value << effects.gas_used.computation_cost;

  emit_refs( out, "created", effects.created );
  emit_refs( out, "mutated", effects.mutated );
  emit_refs( out, "unwrapped", effects.unwrapped );
  emit_refs( out, "deleted", effects.deleted );
  emit_refs( out, "wrapped", effects.wrapped );
  emit_refs( out, "unwrapped_then_deleted", effects.unwrapped_then_deleted );

  out << YAML::EndMap;
  return out.c_str();
}

} // namespace

int main( int argc, char** argv )
{
  std::string log_level;
  std::filesystem::path scenario_file;
  controller::options opts;
  bool write_lock = false;

  try
  {
    program_options::options_description options;

    // clang-format off
    options.add_options()
      ( constants::help_option.data()               , "Print this help message and exit" )
      ( constants::version_option.data()            , "Print version string and exit" )
      ( constants::basedir_option.data()            , program_options::value< std::string >()->default_value( constants::basedir_default ), "The base directory holding config.yml" )
      ( constants::scenario_option.data()           , program_options::value< std::string >()  , "The scenario to replay" )
      ( constants::log_level_option.data()          , program_options::value< std::string >()  , "The log filtering level" )
      ( constants::gas_price_option.data()          , program_options::value< std::uint64_t >(), "The reference gas price" )
      ( constants::command_cost_option.data()       , program_options::value< std::uint64_t >(), "Computation units charged per command" )
      ( constants::publish_cost_option.data()       , program_options::value< std::uint64_t >(), "Computation units charged per publish" )
      ( constants::max_cascade_size_option.data()   , program_options::value< std::size_t >()  , "The most objects a single deletion may cascade to" )
      ( constants::max_ownership_depth_option.data(), program_options::value< std::size_t >()  , "The longest parent chain that is followed" )
      ( constants::lock_file_option.data()          , program_options::value< bool >()         , "Write a lock file next to each published package" );
    // clang-format on

    program_options::variables_map args;
    program_options::store( program_options::parse_command_line( argc, argv, options ), args );

    if( args.count( util::option_key( constants::help_option ) ) )
    {
      std::cout << options << '\n';
      return EXIT_SUCCESS;
    }

    if( args.count( util::option_key( constants::version_option ) ) )
    {
      std::cout << version_string() << "\n";
      return EXIT_SUCCESS;
    }

    auto basedir = std::filesystem::path( args[ util::option_key( constants::basedir_option ) ].as< std::string >() );
    if( basedir.is_relative() )
      basedir = std::filesystem::current_path() / basedir;

    YAML::Node config;
    YAML::Node global_config;
    YAML::Node replay_config;

    auto yaml_config = basedir / "config.yml";
    if( !std::filesystem::exists( yaml_config ) )
    {
      yaml_config = basedir / "config.yaml";
    }

    if( std::filesystem::exists( yaml_config ) )
    {
      config        = YAML::LoadFile( yaml_config.string() );
      global_config = config[ "global" ];
      replay_config = config[ util::service::replay ];
    }

    // clang-format off
    log_level                = util::get_option< std::string >( constants::log_level_option, constants::log_level_default, args, replay_config, global_config );
    scenario_file            = std::filesystem::path( util::get_option< std::string >( constants::scenario_option, "", args, replay_config, global_config ) );
    opts.reference_gas_price = util::get_option< std::uint64_t >( constants::gas_price_option, opts.reference_gas_price, args, replay_config, global_config );
    opts.command_cost        = util::get_option< std::uint64_t >( constants::command_cost_option, opts.command_cost, args, replay_config, global_config );
    opts.publish_cost        = util::get_option< std::uint64_t >( constants::publish_cost_option, opts.publish_cost, args, replay_config, global_config );
    opts.max_cascade_size    = util::get_option< std::size_t >( constants::max_cascade_size_option, opts.max_cascade_size, args, replay_config, global_config );
    opts.max_ownership_depth = util::get_option< std::size_t >( constants::max_ownership_depth_option, opts.max_ownership_depth, args, replay_config, global_config );
    write_lock               = util::get_option< bool >( constants::lock_file_option, constants::lock_file_default, args, replay_config, global_config );
    // clang-format on

    auto level = objectum::log::level_from_string( log_level );
    if( !level )
      throw std::runtime_error( log_level + " is not a valid log level" );

    objectum::log::initialize( *level );

    LOG_INFO( objectum::log::instance(), "{}", version_string() );

    if( config.IsNull() )
    {
      LOG_WARNING( objectum::log::instance(),
                   "Could not find config (config.yml or config.yaml expected). Using default values" );
    }

    if( scenario_file.empty() )
      throw std::runtime_error( "a scenario file is required" );

    if( scenario_file.is_relative() )
      scenario_file = std::filesystem::current_path() / scenario_file;

    if( !std::filesystem::exists( scenario_file ) )
      throw std::runtime_error( "unable to locate scenario at " + scenario_file.string() );

    LOG_INFO( objectum::log::instance(),
              "Reference gas price: {}, command cost: {}, publish cost: {}",
              opts.reference_gas_price,
              opts.command_cost,
              opts.publish_cost );
    LOG_INFO( objectum::log::instance(),
              "Max cascade size: {}, max ownership depth: {}",
              opts.max_cascade_size,
              opts.max_ownership_depth );
  }
  catch( const std::exception& e )
  {
    LOG_ERROR( objectum::log::instance(), "Invalid argument: {}", e.what() );
    return EXIT_FAILURE;
  }

  int retcode = EXIT_SUCCESS;

  try
  {
    auto scenario = YAML::LoadFile( scenario_file.string() );

    auto db       = std::make_shared< store::memory_store >();
    auto executor = std::make_shared< execution::scripted_executor >();
    controller::controller chain( db, executor, opts );

    load_genesis( *db, scenario[ "objects" ] );
    LOG_INFO( objectum::log::instance(), "Loaded {} genesis objects", db->size() );

    for( const auto& node: scenario[ "transactions" ] )
    {
      auto tx = parse_transaction( *db, node, scenario_file.parent_path(), write_lock );

      executor->clear();
      executor->push( parse_script( node[ "script" ] ) );

      auto effects = chain.process( tx );
      if( !effects )
      {
        std::cout << "rejected: " << effects.error().message() << "\n---\n";
        continue;
      }

      std::cout << render( *effects ) << "\n---\n";
    }
  }
  catch( const std::exception& e )
  {
    LOG_ERROR( objectum::log::instance(), "An unexpected error has occurred: {}", e.what() );
    retcode = EXIT_FAILURE;
  }

  return retcode;
}

const std::string& version_string()
{
  static const std::string v_str = "Objectum Replay v" + std::to_string( PROJECT_MAJOR_VERSION ) + "."
                                   + std::to_string( PROJECT_MINOR_VERSION ) + "."
                                   + std::to_string( PROJECT_PATCH_VERSION );
  return v_str;
}
