#include <objectum/protocol/transaction.hpp>

#include <limits>
#include <stdexcept>
#include <utility>

namespace objectum::protocol {

std::optional< object_id > object_id_of( const call_arg& arg ) noexcept
{
  if( const auto* owned = std::get_if< owned_object_arg >( &arg ) )
    return owned->ref.id;

  if( const auto* shared = std::get_if< shared_object_arg >( &arg ) )
    return shared->id;

  return std::nullopt;
}

std::size_t transaction::size() const noexcept
{
  std::size_t bytes = 0;

  bytes += sender.size();
  bytes += sizeof( gas.price ) + sizeof( gas.budget ) + gas.owner.size();

  for( const auto& arg: inputs )
  {
    if( const auto* pure = std::get_if< pure_arg >( &arg ) )
      bytes += pure->bytes.size();
    else
      bytes += address_length + sizeof( sequence_number );
  }

  for( const auto& c: commands )
  {
    if( const auto* p = std::get_if< protocol::publish >( &c ) )
    {
      for( const auto& m: p->modules )
        bytes += m.size();
      bytes += p->dependencies.size() * address_length;
    }
    else
      bytes += sizeof( std::uint16_t );
  }

  return bytes;
}

transaction_digest make_id( const transaction& t )
{
  return crypto::hash( crypto::domain::transaction, encode::bcs::to_bytes( t ) );
}

static std::uint16_t checked_index( std::size_t size )
{
  if( size >= std::numeric_limits< std::uint16_t >::max() )
    throw std::length_error( "transaction index space exhausted" );

  return static_cast< std::uint16_t >( size );
}

argument transaction_builder::pure_bytes( std::vector< std::byte > bytes )
{
  auto index = checked_index( _inputs.size() );
  _inputs.emplace_back( pure_arg{ .bytes = std::move( bytes ) } );
  return input{ .index = index };
}

argument transaction_builder::owned_object( const object_ref& ref )
{
  if( auto itr = _object_inputs.find( ref.id ); itr != _object_inputs.end() )
  {
    const auto* existing = std::get_if< owned_object_arg >( &_inputs[ itr->second ] );
    if( !existing || existing->ref != ref )
      throw std::invalid_argument( "object added as input twice with different references" );

    return input{ .index = itr->second };
  }

  auto index = checked_index( _inputs.size() );
  _inputs.emplace_back( owned_object_arg{ .ref = ref } );
  _object_inputs.emplace( ref.id, index );
  return input{ .index = index };
}

argument
transaction_builder::shared_object( const object_id& id, sequence_number initial_shared_version, bool is_mutable )
{
  if( auto itr = _object_inputs.find( id ); itr != _object_inputs.end() )
  {
    auto* existing = std::get_if< shared_object_arg >( &_inputs[ itr->second ] );
    if( !existing || existing->initial_shared_version != initial_shared_version )
      throw std::invalid_argument( "object added as input twice with different references" );

    existing->is_mutable = existing->is_mutable || is_mutable;
    return input{ .index = itr->second };
  }

  auto index = checked_index( _inputs.size() );
  _inputs.emplace_back(
    shared_object_arg{ .id = id, .initial_shared_version = initial_shared_version, .is_mutable = is_mutable } );
  _object_inputs.emplace( id, index );
  return input{ .index = index };
}

argument transaction_builder::command( protocol::command c )
{
  auto index = checked_index( _commands.size() );
  _commands.push_back( std::move( c ) );
  return command_result{ .command = index };
}

argument transaction_builder::move_call( const address& package,
                                         std::string module_name,
                                         std::string function,
                                         std::vector< argument > arguments,
                                         std::vector< type_tag > type_arguments )
{
  return command( protocol::move_call{ .package        = package,
                                       .module_name    = std::move( module_name ),
                                       .function       = std::move( function ),
                                       .type_arguments = std::move( type_arguments ),
                                       .arguments      = std::move( arguments ) } );
}

argument transaction_builder::make_move_vec( std::optional< type_tag > type, std::vector< argument > elements )
{
  return command( protocol::make_move_vec{ .type = std::move( type ), .elements = std::move( elements ) } );
}

argument transaction_builder::transfer_objects( std::vector< argument > objects, argument recipient )
{
  return command( protocol::transfer_objects{ .objects = std::move( objects ), .recipient = recipient } );
}

argument transaction_builder::publish( std::vector< std::vector< std::byte > > modules,
                                       std::vector< object_id > dependencies )
{
  return command( protocol::publish{ .modules = std::move( modules ), .dependencies = std::move( dependencies ) } );
}

transaction transaction_builder::finish( const address& sender,
                                         const object_ref& gas_payment,
                                         std::uint64_t budget,
                                         std::uint64_t price )
{
  transaction t;
  t.sender   = sender;
  t.inputs   = std::move( _inputs );
  t.commands = std::move( _commands );
  t.gas      = gas_data{ .payment = gas_payment, .owner = sender, .price = price, .budget = budget };

  _inputs.clear();
  _object_inputs.clear();
  _commands.clear();

  return t;
}

} // namespace objectum::protocol
