#include "input_loader.hpp"

#include <limits>
#include <set>
#include <vector>

#include <objectum/execution/gas.hpp>
#include <objectum/log.hpp>

namespace objectum::controller {

using protocol::user_input_errc;

input_loader::input_loader( const store::object_store& store,
                            std::size_t max_ownership_depth,
                            std::size_t max_cascade_size ):
    _store( store ),
    _max_ownership_depth( max_ownership_depth ),
    _max_cascade_size( max_cascade_size )
{}

result< protocol::object > input_loader::load_owned( const protocol::object_ref& ref ) const
{
  auto obj = _store.get_latest( ref.id );
  if( !obj )
    return std::unexpected( user_input_errc::object_not_found );

  if( obj->version != ref.version )
    return std::unexpected( user_input_errc::object_version_mismatch );

  if( obj->digest() != ref.digest )
    return std::unexpected( user_input_errc::object_digest_mismatch );

  return obj;
}

void input_loader::load_ancestors( const protocol::object& obj, ownership::object_table& objects ) const
{
  const auto* owner = std::get_if< protocol::object_owner >( &obj.owner );

  for( std::size_t depth = 0; owner && depth < _max_ownership_depth; ++depth )
  {
    if( objects.contains( owner->parent ) )
      return;

    auto parent = _store.get_latest( owner->parent );
    if( !parent )
      return;

    objects.insert( *parent );
    owner = std::get_if< protocol::object_owner >( &objects.find( owner->parent )->owner );
  }
}

void input_loader::load_descendants( const protocol::object_id& id, ownership::object_table& objects ) const
{
  std::vector< protocol::object_id > work{ id };
  std::size_t loaded = 0;

  while( !work.empty() && loaded < _max_cascade_size )
  {
    auto parent = work.back();
    work.pop_back();

    for( const auto& child: _store.children_of( parent ) )
    {
      if( objects.contains( child ) )
        continue;

      if( auto obj = _store.get_latest( child ); obj )
      {
        objects.insert( std::move( *obj ) );
        work.push_back( child );
        ++loaded;
      }
    }
  }
}

std::error_code input_loader::authenticate( const protocol::transaction& transaction, const loaded_inputs& inputs ) const
{
  for( const auto& arg: transaction.inputs )
  {
    auto id = protocol::object_id_of( arg );
    if( !id )
      continue;

    const auto* obj = inputs.objects.find( *id );

    ownership::authority auth{ .signer    = transaction.sender,
                               .objects   = inputs.objects,
                               .inputs    = inputs.input_ids,
                               .mode      = inputs.mutable_inputs.contains( *id ) ? ownership::access_mode::mutate
                                                                                  : ownership::access_mode::read,
                               .site      = std::holds_alternative< protocol::shared_object_arg >( arg )
                                              ? ownership::usage_site::shared_input
                                              : ownership::usage_site::owned_input,
                               .max_depth = _max_ownership_depth };

    if( auto ec = ownership::authenticate( *obj, auth ); ec )
    {
      LOG_DEBUG( objectum::log::instance(),
                 "Input {} failed authentication: {}",
                 objectum::log::hex{ id->data(), id->size() },
                 ec.message() );
      return ec;
    }
  }

  return {};
}

result< loaded_inputs > input_loader::load( const protocol::transaction& transaction ) const
{
  if( transaction.inputs.size() > std::numeric_limits< std::uint16_t >::max() )
    return std::unexpected( controller_errc::malformed_transaction );

  loaded_inputs out;

  for( const auto& arg: transaction.inputs )
  {
    if( std::holds_alternative< protocol::pure_arg >( arg ) )
      continue;

    result< protocol::object > obj;

    if( const auto* owned = std::get_if< protocol::owned_object_arg >( &arg ) )
    {
      obj = load_owned( owned->ref );
      if( obj && protocol::is_shared( obj->owner ) )
        return std::unexpected( user_input_errc::shared_object_not_owned_input );
    }
    else
    {
      const auto& shared_arg = std::get< protocol::shared_object_arg >( arg );

      obj = _store.get_latest( shared_arg.id );
      if( !obj )
        return std::unexpected( user_input_errc::object_not_found );

      const auto* shared = std::get_if< protocol::shared >( &obj->owner );
      if( !shared )
        return std::unexpected( user_input_errc::not_shared_object );

      if( shared->initial_shared_version != shared_arg.initial_shared_version )
        return std::unexpected( user_input_errc::object_version_mismatch );
    }

    if( !obj )
      return std::unexpected( obj.error() );

    if( !out.input_ids.insert( obj->id ).second )
      return std::unexpected( user_input_errc::duplicate_object_input );

    const auto* shared_arg = std::get_if< protocol::shared_object_arg >( &arg );
    if( shared_arg ? shared_arg->is_mutable : !protocol::is_immutable( obj->owner ) )
      out.mutable_inputs.insert( obj->id );

    out.pre_state.emplace( obj->id, *obj );
    out.objects.insert( std::move( *obj ) );
  }

  const auto& payment = transaction.gas.payment;
  if( out.input_ids.contains( payment.id ) )
    return std::unexpected( user_input_errc::invalid_gas_object );

  auto gas = load_owned( payment );
  if( !gas )
    return std::unexpected( gas.error() );

  if( auto ec = execution::check_gas_payment( transaction.gas, *gas, transaction.sender ); ec )
    return std::unexpected( ec );

  out.pre_state.emplace( gas->id, *gas );
  out.objects.insert( std::move( *gas ) );

  for( const auto& id: out.input_ids )
    load_ancestors( *out.objects.find( id ), out.objects );

  for( const auto& id: out.mutable_inputs )
    load_descendants( id, out.objects );

  if( auto ec = authenticate( transaction, out ); ec )
    return std::unexpected( ec );

  return out;
}

void input_loader::expand( const execution::raw_effects& raw,
                           const ownership::object_table& objects,
                           std::map< protocol::object_id, execution::pre_entry >& pre_state ) const
{
  auto add = [ & ]( const protocol::object_id& id, bool from_store ) -> bool
  {
    if( pre_state.contains( id ) || raw.minted.contains( id ) )
      return false;

    if( const auto* obj = objects.find( id ) )
    {
      pre_state.emplace( id, *obj );
      return true;
    }

    if( auto tomb = _store.get_tombstone( id ); tomb )
    {
      pre_state.emplace( id, *tomb );
      return true;
    }

    if( !from_store )
      return false;

    if( auto obj = _store.get_latest( id ); obj )
    {
      pre_state.emplace( id, std::move( *obj ) );
      return true;
    }

    return false;
  };

  for( const auto& [ id, obj ]: raw.written )
    add( id, false );

  for( const auto& [ id, container ]: raw.wrapped )
    add( id, false );

  // Descendants of deleted objects, one past the cascade bound so that an
  // oversized cascade is still detected. Descendants already in the pre-state
  // are walked too, their own children may not be.
  std::vector< protocol::object_id > work( raw.deleted.begin(), raw.deleted.end() );
  std::set< protocol::object_id > visited( raw.deleted.begin(), raw.deleted.end() );
  std::size_t loaded = 0;

  for( const auto& id: raw.deleted )
    add( id, false );

  while( !work.empty() && loaded <= _max_cascade_size )
  {
    auto parent = work.back();
    work.pop_back();

    auto descendants = _store.children_of( parent );
    descendants.append_range( _store.wrapped_in( parent ) );

    for( const auto& d: descendants )
    {
      if( raw.minted.contains( d ) || !visited.insert( d ).second )
        continue;

      add( d, true );
      ++loaded;

      // Written live or moved elsewhere, the descendant survives with its subtree
      auto moved = raw.wrapped.find( d );
      if( raw.written.contains( d ) || ( moved != raw.wrapped.end() && moved->second != parent ) )
        continue;

      work.push_back( d );
    }
  }
}

} // namespace objectum::controller
