#include <objectum/store/memory_store.hpp>

#include <format>
#include <stdexcept>

#include <objectum/encode/hex.hpp>
#include <objectum/log.hpp>

namespace objectum::store {

memory_store::memory_store() = default;

memory_store::~memory_store() = default;

protocol::sequence_number memory_store::version_of( const latest_state& state ) noexcept
{
  return std::visit(
    []( const auto& s )
    {
      return s.version;
    },
    state );
}

result< protocol::object > memory_store::get_latest( const protocol::object_id& id ) const
{
  if( auto itr = _latest.find( id ); itr != _latest.end() )
    if( const auto* obj = std::get_if< protocol::object >( &itr->second ) )
      return *obj;

  return std::unexpected( store_errc::object_not_found );
}

result< protocol::object_ref > memory_store::get_latest_ref( const protocol::object_id& id ) const
{
  auto itr = _latest.find( id );
  if( itr == _latest.end() )
    return std::unexpected( store_errc::object_not_found );

  if( const auto* obj = std::get_if< protocol::object >( &itr->second ) )
    return obj->ref();

  if( const auto* tomb = std::get_if< protocol::tombstone >( &itr->second ) )
    return tomb->ref();

  return protocol::object_ref{ .id      = id,
                               .version = std::get< deletion >( itr->second ).version,
                               .digest  = protocol::deleted_digest };
}

result< protocol::object > memory_store::get( const protocol::object_id& id, protocol::sequence_number version ) const
{
  if( auto itr = _versions.find( { id, version } ); itr != _versions.end() )
    return itr->second;

  if( !_latest.contains( id ) )
    return std::unexpected( store_errc::object_not_found );

  return std::unexpected( store_errc::version_not_found );
}

result< protocol::tombstone > memory_store::get_tombstone( const protocol::object_id& id ) const
{
  if( auto itr = _latest.find( id ); itr != _latest.end() )
    if( const auto* tomb = std::get_if< protocol::tombstone >( &itr->second ) )
      return *tomb;

  return std::unexpected( store_errc::object_not_found );
}

result< protocol::transaction_effects > memory_store::get_effects( const protocol::transaction_digest& digest ) const
{
  if( auto itr = _effects.find( digest ); itr != _effects.end() )
    return itr->second;

  return std::unexpected( store_errc::effects_not_found );
}

std::vector< protocol::object_id > memory_store::children_of( const protocol::object_id& parent ) const
{
  std::vector< protocol::object_id > children;

  for( const auto& [ id, state ]: _latest )
  {
    const auto* obj = std::get_if< protocol::object >( &state );
    if( !obj )
      continue;

    if( const auto* owner = std::get_if< protocol::object_owner >( &obj->owner ); owner && owner->parent == parent )
      children.push_back( id );
  }

  return children;
}

std::vector< protocol::object_id > memory_store::wrapped_in( const protocol::object_id& container ) const
{
  std::vector< protocol::object_id > wrapped;

  for( const auto& [ id, state ]: _latest )
    if( const auto* tomb = std::get_if< protocol::tombstone >( &state ); tomb && tomb->container == container )
      wrapped.push_back( id );

  return wrapped;
}

void memory_store::put( protocol::object obj )
{
  if( _latest.contains( obj.id ) )
    throw std::runtime_error( std::format( "object {} already exists", encode::to_hex( obj.id ) ) );

  auto id      = obj.id;
  auto version = obj.version;

  _versions.emplace( std::make_pair( id, version ), obj );
  _latest.emplace( id, std::move( obj ) );
  increment_revision();
}

void memory_store::check_increasing( const protocol::object_id& id,
                                     protocol::sequence_number version,
                                     bool strict ) const
{
  if( _versions.contains( { id, version } ) )
    throw std::runtime_error(
      std::format( "version {} of object {} is already committed", version, encode::to_hex( id ) ) );

  auto itr = _latest.find( id );
  if( itr == _latest.end() )
    return;

  auto latest = version_of( itr->second );
  if( latest > version || ( strict && latest == version ) )
    throw std::runtime_error(
      std::format( "object {} at version {} cannot move to version {}", encode::to_hex( id ), latest, version ) );
}

void memory_store::start_write_batch()
{
  _staged.clear();
}

void memory_store::end_write_batch()
{
  for( auto& [ id, state ]: _staged )
  {
    if( const auto* obj = std::get_if< protocol::object >( &state ) )
      _versions.emplace( std::make_pair( id, obj->version ), *obj );

    _latest.insert_or_assign( id, std::move( state ) );
  }

  _staged.clear();
  increment_revision();
}

void memory_store::commit( const protocol::transaction_outputs& outputs )
{
  const auto& digest = outputs.effects.transaction;

  if( _effects.contains( digest ) )
    throw std::runtime_error( std::format( "transaction {} is already committed", encode::to_hex( digest ) ) );

  start_write_batch();

  for( const auto& [ id, obj ]: outputs.written )
  {
    check_increasing( id, obj.version, true );
    _staged.insert_or_assign( id, obj );
  }

  // A tombstone moved to another container keeps its version
  for( const auto& [ id, tomb ]: outputs.wrapped )
  {
    check_increasing( id, tomb.version, false );
    _staged.insert_or_assign( id, tomb );
  }

  for( const auto& [ id, version ]: outputs.deleted )
  {
    check_increasing( id, version, true );
    _staged.insert_or_assign( id, deletion{ version } );
  }

  end_write_batch();
  _effects.emplace( digest, outputs.effects );

  LOG_DEBUG( objectum::log::instance(),
             "Committed transaction {} at revision {} ({} written, {} wrapped, {} deleted)",
             objectum::log::hex{ digest.data(), digest.size() },
             revision(),
             outputs.written.size(),
             outputs.wrapped.size(),
             outputs.deleted.size() );
}

std::size_t memory_store::size() const noexcept
{
  return _latest.size();
}

} // namespace objectum::store
