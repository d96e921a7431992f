#include <objectum/execution/effects_builder.hpp>

#include <algorithm>
#include <vector>

#include <objectum/execution/gas.hpp>
#include <objectum/execution/version_assigner.hpp>
#include <objectum/log.hpp>
#include <objectum/ownership/authority.hpp>

namespace objectum::execution {

namespace {

using protocol::execution_errc;

const protocol::object* find_live( const effects_input& input, const protocol::object_id& id ) noexcept
{
  auto itr = input.pre_state.find( id );
  if( itr == input.pre_state.end() )
    return nullptr;

  return std::get_if< protocol::object >( &itr->second );
}

const protocol::tombstone* find_tombstone( const effects_input& input, const protocol::object_id& id ) noexcept
{
  auto itr = input.pre_state.find( id );
  if( itr == input.pre_state.end() )
    return nullptr;

  return std::get_if< protocol::tombstone >( &itr->second );
}

std::vector< protocol::sequence_number > dependency_versions( const effects_input& input )
{
  std::vector< protocol::sequence_number > versions;
  versions.reserve( input.pre_state.size() );

  for( const auto& [ id, entry ]: input.pre_state )
    versions.push_back( std::visit(
      []( const auto& e )
      {
        return e.version;
      },
      entry ) );

  return versions;
}

std::error_code check_raw_effects( const effects_input& input )
{
  const auto& raw = input.raw;

  auto known = [ & ]( const protocol::object_id& id )
  {
    return input.pre_state.contains( id ) || raw.minted.contains( id );
  };

  for( const auto& id: raw.minted )
    if( input.pre_state.contains( id ) )
      return execution_errc::invariant_violation;

  for( const auto& id: raw.surfaced )
    if( !raw.minted.contains( id ) )
      return execution_errc::invariant_violation;

  for( const auto& [ id, obj ]: raw.written )
  {
    if( obj.id != id || !known( id ) )
      return execution_errc::invariant_violation;

    if( raw.deleted.contains( id ) || raw.wrapped.contains( id ) )
      return execution_errc::invariant_violation;
  }

  for( const auto& [ id, container ]: raw.wrapped )
  {
    if( !known( id ) || id == container || id == input.gas_id || raw.deleted.contains( id ) )
      return execution_errc::invariant_violation;
  }

  for( const auto& id: raw.deleted )
    if( !known( id ) || id == input.gas_id )
      return execution_errc::invariant_violation;

  return {};
}

/**
 * Extends the explicit deletions with every descendant of a deleted object:
 * live children owned by it, tombstones wrapped in it and objects wrapped into
 * it by this transaction. Descendants written live by the transaction survive.
 */
std::error_code cascade( const effects_input& input,
                         std::set< protocol::object_id >& deleted,
                         std::map< protocol::object_id, protocol::object_id >& wrapped )
{
  std::vector< protocol::object_id > work( deleted.begin(), deleted.end() );
  std::size_t cascaded = 0;

  while( !work.empty() )
  {
    auto parent = work.back();
    work.pop_back();

    std::vector< protocol::object_id > descendants;

    for( const auto& [ id, entry ]: input.pre_state )
    {
      if( const auto* obj = std::get_if< protocol::object >( &entry ) )
      {
        const auto* owner = std::get_if< protocol::object_owner >( &obj->owner );
        if( owner && owner->parent == parent )
          descendants.push_back( id );
      }
      else if( std::get< protocol::tombstone >( entry ).container == parent )
        descendants.push_back( id );
    }

    for( const auto& [ child, container ]: wrapped )
      if( container == parent )
        descendants.push_back( child );

    for( const auto& d: descendants )
    {
      if( input.raw.written.contains( d ) || deleted.contains( d ) )
        continue;

      if( auto itr = wrapped.find( d ); itr != wrapped.end() && itr->second != parent )
        continue;

      if( d == input.gas_id )
        return execution_errc::invariant_violation;

      if( ++cascaded > input.max_cascade_size )
        return execution_errc::cascade_limit_exceeded;

      wrapped.erase( d );
      deleted.insert( d );
      work.push_back( d );
    }
  }

  return {};
}

class accumulator
{
public:
  accumulator( const effects_input& input ):
      _input( input ),
      _assigner( dependency_versions( input ) )
  {
    _outputs.effects.transaction     = input.digest;
    _outputs.effects.lamport_version = _assigner.version();
    _outputs.effects.gas_used        = input.gas_used;
  }

  protocol::sequence_number version() const noexcept
  {
    return _assigner.version();
  }

  std::error_code write_live( protocol::object post )
  {
    const auto* pre_live = find_live( _input, post.id );
    const auto* pre_tomb = find_tombstone( _input, post.id );

    protocol::sequence_number prior = 0;

    if( auto* s = std::get_if< protocol::shared >( &post.owner );
        s && ( !pre_live || !protocol::is_shared( pre_live->owner ) ) )
      s->initial_shared_version = version();

    if( pre_live )
    {
      if( auto ec = check_writable( *pre_live ); ec )
        return ec;

      if( auto ec = ownership::validate_transition( pre_live->owner, post.owner ); ec )
        return ec;

      prior = pre_live->version;
      _modified_at.emplace( post.id, prior );
    }
    else if( pre_tomb )
      prior = pre_tomb->version;

    if( post.id == _input.gas_id )
      if( auto ec = deduct( post, _input.gas_used.computation_cost ); ec )
        return ec;

    post.version              = _assigner.assign( post.id, prior );
    post.previous_transaction = _input.digest;

    protocol::owned_ref entry{ post.ref(), post.owner };

    if( pre_live )
      _outputs.effects.mutated.push_back( entry );
    else if( pre_tomb )
      _outputs.effects.unwrapped.push_back( entry );
    else
      _outputs.effects.created.push_back( entry );

    if( post.id == _input.gas_id )
      _outputs.effects.gas_object = entry;

    _outputs.written.emplace( post.id, std::move( post ) );
    return {};
  }

  std::error_code wrap( const protocol::object_id& id, const protocol::object_id& container )
  {
    if( const auto* pre = find_live( _input, id ) )
    {
      if( auto ec = check_writable( *pre ); ec )
        return ec;

      if( protocol::is_shared( pre->owner ) )
        return ownership::ownership_errc::shared_object_unshared;

      auto v = _assigner.assign( id, pre->version );
      _modified_at.emplace( id, pre->version );
      _outputs.effects.wrapped.push_back( { .id = id, .version = v, .digest = protocol::wrapped_digest } );
      _outputs.wrapped.emplace( id, protocol::tombstone{ .id = id, .version = v, .container = container } );
    }
    else if( const auto* tomb = find_tombstone( _input, id ) )
    {
      // Moved between containers while wrapped, the version is kept
      _outputs.wrapped.emplace( id, protocol::tombstone{ .id = id, .version = tomb->version, .container = container } );
    }
    else
    {
      auto v = _assigner.assign( id, 0 );
      _outputs.wrapped.emplace( id, protocol::tombstone{ .id = id, .version = v, .container = container } );
    }

    return {};
  }

  std::error_code remove( const protocol::object_id& id )
  {
    if( const auto* pre = find_live( _input, id ) )
    {
      if( auto ec = check_writable( *pre ); ec )
        return ec;

      auto v = _assigner.assign( id, pre->version );
      _modified_at.emplace( id, pre->version );
      _outputs.effects.deleted.push_back( { .id = id, .version = v, .digest = protocol::deleted_digest } );
      _outputs.deleted.emplace( id, v );
    }
    else if( const auto* tomb = find_tombstone( _input, id ) )
    {
      auto v = _assigner.assign( id, tomb->version );
      _outputs.effects.unwrapped_then_deleted.push_back(
        { .id = id, .version = v, .digest = protocol::deleted_digest } );
      _outputs.deleted.emplace( id, v );
    }
    else if( _input.raw.surfaced.contains( id ) )
    {
      auto v = _assigner.assign( id, 0 );
      _outputs.effects.deleted.push_back( { .id = id, .version = v, .digest = protocol::deleted_digest } );
      _outputs.deleted.emplace( id, v );
    }

    return {};
  }

  protocol::transaction_outputs finish( std::optional< protocol::execution_failure > failure )
  {
    auto& effects = _outputs.effects;

    effects.status.failure = std::move( failure );

    for( const auto& entry: _modified_at )
      effects.modified_at_versions.push_back( entry );

    std::set< protocol::transaction_digest > dependencies;
    for( const auto& [ id, entry ]: _input.pre_state )
      if( const auto* obj = std::get_if< protocol::object >( &entry ) )
        dependencies.insert( obj->previous_transaction );

    effects.dependencies.assign( dependencies.begin(), dependencies.end() );

    auto by_id = []( const auto& a, const auto& b )
    {
      return a.id < b.id;
    };
    std::ranges::sort( effects.wrapped, by_id );
    std::ranges::sort( effects.deleted, by_id );
    std::ranges::sort( effects.unwrapped_then_deleted, by_id );

    return std::move( _outputs );
  }

private:
  std::error_code check_writable( const protocol::object& pre ) const
  {
    if( protocol::is_immutable( pre.owner ) )
      return ownership::ownership_errc::immutable_object_mutation;

    if( _input.read_only_inputs.contains( pre.id ) )
      return ownership::ownership_errc::read_only_input_mutation;

    return {};
  }

  const effects_input& _input;
  version_assigner _assigner;
  std::map< protocol::object_id, protocol::sequence_number > _modified_at;
  protocol::transaction_outputs _outputs;
};

} // namespace

result< protocol::transaction_outputs > build_effects( const effects_input& input )
{
  const auto* gas = find_live( input, input.gas_id );
  if( !gas )
    return std::unexpected( execution_errc::invariant_violation );

  if( auto ec = check_raw_effects( input ); ec )
  {
    LOG_WARNING( objectum::log::instance(),
                 "Inconsistent write set for transaction {}",
                 objectum::log::hex{ input.digest.data(), input.digest.size() } );
    return std::unexpected( ec );
  }

  auto deleted = input.raw.deleted;
  auto wrapped = input.raw.wrapped;

  if( auto ec = cascade( input, deleted, wrapped ); ec )
    return std::unexpected( ec );

  // Live post-state: everything written, the gas object and every mutable input
  // that execution left alone
  auto live = input.raw.written;

  if( !live.contains( input.gas_id ) )
    live.emplace( input.gas_id, *gas );

  for( const auto& id: input.mutable_inputs )
  {
    if( live.contains( id ) || wrapped.contains( id ) || deleted.contains( id ) )
      continue;

    const auto* obj = find_live( input, id );
    if( !obj )
      return std::unexpected( execution_errc::invariant_violation );

    live.emplace( id, *obj );
  }

  accumulator acc( input );

  for( auto& [ id, obj ]: live )
    if( auto ec = acc.write_live( std::move( obj ) ); ec )
      return std::unexpected( ec );

  for( const auto& [ id, container ]: wrapped )
    if( auto ec = acc.wrap( id, container ); ec )
      return std::unexpected( ec );

  for( const auto& id: deleted )
    if( auto ec = acc.remove( id ); ec )
      return std::unexpected( ec );

  return acc.finish( std::nullopt );
}

result< protocol::transaction_outputs > build_failure_effects( const effects_input& input,
                                                               const protocol::execution_failure& failure )
{
  const auto* gas = find_live( input, input.gas_id );
  if( !gas )
    return std::unexpected( execution_errc::invariant_violation );

  std::map< protocol::object_id, protocol::object > live;
  live.emplace( input.gas_id, *gas );

  for( const auto& id: input.mutable_inputs )
  {
    const auto* obj = find_live( input, id );
    if( !obj )
      return std::unexpected( execution_errc::invariant_violation );

    live.emplace( id, *obj );
  }

  accumulator acc( input );

  for( auto& [ id, obj ]: live )
    if( auto ec = acc.write_live( std::move( obj ) ); ec )
      return std::unexpected( ec );

  return acc.finish( failure );
}

} // namespace objectum::execution
