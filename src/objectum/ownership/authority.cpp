#include <objectum/ownership/authority.hpp>

#include <utility>

#include <objectum/util/overloaded.hpp>

namespace objectum::ownership {

void object_table::insert( protocol::object obj )
{
  auto id = obj.id;
  _objects.insert_or_assign( id, std::move( obj ) );
}

const protocol::object* object_table::find( const protocol::object_id& id ) const noexcept
{
  if( auto itr = _objects.find( id ); itr != _objects.end() )
    return &itr->second;

  return nullptr;
}

bool object_table::contains( const protocol::object_id& id ) const noexcept
{
  return _objects.contains( id );
}

std::size_t object_table::size() const noexcept
{
  return _objects.size();
}

namespace {

std::error_code authenticate_child( const protocol::object& obj,
                                    const protocol::object_id& parent,
                                    const authority& auth,
                                    std::set< protocol::object_id >& visited,
                                    std::size_t depth );

std::error_code authenticate_impl( const protocol::object& obj,
                                   const authority& auth,
                                   std::set< protocol::object_id >& visited,
                                   std::size_t depth )
{
  return std::visit(
    util::overloaded{ [ & ]( const protocol::address_owner& o ) -> std::error_code
                      {
                        if( o.address != auth.signer )
                          return ownership_errc::incorrect_signer;

                        return ownership_errc::ok;
                      },
                      [ & ]( const protocol::object_owner& o ) -> std::error_code
                      {
                        return authenticate_child( obj, o.parent, auth, visited, depth );
                      },
                      [ & ]( const protocol::shared& ) -> std::error_code
                      {
                        switch( auth.site )
                        {
                          case usage_site::shared_input:
                            return ownership_errc::ok;
                          case usage_site::vector_element:
                            return ownership_errc::shared_object_in_vector;
                          case usage_site::owned_input:
                            return ownership_errc::shared_object_requires_consensus;
                        }
                        std::unreachable();
                      },
                      [ & ]( const protocol::immutable& ) -> std::error_code
                      {
                        if( auth.mode == access_mode::mutate )
                          return ownership_errc::immutable_object_mutation;

                        return ownership_errc::ok;
                      } },
    obj.owner );
}

std::error_code authenticate_child( const protocol::object& obj,
                                    const protocol::object_id& parent,
                                    const authority& auth,
                                    std::set< protocol::object_id >& visited,
                                    std::size_t depth )
{
  visited.insert( obj.id );

  auto current = parent;
  while( true )
  {
    if( ++depth > auth.max_depth )
      return ownership_errc::ownership_chain_too_deep;

    if( visited.contains( current ) )
      return ownership_errc::ownership_cycle;

    const auto* ancestor = auth.objects.find( current );
    if( !ancestor )
      return ownership_errc::invalid_child_object_argument;

    if( auth.inputs.contains( current ) )
    {
      // The ancestor authorizes the chain through its own input path
      authority ancestor_auth{ .signer    = auth.signer,
                               .objects   = auth.objects,
                               .inputs    = auth.inputs,
                               .mode      = auth.mode,
                               .site      = protocol::is_shared( ancestor->owner ) ? usage_site::shared_input
                                                                                   : usage_site::owned_input,
                               .max_depth = auth.max_depth };
      return authenticate_impl( *ancestor, ancestor_auth, visited, depth );
    }

    visited.insert( current );

    const auto* next = std::get_if< protocol::object_owner >( &ancestor->owner );
    if( !next )
      return ownership_errc::invalid_child_object_argument;

    current = next->parent;
  }
}

} // namespace

std::error_code authenticate( const protocol::object& obj, const authority& auth )
{
  std::set< protocol::object_id > visited;
  return authenticate_impl( obj, auth, visited, 0 );
}

std::error_code validate_transition( const protocol::owner& before, const protocol::owner& after ) noexcept
{
  if( const auto* s = std::get_if< protocol::shared >( &before ) )
  {
    const auto* t = std::get_if< protocol::shared >( &after );
    if( !t )
      return ownership_errc::shared_object_unshared;

    if( s->initial_shared_version != t->initial_shared_version )
      return ownership_errc::shared_version_changed;

    return ownership_errc::ok;
  }

  if( protocol::is_immutable( before ) && !protocol::is_immutable( after ) )
    return ownership_errc::immutable_object_mutation;

  return ownership_errc::ok;
}

} // namespace objectum::ownership
