#include <objectum/protocol/effects.hpp>

#include <algorithm>

#include <objectum/encode/bcs.hpp>

namespace objectum::protocol {

bool execution_status::success() const noexcept
{
  return !failure.has_value();
}

crypto::digest transaction_effects::digest() const
{
  return crypto::hash( crypto::domain::effects, encode::bcs::to_bytes( *this ) );
}

namespace {

const object_ref* find_owned( const std::vector< owned_ref >& refs, const object_id& id ) noexcept
{
  auto itr = std::ranges::find_if( refs,
                                   [ & ]( const owned_ref& r )
                                   {
                                     return r.first.id == id;
                                   } );
  return itr == refs.end() ? nullptr : &itr->first;
}

const object_ref* find_ref( const std::vector< object_ref >& refs, const object_id& id ) noexcept
{
  auto itr = std::ranges::find( refs, id, &object_ref::id );
  return itr == refs.end() ? nullptr : &*itr;
}

} // namespace

std::optional< change_kind > transaction_effects::classification_of( const object_id& id ) const noexcept
{
  if( find_owned( created, id ) )
    return change_kind::created;
  if( find_owned( mutated, id ) )
    return change_kind::mutated;
  if( find_owned( unwrapped, id ) )
    return change_kind::unwrapped;
  if( find_ref( deleted, id ) )
    return change_kind::deleted;
  if( find_ref( wrapped, id ) )
    return change_kind::wrapped;
  if( find_ref( unwrapped_then_deleted, id ) )
    return change_kind::unwrapped_then_deleted;

  return std::nullopt;
}

std::optional< object_ref > transaction_effects::ref_of( const object_id& id ) const noexcept
{
  for( const auto* refs: { &created, &mutated, &unwrapped } )
    if( const auto* r = find_owned( *refs, id ) )
      return *r;

  for( const auto* refs: { &deleted, &wrapped, &unwrapped_then_deleted } )
    if( const auto* r = find_ref( *refs, id ) )
      return *r;

  return std::nullopt;
}

std::optional< sequence_number > transaction_effects::modified_at( const object_id& id ) const noexcept
{
  auto itr = std::ranges::find_if( modified_at_versions,
                                   [ & ]( const auto& entry )
                                   {
                                     return entry.first == id;
                                   } );
  if( itr == modified_at_versions.end() )
    return std::nullopt;

  return itr->second;
}

std::size_t transaction_effects::change_count() const noexcept
{
  return created.size() + mutated.size() + unwrapped.size() + deleted.size() + wrapped.size()
         + unwrapped_then_deleted.size();
}

} // namespace objectum::protocol
