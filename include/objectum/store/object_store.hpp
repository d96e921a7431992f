#pragma once

#include <cstdint>
#include <vector>

#include <objectum/protocol/effects.hpp>
#include <objectum/protocol/object.hpp>
#include <objectum/protocol/types.hpp>
#include <objectum/store/error.hpp>

namespace objectum::store {

/**
 * Versioned object storage. Every committed version of a live object stays
 * readable by (id, version). The latest state of an id is either a live
 * object, the tombstone of a wrapped object or a deletion marker.
 */
class object_store
{
public:
  object_store()                                 = default;
  object_store( const object_store& )            = delete;
  object_store( object_store&& )                 = delete;
  object_store& operator=( const object_store& ) = delete;
  object_store& operator=( object_store&& )      = delete;
  virtual ~object_store()                        = default;

  /**
   * The latest live version of `id`. Wrapped and deleted objects are not
   * found.
   */
  virtual result< protocol::object > get_latest( const protocol::object_id& id ) const = 0;

  /**
   * The latest ref of `id`, carrying the wrapped or deleted sentinel when the
   * object is no longer live.
   */
  virtual result< protocol::object_ref > get_latest_ref( const protocol::object_id& id ) const = 0;

  virtual result< protocol::object > get( const protocol::object_id& id, protocol::sequence_number version ) const = 0;
  virtual result< protocol::tombstone > get_tombstone( const protocol::object_id& id ) const                    = 0;
  virtual result< protocol::transaction_effects > get_effects( const protocol::transaction_digest& digest ) const = 0;

  /// Ids of the live objects directly owned by `parent`.
  virtual std::vector< protocol::object_id > children_of( const protocol::object_id& parent ) const = 0;

  /// Ids of the objects currently wrapped inside `container`.
  virtual std::vector< protocol::object_id > wrapped_in( const protocol::object_id& container ) const = 0;

  /**
   * Inserts an object outside of any transaction, used to seed genesis state.
   * Throws std::runtime_error if the id already exists.
   */
  virtual void put( protocol::object obj ) = 0;

  /**
   * Applies every change of one transaction, or none of them. Throws
   * std::runtime_error if a version was already committed or would not
   * increase.
   */
  virtual void commit( const protocol::transaction_outputs& outputs ) = 0;

  std::uint64_t revision() const noexcept;

protected:
  void increment_revision() noexcept;

private:
  std::uint64_t _revision = 0;
};

} // namespace objectum::store
