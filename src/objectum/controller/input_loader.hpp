#pragma once

#include <cstddef>
#include <map>
#include <set>

#include <objectum/controller/error.hpp>
#include <objectum/execution/effects_builder.hpp>
#include <objectum/ownership/authority.hpp>
#include <objectum/protocol/transaction.hpp>
#include <objectum/store/object_store.hpp>

namespace objectum::controller {

struct loaded_inputs
{
  ownership::object_table objects;
  std::set< protocol::object_id > input_ids;
  std::set< protocol::object_id > mutable_inputs;

  /// The input objects and the gas coin as they are before the transaction.
  std::map< protocol::object_id, execution::pre_entry > pre_state;
};

/**
 * Reads everything a transaction may touch out of the store and checks that
 * the sender is entitled to use it.
 */
class input_loader
{
public:
  input_loader( const store::object_store& store, std::size_t max_ownership_depth, std::size_t max_cascade_size );

  result< loaded_inputs > load( const protocol::transaction& transaction ) const;

  /**
   * Adds the pre-transaction state of every object the write set touches
   * beyond the inputs: loaded children, tombstones of unwrapped objects and
   * the descendants of deleted objects.
   */
  void expand( const execution::raw_effects& raw,
               const ownership::object_table& objects,
               std::map< protocol::object_id, execution::pre_entry >& pre_state ) const;

private:
  result< protocol::object > load_owned( const protocol::object_ref& ref ) const;
  void load_ancestors( const protocol::object& obj, ownership::object_table& objects ) const;
  void load_descendants( const protocol::object_id& id, ownership::object_table& objects ) const;
  std::error_code authenticate( const protocol::transaction& transaction, const loaded_inputs& inputs ) const;

  const store::object_store& _store;
  std::size_t _max_ownership_depth;
  std::size_t _max_cascade_size;
};

} // namespace objectum::controller
