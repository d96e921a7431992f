#pragma once

#include <map>
#include <utility>
#include <variant>

#include <objectum/store/object_store.hpp>

namespace objectum::store {

class memory_store final: public object_store
{
public:
  memory_store();
  ~memory_store() override;

  result< protocol::object > get_latest( const protocol::object_id& id ) const override;
  result< protocol::object_ref > get_latest_ref( const protocol::object_id& id ) const override;
  result< protocol::object > get( const protocol::object_id& id, protocol::sequence_number version ) const override;
  result< protocol::tombstone > get_tombstone( const protocol::object_id& id ) const override;
  result< protocol::transaction_effects > get_effects( const protocol::transaction_digest& digest ) const override;

  std::vector< protocol::object_id > children_of( const protocol::object_id& parent ) const override;
  std::vector< protocol::object_id > wrapped_in( const protocol::object_id& container ) const override;

  void put( protocol::object obj ) override;
  void commit( const protocol::transaction_outputs& outputs ) override;

  std::size_t size() const noexcept;

private:
  struct deletion
  {
    protocol::sequence_number version = 0;
  };

  using latest_state = std::variant< protocol::object, protocol::tombstone, deletion >;

  static protocol::sequence_number version_of( const latest_state& state ) noexcept;

  void start_write_batch();
  void end_write_batch();
  void check_increasing( const protocol::object_id& id, protocol::sequence_number version, bool strict ) const;

  std::map< std::pair< protocol::object_id, protocol::sequence_number >, protocol::object > _versions;
  std::map< protocol::object_id, latest_state > _latest;
  std::map< protocol::transaction_digest, protocol::transaction_effects > _effects;

  std::map< protocol::object_id, latest_state > _staged;
};

} // namespace objectum::store
