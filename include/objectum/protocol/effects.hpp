#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <objectum/protocol/object.hpp>
#include <objectum/protocol/owner.hpp>
#include <objectum/protocol/types.hpp>

namespace objectum::protocol {

/**
 * A typed failure reported by a transaction that ran. `command` and `argument`
 * locate the offending command and argument when the failure is attributable.
 */
struct execution_failure
{
  std::error_code error;
  std::optional< std::uint16_t > command;
  std::optional< std::uint16_t > argument;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    std::string category = error.category().name();
    std::int32_t value   = error.value();
    ar & category;
    ar & value;
    ar & command;
    ar & argument;
  }

  bool operator==( const execution_failure& ) const = default;
};

struct execution_status
{
  std::optional< execution_failure > failure;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & failure;
  }

  bool operator==( const execution_status& ) const = default;

  bool success() const noexcept;
};

struct gas_cost_summary
{
  std::uint64_t computation_cost = 0;
  std::uint64_t budget           = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & computation_cost;
    ar & budget;
  }

  bool operator==( const gas_cost_summary& ) const = default;
};

enum class change_kind : std::uint8_t
{
  created,
  mutated,
  unwrapped,
  deleted,
  wrapped,
  unwrapped_then_deleted
};

using owned_ref = std::pair< object_ref, owner >;

struct transaction_effects
{
  execution_status status;
  transaction_digest transaction{};
  sequence_number lamport_version = 0;
  gas_cost_summary gas_used;
  std::vector< owned_ref > created;
  std::vector< owned_ref > mutated;
  std::vector< owned_ref > unwrapped;
  std::vector< object_ref > deleted;
  std::vector< object_ref > wrapped;
  std::vector< object_ref > unwrapped_then_deleted;
  std::vector< std::pair< object_id, sequence_number > > modified_at_versions;
  owned_ref gas_object;
  std::vector< transaction_digest > dependencies;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & status;
    ar & transaction;
    ar & lamport_version;
    ar & gas_used;
    ar & created;
    ar & mutated;
    ar & unwrapped;
    ar & deleted;
    ar & wrapped;
    ar & unwrapped_then_deleted;
    ar & modified_at_versions;
    ar & gas_object;
    ar & dependencies;
  }

  bool operator==( const transaction_effects& ) const = default;

  crypto::digest digest() const;

  std::optional< change_kind > classification_of( const object_id& id ) const noexcept;
  std::optional< object_ref > ref_of( const object_id& id ) const noexcept;
  std::optional< sequence_number > modified_at( const object_id& id ) const noexcept;
  std::size_t change_count() const noexcept;
};

/**
 * Everything a store needs to apply one transaction atomically: the effects
 * record, the live objects written at their new versions, the tombstones of
 * newly wrapped objects and the ids removed at their final version.
 */
struct transaction_outputs
{
  transaction_effects effects;
  std::map< object_id, object > written;
  std::map< object_id, tombstone > wrapped;
  std::map< object_id, sequence_number > deleted;
};

} // namespace objectum::protocol
