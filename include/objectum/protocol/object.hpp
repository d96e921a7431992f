#pragma once

#include <cstddef>
#include <vector>

#include <objectum/protocol/owner.hpp>
#include <objectum/protocol/type_tag.hpp>
#include <objectum/protocol/types.hpp>

namespace objectum::protocol {

struct object
{
  object_id id{};
  sequence_number version = 0;
  protocol::owner owner   = immutable{};
  type_tag type;
  std::vector< std::byte > contents;
  transaction_digest previous_transaction{};

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & id;
    ar & version;
    ar & owner;
    ar & type;
    ar & contents;
    ar & previous_transaction;
  }

  bool operator==( const object& ) const = default;

  object_digest digest() const;
  object_ref ref() const;
  bool is_package() const;
  std::size_t size() const noexcept;
};

/**
 * The trace a wrapped object leaves in storage: its id, the version at which it
 * was wrapped and the object it is currently embedded in.
 */
struct tombstone
{
  object_id id{};
  sequence_number version = 0;
  object_id container{};

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & id;
    ar & version;
    ar & container;
  }

  bool operator==( const tombstone& ) const = default;

  object_ref ref() const noexcept;
};

} // namespace objectum::protocol
