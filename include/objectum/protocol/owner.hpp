#pragma once

#include <string>
#include <variant>

#include <objectum/protocol/types.hpp>

namespace objectum::protocol {

struct address_owner
{
  protocol::address address{};

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & address;
  }

  bool operator==( const address_owner& ) const = default;
};

struct object_owner
{
  object_id parent{};

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & parent;
  }

  bool operator==( const object_owner& ) const = default;
};

struct shared
{
  sequence_number initial_shared_version = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & initial_shared_version;
  }

  bool operator==( const shared& ) const = default;
};

struct immutable
{
  template< class Archive >
  void serialize( Archive&, const unsigned int )
  {}

  bool operator==( const immutable& ) const = default;
};

using owner = std::variant< address_owner, object_owner, shared, immutable >;

bool is_shared( const owner& o ) noexcept;
bool is_immutable( const owner& o ) noexcept;
bool is_child( const owner& o ) noexcept;

std::string to_string( const owner& o );

} // namespace objectum::protocol
