#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <system_error>

#include <objectum/ownership/error.hpp>
#include <objectum/protocol/object.hpp>

namespace objectum::ownership {

constexpr std::size_t default_max_ownership_depth = 64;

enum class access_mode : std::uint8_t
{
  read,
  mutate
};

enum class usage_site : std::uint8_t
{
  owned_input,
  shared_input,
  vector_element
};

/**
 * Transaction scoped arena of the objects a transaction can see, indexed by id.
 * Parent chains are resolved by lookup here, never through pointers between
 * objects.
 */
class object_table
{
public:
  object_table() = default;

  void insert( protocol::object obj );
  const protocol::object* find( const protocol::object_id& id ) const noexcept;
  bool contains( const protocol::object_id& id ) const noexcept;
  std::size_t size() const noexcept;

  auto begin() const noexcept
  {
    return _objects.begin();
  }

  auto end() const noexcept
  {
    return _objects.end();
  }

private:
  std::map< protocol::object_id, protocol::object > _objects;
};

struct authority
{
  protocol::address signer{};
  const object_table& objects;
  const std::set< protocol::object_id >& inputs;
  access_mode mode      = access_mode::read;
  usage_site site       = usage_site::owned_input;
  std::size_t max_depth = default_max_ownership_depth;
};

std::error_code authenticate( const protocol::object& obj, const authority& auth );

std::error_code validate_transition( const protocol::owner& before, const protocol::owner& after ) noexcept;

} // namespace objectum::ownership
