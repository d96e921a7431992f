#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

#include <objectum/execution/executor.hpp>

namespace objectum::execution {

/// Refers to the n-th object created by the same script.
struct created_index
{
  std::size_t index = 0;
};

using object_handle = std::variant< protocol::object_id, created_index >;

/**
 * Writes an existing object. Objects that are not visible to the transaction
 * are being unwrapped and need their type.
 */
struct scripted_write
{
  protocol::object_id id{};
  std::optional< protocol::owner > owner;
  std::optional< protocol::type_tag > type;
  std::optional< std::vector< std::byte > > contents;
};

struct scripted_creation
{
  protocol::owner owner = protocol::immutable{};
  protocol::type_tag type;
  std::vector< std::byte > contents;
  std::optional< object_handle > wrapped_in;
  bool deleted  = false;
  bool surfaced = false;
};

/**
 * The outcome of one transaction as a bytecode interpreter would report it.
 */
struct script
{
  std::uint64_t computation_units = 0;
  std::optional< protocol::execution_failure > failure;
  std::vector< scripted_write > writes;
  std::vector< scripted_creation > creations;
  std::vector< std::pair< object_handle, object_handle > > wraps;
  std::vector< object_handle > deletions;
};

/**
 * Replays prepared scripts in order, one per executed transaction. Throws
 * std::runtime_error when asked to execute with no script left.
 */
class scripted_executor final: public executor
{
public:
  scripted_executor() = default;

  void push( script s );
  void clear() noexcept;
  std::size_t pending() const noexcept;

  execution_output execute( const execution_context& context ) override;

private:
  std::deque< script > _scripts;
};

} // namespace objectum::execution
