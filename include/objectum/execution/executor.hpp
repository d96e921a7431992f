#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>

#include <objectum/ownership/authority.hpp>
#include <objectum/protocol/effects.hpp>
#include <objectum/protocol/object.hpp>
#include <objectum/protocol/transaction.hpp>

namespace objectum::execution {

/**
 * The write set produced by running a transaction.
 *
 * `written` holds every object that is live and independently addressable at
 * the end of the transaction; versions and previous transaction digests are
 * stamped afterwards. `wrapped` maps each object embedded into another object
 * to its container. `minted` lists ids created by the transaction and
 * `surfaced` the minted ids that were live on their own at some point before
 * being wrapped or deleted.
 */
struct raw_effects
{
  std::map< protocol::object_id, protocol::object > written;
  std::map< protocol::object_id, protocol::object_id > wrapped;
  std::set< protocol::object_id > deleted;
  std::set< protocol::object_id > minted;
  std::set< protocol::object_id > surfaced;
};

struct execution_context
{
  const protocol::transaction& transaction;
  const protocol::transaction_digest& digest;
  const ownership::object_table& objects;
  protocol::id_generator& ids;
};

struct execution_output
{
  raw_effects effects;
  std::uint64_t computation_units = 0;
  std::optional< protocol::execution_failure > failure;
};

/**
 * The bytecode interpreter. Implementations run the non-publish commands of a
 * validated transaction and report what they wrote.
 */
class executor
{
public:
  executor()                             = default;
  executor( const executor& )            = delete;
  executor( executor&& )                 = delete;
  executor& operator=( const executor& ) = delete;
  executor& operator=( executor&& )      = delete;
  virtual ~executor()                    = default;

  virtual execution_output execute( const execution_context& context ) = 0;
};

} // namespace objectum::execution
