#pragma once

#include <cstddef>
#include <map>
#include <set>
#include <variant>

#include <objectum/execution/argument_validator.hpp>
#include <objectum/execution/executor.hpp>
#include <objectum/protocol/effects.hpp>
#include <objectum/protocol/object.hpp>

namespace objectum::execution {

constexpr std::size_t default_max_cascade_size = 2'048;

/**
 * A pre-state entry is either a live object or the tombstone of a wrapped one.
 */
using pre_entry = std::variant< protocol::object, protocol::tombstone >;

struct effects_input
{
  protocol::transaction_digest digest{};
  protocol::object_id gas_id{};

  /// Every object the transaction touched, as it was before the transaction.
  std::map< protocol::object_id, pre_entry > pre_state;

  /// Inputs whose version is bumped even when execution leaves them untouched.
  std::set< protocol::object_id > mutable_inputs;

  /// Inputs the transaction may only read, such as shared objects taken by immutable reference.
  std::set< protocol::object_id > read_only_inputs;

  raw_effects raw;
  protocol::gas_cost_summary gas_used;
  std::size_t max_cascade_size = default_max_cascade_size;
};

result< protocol::transaction_outputs > build_effects( const effects_input& input );

/**
 * Effects of a transaction that ran and failed. Only the gas object and the
 * mutable inputs change: their versions are bumped, their contents are kept
 * and the gas charge is deducted. `input.raw` is ignored.
 */
result< protocol::transaction_outputs > build_failure_effects( const effects_input& input,
                                                               const protocol::execution_failure& failure );

} // namespace objectum::execution
