#pragma once

#include <algorithm>
#include <initializer_list>
#include <map>
#include <ranges>

#include <objectum/protocol/types.hpp>

namespace objectum::execution {

/**
 * Returns one more than the largest version in the range, or 1 for an empty
 * range. Throws if the successor would not fit in a sequence number.
 */
protocol::sequence_number lamport_increment( std::initializer_list< protocol::sequence_number > versions );

template< std::ranges::input_range Range >
  requires std::convertible_to< std::ranges::range_value_t< Range >, protocol::sequence_number >
protocol::sequence_number lamport_increment( const Range& versions )
{
  protocol::sequence_number max = 0;
  for( protocol::sequence_number v: versions )
    max = std::max( max, v );

  return lamport_increment( { max } );
}

/**
 * Stamps every object written by a transaction with the same Lamport version,
 * computed from the versions the transaction causally depends on.
 */
class version_assigner
{
public:
  template< std::ranges::input_range Range >
  explicit version_assigner( const Range& dependency_versions ):
      _version( lamport_increment( dependency_versions ) )
  {}

  protocol::sequence_number version() const noexcept;

  /**
   * Records that `id`, previously at `prior` (0 for a new object), is written at
   * the assigned version. Throws std::runtime_error if the version would not
   * strictly increase or if `id` was already assigned in this transaction.
   */
  protocol::sequence_number assign( const protocol::object_id& id, protocol::sequence_number prior );

  const std::map< protocol::object_id, protocol::sequence_number >& assigned() const noexcept;

private:
  protocol::sequence_number _version;
  std::map< protocol::object_id, protocol::sequence_number > _assigned;
};

} // namespace objectum::execution
