#pragma once

#include <cstdint>
#include <optional>
#include <system_error>

#include <objectum/protocol/effects.hpp>
#include <objectum/protocol/object.hpp>
#include <objectum/protocol/transaction.hpp>

namespace objectum::execution {

protocol::object make_gas_coin( const protocol::object_id& id,
                                const protocol::address& owner,
                                std::uint64_t balance,
                                protocol::sequence_number version = 1 );

std::optional< std::uint64_t > coin_balance( const protocol::object& coin );

/**
 * Rejects a gas payment that could not cover the declared budget. The payment
 * must be a gas coin owned by the sender.
 */
std::error_code check_gas_payment( const protocol::gas_data& gas,
                                   const protocol::object& coin,
                                   const protocol::address& sender );

/**
 * Deducts `amount` from a gas coin in place.
 */
std::error_code deduct( protocol::object& coin, std::uint64_t amount );

class gas_meter
{
public:
  gas_meter( std::uint64_t budget, std::uint64_t price ) noexcept;

  void charge_units( std::uint64_t units ) noexcept;

  std::uint64_t units() const noexcept;
  std::uint64_t cost() const noexcept;
  bool exhausted() const noexcept;

  /**
   * The amount actually taken from the gas coin, never more than the budget.
   */
  std::uint64_t charge() const noexcept;
  protocol::gas_cost_summary summary() const noexcept;

private:
  std::uint64_t _budget;
  std::uint64_t _price;
  std::uint64_t _units = 0;
};

} // namespace objectum::execution
