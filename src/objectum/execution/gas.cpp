#include <objectum/execution/gas.hpp>

#include <algorithm>
#include <limits>

#include <objectum/encode/bcs.hpp>

namespace objectum::execution {

protocol::object make_gas_coin( const protocol::object_id& id,
                                const protocol::address& owner,
                                std::uint64_t balance,
                                protocol::sequence_number version )
{
  protocol::object coin;
  coin.id       = id;
  coin.version  = version;
  coin.owner    = protocol::address_owner{ .address = owner };
  coin.type     = protocol::gas_coin_type();
  coin.contents = encode::bcs::to_bytes( balance );
  return coin;
}

std::optional< std::uint64_t > coin_balance( const protocol::object& coin )
{
  if( coin.type != protocol::gas_coin_type() )
    return std::nullopt;

  encode::bcs::reader r( coin.contents );
  auto balance = r.read< std::uint64_t >();
  if( !balance || r.finish() )
    return std::nullopt;

  return *balance;
}

std::error_code check_gas_payment( const protocol::gas_data& gas,
                                   const protocol::object& coin,
                                   const protocol::address& sender )
{
  const auto* owner = std::get_if< protocol::address_owner >( &coin.owner );
  if( !owner || owner->address != sender || gas.owner != sender )
    return protocol::user_input_errc::invalid_gas_object;

  auto balance = coin_balance( coin );
  if( !balance )
    return protocol::user_input_errc::invalid_gas_object;

  if( !gas.price )
    return protocol::user_input_errc::gas_price_too_low;

  if( !gas.budget )
    return protocol::user_input_errc::gas_budget_too_low;

  if( *balance < gas.budget )
    return protocol::user_input_errc::gas_balance_too_low;

  return {};
}

std::error_code deduct( protocol::object& coin, std::uint64_t amount )
{
  auto balance = coin_balance( coin );
  if( !balance || *balance < amount )
    return protocol::execution_errc::invariant_violation;

  coin.contents = encode::bcs::to_bytes( *balance - amount );
  return {};
}

gas_meter::gas_meter( std::uint64_t budget, std::uint64_t price ) noexcept:
    _budget( budget ),
    _price( price )
{}

void gas_meter::charge_units( std::uint64_t units ) noexcept
{
  if( _units > std::numeric_limits< std::uint64_t >::max() - units )
    _units = std::numeric_limits< std::uint64_t >::max();
  else
    _units += units;
}

std::uint64_t gas_meter::units() const noexcept
{
  return _units;
}

std::uint64_t gas_meter::cost() const noexcept
{
  if( _price && _units > std::numeric_limits< std::uint64_t >::max() / _price )
    return std::numeric_limits< std::uint64_t >::max();

  return _units * _price;
}

bool gas_meter::exhausted() const noexcept
{
  return cost() > _budget;
}

std::uint64_t gas_meter::charge() const noexcept
{
  return std::min( cost(), _budget );
}

protocol::gas_cost_summary gas_meter::summary() const noexcept
{
  return protocol::gas_cost_summary{ .computation_cost = charge(), .budget = _budget };
}

} // namespace objectum::execution
