#pragma once

#include <expected>
#include <system_error>

namespace objectum::protocol {

enum class protocol_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_type_tag,
  invalid_identifier,
  invalid_address,
  type_tag_too_deep
};

/**
 * Errors that reject a transaction before anything is executed. Nothing is
 * committed and no gas is charged.
 */
enum class user_input_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  empty_command_input,
  object_not_found,
  object_version_mismatch,
  object_digest_mismatch,
  duplicate_object_input,
  not_shared_object,
  shared_object_not_owned_input,
  invalid_gas_object,
  gas_budget_too_low,
  gas_balance_too_low,
  gas_price_too_low,
  index_out_of_bounds,
  too_many_commands
};

/**
 * Errors reported by a transaction that ran and failed. The failure is
 * recorded in the effects, gas is charged and the effects are committed.
 */
enum class execution_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invariant_violation,
  vm_verification_or_deserialization_error,
  insufficient_gas,
  command_argument_error,
  function_not_found,
  module_publish_failure,
  publish_dependency_not_found,
  cascade_limit_exceeded,
  executor_aborted
};

enum class command_argument_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  type_mismatch,
  invalid_bcs_bytes,
  invalid_usage_of_taken_value,
  index_out_of_bounds,
  arity_mismatch,
  invalid_object_by_value,
  invalid_object_by_mut_ref,
  invalid_gas_coin_usage,
  invalid_result_arity
};

const std::error_category& protocol_category() noexcept;
const std::error_category& user_input_category() noexcept;
const std::error_category& execution_category() noexcept;
const std::error_category& command_argument_category() noexcept;

std::error_code make_error_code( protocol_errc e );
std::error_code make_error_code( user_input_errc e );
std::error_code make_error_code( execution_errc e );
std::error_code make_error_code( command_argument_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace objectum::protocol

template<>
struct std::is_error_code_enum< objectum::protocol::protocol_errc >: public std::true_type
{};

template<>
struct std::is_error_code_enum< objectum::protocol::user_input_errc >: public std::true_type
{};

template<>
struct std::is_error_code_enum< objectum::protocol::execution_errc >: public std::true_type
{};

template<>
struct std::is_error_code_enum< objectum::protocol::command_argument_errc >: public std::true_type
{};
