#include <objectum/protocol/error.hpp>

#include <string>
#include <system_error>
#include <utility>

namespace objectum::protocol {

struct _protocol_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "protocol";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< protocol_errc >( condition ) )
    {
      case protocol_errc::ok:
        return "ok"s;
      case protocol_errc::invalid_type_tag:
        return "invalid type tag"s;
      case protocol_errc::invalid_identifier:
        return "invalid identifier"s;
      case protocol_errc::invalid_address:
        return "invalid address"s;
      case protocol_errc::type_tag_too_deep:
        return "type tag nesting too deep"s;
    }
    std::unreachable();
  }
};

struct _user_input_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "user_input";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< user_input_errc >( condition ) )
    {
      case user_input_errc::ok:
        return "ok"s;
      case user_input_errc::empty_command_input:
        return "empty command input"s;
      case user_input_errc::object_not_found:
        return "object not found"s;
      case user_input_errc::object_version_mismatch:
        return "object version mismatch"s;
      case user_input_errc::object_digest_mismatch:
        return "object digest mismatch"s;
      case user_input_errc::duplicate_object_input:
        return "duplicate object input"s;
      case user_input_errc::not_shared_object:
        return "object is not shared"s;
      case user_input_errc::shared_object_not_owned_input:
        return "shared object passed as an owned input"s;
      case user_input_errc::invalid_gas_object:
        return "invalid gas object"s;
      case user_input_errc::gas_budget_too_low:
        return "gas budget too low"s;
      case user_input_errc::gas_balance_too_low:
        return "gas balance too low"s;
      case user_input_errc::gas_price_too_low:
        return "gas price too low"s;
      case user_input_errc::index_out_of_bounds:
        return "index out of bounds"s;
      case user_input_errc::too_many_commands:
        return "too many commands"s;
    }
    std::unreachable();
  }
};

struct _execution_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "execution";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< execution_errc >( condition ) )
    {
      case execution_errc::ok:
        return "ok"s;
      case execution_errc::invariant_violation:
        return "invariant violation"s;
      case execution_errc::vm_verification_or_deserialization_error:
        return "vm verification or deserialization error"s;
      case execution_errc::insufficient_gas:
        return "insufficient gas"s;
      case execution_errc::command_argument_error:
        return "command argument error"s;
      case execution_errc::function_not_found:
        return "function not found"s;
      case execution_errc::module_publish_failure:
        return "module publish failure"s;
      case execution_errc::publish_dependency_not_found:
        return "publish dependency not found"s;
      case execution_errc::cascade_limit_exceeded:
        return "cascading deletion limit exceeded"s;
      case execution_errc::executor_aborted:
        return "executor aborted"s;
    }
    std::unreachable();
  }
};

struct _command_argument_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "command_argument";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< command_argument_errc >( condition ) )
    {
      case command_argument_errc::ok:
        return "ok"s;
      case command_argument_errc::type_mismatch:
        return "type mismatch"s;
      case command_argument_errc::invalid_bcs_bytes:
        return "invalid bcs bytes"s;
      case command_argument_errc::invalid_usage_of_taken_value:
        return "invalid usage of taken value"s;
      case command_argument_errc::index_out_of_bounds:
        return "index out of bounds"s;
      case command_argument_errc::arity_mismatch:
        return "arity mismatch"s;
      case command_argument_errc::invalid_object_by_value:
        return "invalid object by value"s;
      case command_argument_errc::invalid_object_by_mut_ref:
        return "invalid object by mutable reference"s;
      case command_argument_errc::invalid_gas_coin_usage:
        return "invalid gas coin usage"s;
      case command_argument_errc::invalid_result_arity:
        return "invalid result arity"s;
    }
    std::unreachable();
  }
};

const std::error_category& protocol_category() noexcept
{
  static _protocol_category category;
  return category;
}

const std::error_category& user_input_category() noexcept
{
  static _user_input_category category;
  return category;
}

const std::error_category& execution_category() noexcept
{
  static _execution_category category;
  return category;
}

const std::error_category& command_argument_category() noexcept
{
  static _command_argument_category category;
  return category;
}

std::error_code make_error_code( protocol_errc e )
{
  return std::error_code( static_cast< int >( e ), protocol_category() );
}

std::error_code make_error_code( user_input_errc e )
{
  return std::error_code( static_cast< int >( e ), user_input_category() );
}

std::error_code make_error_code( execution_errc e )
{
  return std::error_code( static_cast< int >( e ), execution_category() );
}

std::error_code make_error_code( command_argument_errc e )
{
  return std::error_code( static_cast< int >( e ), command_argument_category() );
}

} // namespace objectum::protocol
