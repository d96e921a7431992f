#pragma once

#include <cstdint>
#include <expected>
#include <system_error>
#include <type_traits>

namespace objectum::controller {

enum class controller_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  malformed_transaction,
  already_processed,
  effects_computation_failure
};

const std::error_category& controller_category() noexcept;

std::error_code make_error_code( controller_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace objectum::controller

template<>
struct std::is_error_code_enum< objectum::controller::controller_errc >: public std::true_type
{};
