#pragma once

#include <cstdint>
#include <expected>
#include <system_error>
#include <type_traits>

namespace objectum::store {

enum class store_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  object_not_found,
  version_not_found,
  effects_not_found
};

const std::error_category& store_category() noexcept;

std::error_code make_error_code( store_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace objectum::store

template<>
struct std::is_error_code_enum< objectum::store::store_errc >: public std::true_type
{};
