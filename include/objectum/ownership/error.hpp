#pragma once

#include <expected>
#include <system_error>

namespace objectum::ownership {

enum class ownership_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  incorrect_signer,
  invalid_child_object_argument,
  shared_object_requires_consensus,
  shared_object_in_vector,
  immutable_object_mutation,
  ownership_chain_too_deep,
  ownership_cycle,
  read_only_input_mutation,
  shared_object_unshared,
  shared_version_changed
};

const std::error_category& ownership_category() noexcept;

std::error_code make_error_code( ownership_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace objectum::ownership

template<>
struct std::is_error_code_enum< objectum::ownership::ownership_errc >: public std::true_type
{};
