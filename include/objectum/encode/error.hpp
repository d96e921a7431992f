#pragma once

#include <expected>
#include <system_error>

namespace objectum::encode {

enum class encode_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_character,
  invalid_length,
  unexpected_end_of_input,
  trailing_bytes,
  non_canonical_uleb128,
  uleb128_overflow,
  invalid_boolean,
  invalid_option_tag,
  invalid_utf8,
  invalid_ascii,
  length_limit_exceeded,
  nesting_limit_exceeded,
  unsupported_type
};

const std::error_category& encode_category() noexcept;

std::error_code make_error_code( encode_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace objectum::encode

template<>
struct std::is_error_code_enum< objectum::encode::encode_errc >: public std::true_type
{};
