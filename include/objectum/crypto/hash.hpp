#pragma once

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

namespace objectum::crypto {

constexpr std::size_t digest_length = 32;

using digest = std::array< std::byte, digest_length >;

/**
 * Domain tags are hashed ahead of the payload so digests of different kinds of
 * data can never collide, e.g. an object digest and a transaction digest.
 */
enum class domain : std::uint8_t
{
  none,
  object,
  transaction,
  effects,
  object_id,
  package
};

void hasher_reset( domain d = domain::none ) noexcept;
digest hasher_finalize() noexcept;
void hasher_update( const void* ptr, std::size_t len = 0 ) noexcept;
void hasher_update( std::string_view sv ) noexcept;
void hasher_update( std::span< const std::byte > s ) noexcept;
void hasher_update( std::byte b ) noexcept;

template< typename T >
  requires std::is_integral_v< T >
void hasher_update( T t ) noexcept
{
  if constexpr( std::endian::native != std::endian::little )
    t = std::byteswap( t );

  hasher_update( &t, sizeof( T ) );
}

template< std::size_t N >
void hasher_update( const std::array< std::byte, N >& a ) noexcept
{
  hasher_update( a.data(), a.size() );
}

digest hash( const void* ptr, std::size_t len = 0 ) noexcept;
digest hash( const char* s ) noexcept;
digest hash( std::string_view sv ) noexcept;
digest hash( domain d, std::span< const std::byte > s ) noexcept;

template< typename Range >
  requires( std::ranges::range< Range > && !std::is_convertible_v< Range, std::string_view > )
digest hash( const Range& values ) noexcept
{
  hasher_reset();
  for( const auto& value: values )
    hasher_update( value );
  return hasher_finalize();
}

} // namespace objectum::crypto
