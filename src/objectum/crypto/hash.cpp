#include <cstdint>
#include <cstring>
#include <objectum/crypto/hash.hpp>
#include <objectum/memory/memory.hpp>

#include <blake3.h>

namespace objectum::crypto {

namespace detail {

struct blake3
{
  blake3_hasher hasher{};

  blake3()
  {
    blake3_hasher_init( &hasher );
  }
};
} // namespace detail

// NOLINTBEGIN
thread_local static detail::blake3 blake3;

// NOLINTEND

void hasher_reset( domain d ) noexcept
{
  blake3_hasher_reset( &blake3.hasher );
  if( d != domain::none )
  {
    auto tag = static_cast< std::uint8_t >( d );
    blake3_hasher_update( &blake3.hasher, &tag, sizeof( tag ) );
  }
}

void hasher_update( const void* ptr, std::size_t len ) noexcept
{
  blake3_hasher_update( &blake3.hasher, ptr, len );
}

void hasher_update( std::string_view sv ) noexcept
{
  blake3_hasher_update( &blake3.hasher, static_cast< const void* >( sv.data() ), sv.size() );
}

void hasher_update( std::span< const std::byte > s ) noexcept
{
  blake3_hasher_update( &blake3.hasher, static_cast< const void* >( s.data() ), s.size() );
}

void hasher_update( std::byte b ) noexcept
{
  blake3_hasher_update( &blake3.hasher, &b, sizeof( b ) );
}

digest hasher_finalize() noexcept
{
  digest out;
  blake3_hasher_finalize( &blake3.hasher, memory::pointer_cast< std::uint8_t* >( out.data() ), out.size() );
  return out;
}

digest hash( const void* ptr, std::size_t len ) noexcept
{
  hasher_reset();
  hasher_update( ptr, len );
  return hasher_finalize();
}

digest hash( const char* s ) noexcept
{
  return hash( s, std::strlen( s ) );
}

digest hash( std::string_view sv ) noexcept
{
  return hash( sv.data(), sv.size() );
}

digest hash( domain d, std::span< const std::byte > s ) noexcept
{
  hasher_reset( d );
  hasher_update( s );
  return hasher_finalize();
}

} // namespace objectum::crypto
