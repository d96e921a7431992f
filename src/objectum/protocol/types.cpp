#include <objectum/protocol/types.hpp>

#include <objectum/encode/hex.hpp>

namespace objectum::protocol {

object_id derive_object_id( const transaction_digest& tx, std::uint64_t counter ) noexcept
{
  crypto::hasher_reset( crypto::domain::object_id );
  crypto::hasher_update( tx );
  crypto::hasher_update( counter );
  return crypto::hasher_finalize();
}

id_generator::id_generator( const transaction_digest& tx ) noexcept:
    _tx( tx )
{}

object_id id_generator::next() noexcept
{
  return derive_object_id( _tx, _counter++ );
}

std::uint64_t id_generator::count() const noexcept
{
  return _counter;
}

std::string to_string( const address& a )
{
  return encode::to_hex( a );
}

std::string to_short_string( const address& a )
{
  auto hex = encode::to_hex( a ).substr( 2 );
  auto pos = hex.find_first_not_of( '0' );

  if( pos == std::string::npos )
    return "0x0";

  return "0x" + hex.substr( pos );
}

result< address > address_from_string( std::string_view sv ) noexcept
{
  auto a = encode::from_hex_fixed< address_length >( sv );
  if( !a )
    return std::unexpected( protocol_errc::invalid_address );

  return *a;
}

} // namespace objectum::protocol
