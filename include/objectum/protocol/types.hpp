#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

#include <objectum/crypto/hash.hpp>
#include <objectum/protocol/error.hpp>

namespace objectum::protocol {

constexpr std::size_t address_length = 32;

using address            = std::array< std::byte, address_length >;
using object_id          = address;
using sequence_number    = std::uint64_t;
using object_digest      = crypto::digest;
using transaction_digest = crypto::digest;

constexpr sequence_number max_sequence_number = std::numeric_limits< sequence_number >::max();

constexpr std::byte wrapped_marker{ 0x58 };
constexpr std::byte deleted_marker{ 0x63 };

template< std::byte Marker >
constexpr object_digest make_sentinel() noexcept
{
  object_digest d{};
  d.fill( Marker );
  return d;
}

constexpr object_digest wrapped_digest = make_sentinel< wrapped_marker >();
constexpr object_digest deleted_digest = make_sentinel< deleted_marker >();

constexpr bool is_alive( const object_digest& d ) noexcept
{
  return d != wrapped_digest && d != deleted_digest;
}

constexpr bool is_wrapped( const object_digest& d ) noexcept
{
  return d == wrapped_digest;
}

constexpr bool is_deleted( const object_digest& d ) noexcept
{
  return d == deleted_digest;
}

constexpr address make_address( std::uint8_t value ) noexcept
{
  address a{};
  a.back() = std::byte{ value };
  return a;
}

constexpr address std_address       = make_address( 1 );
constexpr address framework_address = make_address( 2 );

struct object_ref
{
  object_id id{};
  sequence_number version = 0;
  object_digest digest{};

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & id;
    ar & version;
    ar & digest;
  }

  bool operator==( const object_ref& ) const = default;
  auto operator<=>( const object_ref& ) const = default;
};

/**
 * Fresh object ids are the hash of the creating transaction's digest followed by
 * a per transaction creation counter.
 */
object_id derive_object_id( const transaction_digest& tx, std::uint64_t counter ) noexcept;

class id_generator
{
public:
  explicit id_generator( const transaction_digest& tx ) noexcept;

  object_id next() noexcept;
  std::uint64_t count() const noexcept;

private:
  transaction_digest _tx;
  std::uint64_t _counter = 0;
};

std::string to_string( const address& a );
std::string to_short_string( const address& a );
result< address > address_from_string( std::string_view sv ) noexcept;

} // namespace objectum::protocol
