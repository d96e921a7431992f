#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <objectum/protocol/types.hpp>

namespace objectum::protocol {

enum class type_kind : std::uint8_t
{
  boolean,
  u8,
  u16,
  u32,
  u64,
  u128,
  u256,
  address,
  signer,
  vector,
  structure
};

/**
 * A fully instantiated Move type. Vectors carry their element type as the single
 * entry of `parameters`; structures carry their defining address, module, name
 * and type parameters.
 */
struct type_tag
{
  type_kind kind = type_kind::boolean;
  protocol::address module_address{};
  std::string module_name;
  std::string name;
  std::vector< type_tag > parameters;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & kind;
    ar & module_address;
    ar & module_name;
    ar & name;
    ar & parameters;
  }

  bool operator==( const type_tag& ) const = default;

  bool is_primitive() const noexcept;
  bool is_structure( const protocol::address& addr, std::string_view mod, std::string_view n ) const noexcept;

  static type_tag primitive( type_kind k );
  static type_tag vector_of( type_tag element );
  static type_tag structure( const protocol::address& addr,
                             std::string mod,
                             std::string n,
                             std::vector< type_tag > params = {} );
};

constexpr std::size_t max_type_tag_depth = 16;

result< type_tag > parse_type_tag( std::string_view sv );
std::string to_string( const type_tag& t );

type_tag gas_coin_type();
type_tag package_type();
type_tag upgrade_cap_type();
type_tag utf8_string_type();
type_tag ascii_string_type();
type_tag object_id_type();

/**
 * Checks that `bytes` is the canonical encoding of a value of type `t`.
 * Supported types are the primitives, vectors, UTF-8 and ASCII strings, object
 * ids and options. Anything else is rejected as unsupported.
 */
std::error_code validate_pure_bytes( const type_tag& t, std::span< const std::byte > bytes ) noexcept;

} // namespace objectum::protocol
