#pragma once

#include <concepts>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <objectum/encode/bcs.hpp>
#include <objectum/protocol/type_tag.hpp>
#include <objectum/protocol/types.hpp>

namespace objectum::protocol {

struct pure_arg
{
  std::vector< std::byte > bytes;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & bytes;
  }

  bool operator==( const pure_arg& ) const = default;
};

struct owned_object_arg
{
  object_ref ref{};

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & ref;
  }

  bool operator==( const owned_object_arg& ) const = default;
};

struct shared_object_arg
{
  object_id id{};
  sequence_number initial_shared_version = 0;
  bool is_mutable                        = true;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & id;
    ar & initial_shared_version;
    ar & is_mutable;
  }

  bool operator==( const shared_object_arg& ) const = default;
};

using call_arg = std::variant< pure_arg, owned_object_arg, shared_object_arg >;

std::optional< object_id > object_id_of( const call_arg& arg ) noexcept;

struct gas_coin
{
  template< class Archive >
  void serialize( Archive&, const unsigned int )
  {}

  bool operator==( const gas_coin& ) const = default;
};

struct input
{
  std::uint16_t index = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & index;
  }

  bool operator==( const input& ) const = default;
};

struct command_result
{
  std::uint16_t command = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & command;
  }

  bool operator==( const command_result& ) const = default;
};

struct nested_result
{
  std::uint16_t command = 0;
  std::uint16_t index   = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & command;
    ar & index;
  }

  bool operator==( const nested_result& ) const = default;
};

using argument = std::variant< gas_coin, input, command_result, nested_result >;

struct move_call
{
  address package{};
  std::string module_name;
  std::string function;
  std::vector< type_tag > type_arguments;
  std::vector< argument > arguments;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & package;
    ar & module_name;
    ar & function;
    ar & type_arguments;
    ar & arguments;
  }

  bool operator==( const move_call& ) const = default;
};

struct make_move_vec
{
  std::optional< type_tag > type;
  std::vector< argument > elements;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & type;
    ar & elements;
  }

  bool operator==( const make_move_vec& ) const = default;
};

struct transfer_objects
{
  std::vector< argument > objects;
  argument recipient;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & objects;
    ar & recipient;
  }

  bool operator==( const transfer_objects& ) const = default;
};

struct publish
{
  std::vector< std::vector< std::byte > > modules;
  std::vector< object_id > dependencies;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & modules;
    ar & dependencies;
  }

  bool operator==( const publish& ) const = default;
};

using command = std::variant< move_call, make_move_vec, transfer_objects, publish >;

struct gas_data
{
  object_ref payment{};
  address owner{};
  std::uint64_t price  = 0;
  std::uint64_t budget = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & payment;
    ar & owner;
    ar & price;
    ar & budget;
  }

  bool operator==( const gas_data& ) const = default;
};

struct transaction
{
  address sender{};
  std::vector< call_arg > inputs;
  std::vector< command > commands;
  gas_data gas;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & sender;
    ar & inputs;
    ar & commands;
    ar & gas;
  }

  bool operator==( const transaction& ) const = default;

  std::size_t size() const noexcept;
};

transaction_digest make_id( const transaction& t );

/**
 * Assembles a programmable transaction. Object inputs are deduplicated by id so
 * that the same object referenced twice resolves to the same input index.
 */
class transaction_builder
{
public:
  argument pure_bytes( std::vector< std::byte > bytes );

  template< typename T >
  argument pure( const T& value )
  {
    return pure_bytes( encode::bcs::to_bytes( value ) );
  }

  argument owned_object( const object_ref& ref );
  argument shared_object( const object_id& id, sequence_number initial_shared_version, bool is_mutable = true );

  argument command( protocol::command c );

  argument move_call( const address& package,
                      std::string module_name,
                      std::string function,
                      std::vector< argument > arguments,
                      std::vector< type_tag > type_arguments = {} );
  argument make_move_vec( std::optional< type_tag > type, std::vector< argument > elements );
  argument transfer_objects( std::vector< argument > objects, argument recipient );
  argument publish( std::vector< std::vector< std::byte > > modules, std::vector< object_id > dependencies );

  transaction finish( const address& sender, const object_ref& gas_payment, std::uint64_t budget, std::uint64_t price );

private:
  std::vector< call_arg > _inputs;
  std::map< object_id, std::uint16_t > _object_inputs;
  std::vector< protocol::command > _commands;
};

} // namespace objectum::protocol

template< typename T >
concept Transaction = std::same_as< objectum::protocol::transaction, T >;
