#pragma once

#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <objectum/ownership/authority.hpp>
#include <objectum/protocol/effects.hpp>
#include <objectum/protocol/transaction.hpp>

namespace objectum::execution {

template< typename T >
using result = std::expected< T, std::error_code >;

enum class reference_kind : std::uint8_t
{
  value,
  immutable_ref,
  mutable_ref
};

struct parameter
{
  protocol::type_tag type;
  reference_kind reference = reference_kind::value;
};

struct function_signature
{
  std::vector< parameter > parameters;
  std::vector< protocol::type_tag > returns;
};

/**
 * Looks up the signature of a Move function, with the call's type arguments
 * already substituted. Returns nullopt for unknown functions.
 */
class signature_resolver
{
public:
  signature_resolver()                                       = default;
  signature_resolver( const signature_resolver& )            = delete;
  signature_resolver( signature_resolver&& )                 = delete;
  signature_resolver& operator=( const signature_resolver& ) = delete;
  signature_resolver& operator=( signature_resolver&& )      = delete;
  virtual ~signature_resolver()                              = default;

  virtual std::optional< function_signature > resolve( const protocol::move_call& call ) const = 0;
};

enum class value_kind : std::uint8_t
{
  pure,
  object,
  vector,
  unknown
};

/**
 * What the validator knows about a value flowing between commands. Objects
 * carry their id when they come from an input, vectors carry the ids of the
 * objects moved into them.
 */
struct value_info
{
  value_kind kind = value_kind::unknown;
  std::optional< protocol::object_id > id;
  std::optional< protocol::type_tag > type;
  std::vector< protocol::object_id > elements;
};

/**
 * Bookkeeping for one pass over one transaction. Created at the start of
 * validation and discarded at the end, never shared between transactions.
 */
class usage_context
{
public:
  bool is_taken( const protocol::object_id& id ) const noexcept;
  void take( const protocol::object_id& id );
  void mark_mutated( const protocol::object_id& id );

  bool is_result_moved( std::uint16_t command, std::uint16_t index ) const noexcept;
  void move_result( std::uint16_t command, std::uint16_t index );

  /**
   * Records the values returned by the next command. nullopt means the number
   * of results is not known, and any index into them is accepted.
   */
  void push_results( std::optional< std::vector< value_info > > values );
  const std::vector< std::optional< std::vector< value_info > > >& results() const noexcept;

  const std::set< protocol::object_id >& taken() const noexcept;
  const std::set< protocol::object_id >& mutated() const noexcept;

private:
  std::set< protocol::object_id > _taken;
  std::set< protocol::object_id > _mutated;
  std::set< std::pair< std::uint16_t, std::uint16_t > > _moved_results;
  std::vector< std::optional< std::vector< value_info > > > _results;
};

struct validation_outcome
{
  std::optional< protocol::execution_failure > failure;
  std::set< protocol::object_id > taken;
  std::set< protocol::object_id > mutated;
};

/**
 * Input errors (the transaction is rejected) come back as the unexpected
 * value. Failures of a transaction that is otherwise well formed come back in
 * `validation_outcome::failure` and are charged for.
 */
using validation_result = result< validation_outcome >;

class argument_validator
{
public:
  explicit argument_validator( const signature_resolver* resolver = nullptr,
                               std::size_t max_ownership_depth    = ownership::default_max_ownership_depth ) noexcept;

  validation_result validate( const protocol::transaction& transaction, const ownership::object_table& objects ) const;

private:
  const signature_resolver* _resolver;
  std::size_t _max_ownership_depth;
};

} // namespace objectum::execution
