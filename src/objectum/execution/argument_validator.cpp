#include <objectum/execution/argument_validator.hpp>

#include <objectum/log.hpp>
#include <objectum/package/publication_gate.hpp>
#include <objectum/util/overloaded.hpp>

namespace objectum::execution {

bool usage_context::is_taken( const protocol::object_id& id ) const noexcept
{
  return _taken.contains( id );
}

void usage_context::take( const protocol::object_id& id )
{
  _taken.insert( id );
  _mutated.insert( id );
}

void usage_context::mark_mutated( const protocol::object_id& id )
{
  _mutated.insert( id );
}

bool usage_context::is_result_moved( std::uint16_t command, std::uint16_t index ) const noexcept
{
  return _moved_results.contains( { command, index } );
}

void usage_context::move_result( std::uint16_t command, std::uint16_t index )
{
  _moved_results.emplace( command, index );
}

void usage_context::push_results( std::optional< std::vector< value_info > > values )
{
  _results.push_back( std::move( values ) );
}

const std::vector< std::optional< std::vector< value_info > > >& usage_context::results() const noexcept
{
  return _results;
}

const std::set< protocol::object_id >& usage_context::taken() const noexcept
{
  return _taken;
}

const std::set< protocol::object_id >& usage_context::mutated() const noexcept
{
  return _mutated;
}

namespace {

constexpr std::size_t max_commands = 1'024;

using protocol::command_argument_errc;
using protocol::execution_errc;
using protocol::user_input_errc;

struct stop
{
  std::error_code input_error;
  std::optional< protocol::execution_failure > failure;
};

template< typename T >
using checked = std::expected< T, stop >;

std::unexpected< stop > reject( std::error_code ec )
{
  return std::unexpected( stop{ .input_error = ec, .failure = std::nullopt } );
}

std::unexpected< stop >
fail( std::error_code ec, std::uint16_t command, std::optional< std::uint16_t > argument = std::nullopt )
{
  return std::unexpected(
    stop{ .input_error = {},
          .failure     = protocol::execution_failure{ .error = ec, .command = command, .argument = argument } } );
}

enum class usage : std::uint8_t
{
  by_value,
  by_ref,
  by_mut_ref
};

value_info describe( const protocol::type_tag& type )
{
  value_info v;
  v.type = type;

  if( type.is_primitive() )
    v.kind = value_kind::pure;
  else if( type.kind == protocol::type_kind::vector )
    v.kind = value_kind::vector;
  else
    v.kind = value_kind::object;

  return v;
}

class walker
{
public:
  walker( const protocol::transaction& tx,
          const ownership::object_table& objects,
          const signature_resolver* resolver,
          std::size_t max_depth ):
      _tx( tx ),
      _objects( objects ),
      _resolver( resolver ),
      _max_depth( max_depth )
  {}

  checked< void > run()
  {
    if( _tx.commands.empty() )
      return reject( user_input_errc::empty_command_input );

    if( _tx.commands.size() > max_commands )
      return reject( user_input_errc::too_many_commands );

    for( const auto& arg: _tx.inputs )
    {
      if( auto id = protocol::object_id_of( arg ); id )
      {
        if( !_input_ids.insert( *id ).second )
          return reject( user_input_errc::duplicate_object_input );

        if( !_objects.contains( *id ) )
          return reject( user_input_errc::object_not_found );
      }
    }

    if( !_objects.contains( _tx.gas.payment.id ) )
      return reject( user_input_errc::object_not_found );

    for( std::size_t i = 0; i < _tx.commands.size(); ++i )
    {
      auto index = static_cast< std::uint16_t >( i );
      auto step  = std::visit(
        [ & ]( const auto& c )
        {
          return check_command( c, index );
        },
        _tx.commands[ i ] );

      if( !step )
        return std::unexpected( std::move( step.error() ) );
    }

    return {};
  }

  const usage_context& context() const noexcept
  {
    return _ctx;
  }

private:
  const protocol::pure_arg* pure_input( const protocol::argument& arg ) const noexcept
  {
    const auto* in = std::get_if< protocol::input >( &arg );
    if( !in || in->index >= _tx.inputs.size() )
      return nullptr;

    return std::get_if< protocol::pure_arg >( &_tx.inputs[ in->index ] );
  }

  const protocol::object* object_input( const protocol::argument& arg ) const noexcept
  {
    const auto* in = std::get_if< protocol::input >( &arg );
    if( !in || in->index >= _tx.inputs.size() )
      return nullptr;

    auto id = protocol::object_id_of( _tx.inputs[ in->index ] );
    return id ? _objects.find( *id ) : nullptr;
  }

  bool is_read_only_shared( std::uint16_t input_index ) const noexcept
  {
    const auto* shared = std::get_if< protocol::shared_object_arg >( &_tx.inputs[ input_index ] );
    return shared && !shared->is_mutable;
  }

  checked< value_info >
  use_object( const protocol::object& obj, bool read_only_shared, usage u, std::uint16_t cmd, std::uint16_t arg )
  {
    if( _ctx.is_taken( obj.id ) )
      return fail( command_argument_errc::invalid_usage_of_taken_value, cmd, arg );

    switch( u )
    {
      case usage::by_value:
        if( protocol::is_immutable( obj.owner ) || read_only_shared )
          return fail( command_argument_errc::invalid_object_by_value, cmd, arg );
        _ctx.take( obj.id );
        break;
      case usage::by_mut_ref:
        if( protocol::is_immutable( obj.owner ) || read_only_shared )
          return fail( command_argument_errc::invalid_object_by_mut_ref, cmd, arg );
        _ctx.mark_mutated( obj.id );
        break;
      case usage::by_ref:
        break;
    }

    value_info v;
    v.kind = value_kind::object;
    v.id   = obj.id;
    v.type = obj.type;
    return v;
  }

  checked< value_info > use_result( std::uint16_t source, std::uint16_t index, usage u, std::uint16_t cmd, std::uint16_t arg )
  {
    const auto& results = _ctx.results();
    if( source >= results.size() )
      return fail( command_argument_errc::index_out_of_bounds, cmd, arg );

    value_info v;
    if( const auto& values = results[ source ]; values )
    {
      if( index >= values->size() )
        return fail( command_argument_errc::index_out_of_bounds, cmd, arg );

      v = ( *values )[ index ];
    }

    if( _ctx.is_result_moved( source, index ) )
      return fail( command_argument_errc::invalid_usage_of_taken_value, cmd, arg );

    if( u == usage::by_value && v.kind != value_kind::pure )
      _ctx.move_result( source, index );

    return v;
  }

  checked< value_info > use_argument( const protocol::argument& argument,
                                      usage u,
                                      bool allow_gas_by_value,
                                      std::uint16_t cmd,
                                      std::uint16_t arg )
  {
    return std::visit(
      util::overloaded{
        [ & ]( const protocol::gas_coin& ) -> checked< value_info >
        {
          if( u == usage::by_value && !allow_gas_by_value )
            return fail( command_argument_errc::invalid_gas_coin_usage, cmd, arg );

          const auto* gas = _objects.find( _tx.gas.payment.id );
          return use_object( *gas, false, u == usage::by_value ? usage::by_mut_ref : u, cmd, arg );
        },
        [ & ]( const protocol::input& in ) -> checked< value_info >
        {
          if( in.index >= _tx.inputs.size() )
            return fail( command_argument_errc::index_out_of_bounds, cmd, arg );

          if( std::holds_alternative< protocol::pure_arg >( _tx.inputs[ in.index ] ) )
            return value_info{ .kind = value_kind::pure, .id = std::nullopt, .type = std::nullopt, .elements = {} };

          const auto* obj = object_input( argument );
          return use_object( *obj, is_read_only_shared( in.index ), u, cmd, arg );
        },
        [ & ]( const protocol::command_result& r ) -> checked< value_info >
        {
          const auto& results = _ctx.results();
          if( r.command < results.size() && results[ r.command ] && results[ r.command ]->size() != 1 )
            return fail( command_argument_errc::invalid_result_arity, cmd, arg );

          return use_result( r.command, 0, u, cmd, arg );
        },
        [ & ]( const protocol::nested_result& r ) -> checked< value_info >
        {
          return use_result( r.command, r.index, u, cmd, arg );
        } },
      argument );
  }

  checked< void > check_command( const protocol::move_call& call, std::uint16_t cmd )
  {
    if( !_resolver )
    {
      for( std::size_t i = 0; i < call.arguments.size(); ++i )
      {
        const auto& argument = call.arguments[ i ];
        auto arg             = static_cast< std::uint16_t >( i );

        auto u = usage::by_mut_ref;
        if( const auto* obj = object_input( argument ) )
        {
          const auto* in = std::get_if< protocol::input >( &argument );
          if( protocol::is_immutable( obj->owner ) || is_read_only_shared( in->index ) )
            u = usage::by_ref;
        }

        if( auto v = use_argument( argument, u, false, cmd, arg ); !v )
          return std::unexpected( std::move( v.error() ) );
      }

      _ctx.push_results( std::nullopt );
      return {};
    }

    auto signature = _resolver->resolve( call );
    if( !signature )
      return fail( execution_errc::function_not_found, cmd );

    if( signature->parameters.size() != call.arguments.size() )
      return fail( command_argument_errc::arity_mismatch, cmd );

    for( std::size_t i = 0; i < call.arguments.size(); ++i )
    {
      const auto& argument = call.arguments[ i ];
      const auto& param    = signature->parameters[ i ];
      auto arg             = static_cast< std::uint16_t >( i );

      if( const auto* pure = pure_input( argument ) )
      {
        if( protocol::validate_pure_bytes( param.type, pure->bytes ) )
          return fail( command_argument_errc::invalid_bcs_bytes, cmd, arg );

        continue;
      }

      auto u = usage::by_value;
      if( param.reference == reference_kind::immutable_ref )
        u = usage::by_ref;
      else if( param.reference == reference_kind::mutable_ref )
        u = usage::by_mut_ref;

      auto v = use_argument( argument, u, false, cmd, arg );
      if( !v )
        return std::unexpected( std::move( v.error() ) );

      if( v->type && *v->type != param.type )
        return fail( command_argument_errc::type_mismatch, cmd, arg );
    }

    std::vector< value_info > results;
    for( const auto& ret: signature->returns )
      results.push_back( describe( ret ) );

    _ctx.push_results( std::move( results ) );
    return {};
  }

  checked< void > check_command( const protocol::make_move_vec& vec, std::uint16_t cmd )
  {
    if( vec.elements.empty() && !vec.type )
      return reject( user_input_errc::empty_command_input );

    std::optional< protocol::type_tag > element_type = vec.type;
    std::vector< protocol::object_id > elements;

    for( std::size_t i = 0; i < vec.elements.size(); ++i )
    {
      const auto& argument = vec.elements[ i ];
      auto arg             = static_cast< std::uint16_t >( i );

      if( const auto* pure = pure_input( argument ) )
      {
        if( !element_type )
          return fail( command_argument_errc::type_mismatch, cmd, arg );

        if( protocol::validate_pure_bytes( *element_type, pure->bytes ) )
          return fail( command_argument_errc::invalid_bcs_bytes, cmd, arg );

        continue;
      }

      if( const auto* obj = object_input( argument ) )
      {
        ownership::authority auth{ .signer    = _tx.sender,
                                   .objects   = _objects,
                                   .inputs    = _input_ids,
                                   .mode      = ownership::access_mode::mutate,
                                   .site      = ownership::usage_site::vector_element,
                                   .max_depth = _max_depth };

        if( auto ec = ownership::authenticate( *obj, auth ); ec )
          return fail( ec, cmd, arg );
      }

      auto v = use_argument( argument, usage::by_value, false, cmd, arg );
      if( !v )
        return std::unexpected( std::move( v.error() ) );

      if( v->type )
      {
        if( !element_type )
          element_type = v->type;
        else if( *element_type != *v->type )
        {
          if( v->kind == value_kind::object && element_type->kind != protocol::type_kind::structure )
            return fail( command_argument_errc::type_mismatch, cmd, arg );

          LOG_DEBUG( objectum::log::instance(),
                     "Vector element {} of type {} does not match {}",
                     i,
                     protocol::to_string( *v->type ),
                     protocol::to_string( *element_type ) );
          return fail( execution_errc::vm_verification_or_deserialization_error, cmd );
        }
      }

      if( v->id )
        elements.push_back( *v->id );

      elements.append_range( v->elements );
    }

    value_info result;
    result.kind     = value_kind::vector;
    result.elements = std::move( elements );
    if( element_type )
      result.type = protocol::type_tag::vector_of( *element_type );

    _ctx.push_results( std::vector< value_info >{ std::move( result ) } );
    return {};
  }

  checked< void > check_command( const protocol::transfer_objects& transfer, std::uint16_t cmd )
  {
    if( transfer.objects.empty() )
      return reject( user_input_errc::empty_command_input );

    auto recipient_index = static_cast< std::uint16_t >( transfer.objects.size() );

    for( std::size_t i = 0; i < transfer.objects.size(); ++i )
    {
      auto arg = static_cast< std::uint16_t >( i );

      auto v = use_argument( transfer.objects[ i ], usage::by_value, true, cmd, arg );
      if( !v )
        return std::unexpected( std::move( v.error() ) );

      if( v->kind == value_kind::pure || v->kind == value_kind::vector )
        return fail( command_argument_errc::type_mismatch, cmd, arg );
    }

    if( const auto* pure = pure_input( transfer.recipient ) )
    {
      if( protocol::validate_pure_bytes( protocol::type_tag::primitive( protocol::type_kind::address ), pure->bytes ) )
        return fail( command_argument_errc::invalid_bcs_bytes, cmd, recipient_index );
    }
    else
    {
      auto v = use_argument( transfer.recipient, usage::by_value, false, cmd, recipient_index );
      if( !v )
        return std::unexpected( std::move( v.error() ) );

      if( v->type && v->type->kind != protocol::type_kind::address )
        return fail( command_argument_errc::type_mismatch, cmd, recipient_index );
    }

    _ctx.push_results( std::vector< value_info >{} );
    return {};
  }

  checked< void > check_command( const protocol::publish& publish, std::uint16_t cmd )
  {
    if( auto ec = package::check_modules( publish.modules ); ec )
    {
      if( ec.category() == protocol::user_input_category() )
        return reject( ec );

      return fail( ec, cmd );
    }

    _ctx.push_results( std::vector< value_info >{ describe( protocol::upgrade_cap_type() ) } );
    return {};
  }

  const protocol::transaction& _tx;
  const ownership::object_table& _objects;
  const signature_resolver* _resolver;
  std::size_t _max_depth;
  std::set< protocol::object_id > _input_ids;
  usage_context _ctx;
};

} // namespace

argument_validator::argument_validator( const signature_resolver* resolver, std::size_t max_ownership_depth ) noexcept:
    _resolver( resolver ),
    _max_ownership_depth( max_ownership_depth )
{}

validation_result argument_validator::validate( const protocol::transaction& transaction,
                                                const ownership::object_table& objects ) const
{
  walker w( transaction, objects, _resolver, _max_ownership_depth );

  validation_outcome outcome;

  if( auto step = w.run(); !step )
  {
    if( step.error().input_error )
      return std::unexpected( step.error().input_error );

    outcome.failure = std::move( step.error().failure );
  }

  outcome.taken   = w.context().taken();
  outcome.mutated = w.context().mutated();

  return outcome;
}

} // namespace objectum::execution
