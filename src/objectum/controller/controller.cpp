#include <objectum/controller/controller.hpp>

#include <algorithm>
#include <iterator>
#include <map>
#include <stdexcept>
#include <string>

#include <objectum/log.hpp>
#include <objectum/package/publication_gate.hpp>

#include "input_loader.hpp"

namespace objectum::controller {

namespace {

bool is_publish( const protocol::command& c ) noexcept
{
  return std::holds_alternative< protocol::publish >( c );
}

std::string status_string( const protocol::transaction_effects& effects )
{
  if( effects.status.success() )
    return "success";

  const auto& failure = *effects.status.failure;
  auto out            = failure.error.message();
  if( failure.command )
    out += " at command " + std::to_string( *failure.command );
  if( failure.argument )
    out += ", argument " + std::to_string( *failure.argument );

  return out;
}

} // namespace

controller::controller( std::shared_ptr< store::object_store > store,
                        std::shared_ptr< execution::executor > executor,
                        options opts,
                        const execution::signature_resolver* resolver ):
    _store( std::move( store ) ),
    _executor( std::move( executor ) ),
    _options( opts ),
    _resolver( resolver )
{
  if( !_store )
    throw std::invalid_argument( "controller requires an object store" );
}

controller::~controller() = default;

const options& controller::get_options() const noexcept
{
  return _options;
}

result< protocol::object > controller::get_object_info( const protocol::object_id& id ) const
{
  std::lock_guard< std::mutex > lock( _mutex );

  auto obj = _store->get_latest( id );
  if( !obj )
    return std::unexpected( protocol::user_input_errc::object_not_found );

  return obj;
}

result< protocol::transaction_effects > controller::process( const protocol::transaction& transaction )
{
  std::lock_guard< std::mutex > lock( _mutex );

  auto digest = protocol::make_id( transaction );

  LOG_DEBUG( objectum::log::instance(),
             "Pushing transaction - ID: {}",
             objectum::log::hex{ digest.data(), digest.size() } );

  auto reject = [ & ]( std::error_code ec ) -> result< protocol::transaction_effects >
  {
    LOG_INFO( objectum::log::instance(),
              "Transaction rejected - ID: {}, Reason: {} ({})",
              objectum::log::hex{ digest.data(), digest.size() },
              ec.message(),
              ec.category().name() );
    return std::unexpected( ec );
  };

  if( _store->get_effects( digest ) )
    return reject( controller_errc::already_processed );

  if( transaction.gas.price < _options.reference_gas_price )
    return reject( protocol::user_input_errc::gas_price_too_low );

  input_loader loader( *_store, _options.max_ownership_depth, _options.max_cascade_size );

  auto inputs = loader.load( transaction );
  if( !inputs )
    return reject( inputs.error() );

  execution::argument_validator validator( _resolver, _options.max_ownership_depth );

  auto outcome = validator.validate( transaction, inputs->objects );
  if( !outcome )
    return reject( outcome.error() );

  execution::gas_meter meter( transaction.gas.budget, transaction.gas.price );
  meter.charge_units( _options.command_cost * transaction.commands.size() );

  execution::effects_input input;
  input.digest           = digest;
  input.gas_id           = transaction.gas.payment.id;
  input.pre_state        = inputs->pre_state;
  input.mutable_inputs   = inputs->mutable_inputs;
  std::ranges::set_difference( inputs->input_ids,
                               inputs->mutable_inputs,
                               std::inserter( input.read_only_inputs, input.read_only_inputs.end() ) );
  input.max_cascade_size = _options.max_cascade_size;

  auto failure = std::move( outcome->failure );

  if( !failure )
  {
    protocol::id_generator ids( digest );

    // Packages linked by a publish are read straight from the store, they are
    // not inputs of the transaction
    std::map< protocol::object_id, protocol::object > packages;
    package::package_lookup lookup = [ & ]( const protocol::object_id& id ) -> const protocol::object*
    {
      if( const auto* obj = inputs->objects.find( id ) )
        return obj;

      if( auto itr = packages.find( id ); itr != packages.end() )
        return &itr->second;

      auto obj = _store->get_latest( id );
      if( !obj )
        return nullptr;

      return &packages.emplace( id, std::move( *obj ) ).first->second;
    };

    for( std::size_t i = 0; i < transaction.commands.size() && !failure; ++i )
    {
      const auto* command = std::get_if< protocol::publish >( &transaction.commands[ i ] );
      if( !command )
        continue;

      meter.charge_units( _options.publish_cost );

      auto published = package::publish( *command, transaction.sender, digest, ids, lookup );
      if( !published )
      {
        failure = protocol::execution_failure{ .error    = published.error(),
                                               .command  = static_cast< std::uint16_t >( i ),
                                               .argument = std::nullopt };
        break;
      }

      for( auto* obj: { &published->package, &published->upgrade_cap } )
      {
        input.raw.minted.insert( obj->id );
        input.raw.written.emplace( obj->id, std::move( *obj ) );
      }
    }

    if( !failure && !std::ranges::all_of( transaction.commands, is_publish ) )
    {
      if( !_executor )
        throw std::runtime_error( "no executor configured for move calls" );

      execution::execution_context context{ .transaction = transaction,
                                            .digest      = digest,
                                            .objects     = inputs->objects,
                                            .ids         = ids };

      auto output = _executor->execute( context );
      meter.charge_units( output.computation_units );
      failure = std::move( output.failure );

      if( !failure )
      {
        auto& raw = output.effects;
        raw.written.merge( input.raw.written );
        raw.minted.merge( input.raw.minted );
        input.raw = std::move( raw );
      }
    }
  }

  if( !failure && meter.exhausted() )
    failure = protocol::execution_failure{ .error    = protocol::execution_errc::insufficient_gas,
                                           .command  = std::nullopt,
                                           .argument = std::nullopt };

  input.gas_used = meter.summary();

  execution::result< protocol::transaction_outputs > outputs =
    std::unexpected( make_error_code( controller_errc::effects_computation_failure ) );

  if( !failure )
  {
    loader.expand( input.raw, inputs->objects, input.pre_state );

    outputs = execution::build_effects( input );
    if( !outputs )
    {
      LOG_WARNING( objectum::log::instance(),
                   "Transaction {} produced unusable effects: {}",
                   objectum::log::hex{ digest.data(), digest.size() },
                   outputs.error().message() );

      failure = protocol::execution_failure{ .error = outputs.error(), .command = std::nullopt, .argument = std::nullopt };
    }
  }

  if( failure )
  {
    input.pre_state = inputs->pre_state;
    outputs         = execution::build_failure_effects( input, *failure );
  }

  if( !outputs )
  {
    LOG_ERROR( objectum::log::instance(),
               "Could not compute effects for transaction {}: {}",
               objectum::log::hex{ digest.data(), digest.size() },
               outputs.error().message() );
    return std::unexpected( controller_errc::effects_computation_failure );
  }

  _store->commit( *outputs );

  const auto& effects = outputs->effects;
  LOG_INFO( objectum::log::instance(),
            "Transaction applied - ID: {}, Version: {}, Status: {} [{} change(s), {} gas]",
            objectum::log::hex{ digest.data(), digest.size() },
            effects.lamport_version,
            status_string( effects ),
            effects.change_count(),
            effects.gas_used.computation_cost );

  return effects;
}

} // namespace objectum::controller
