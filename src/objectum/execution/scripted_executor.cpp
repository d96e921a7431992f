#include <objectum/execution/scripted_executor.hpp>

#include <stdexcept>
#include <string>

#include <objectum/util/overloaded.hpp>

namespace objectum::execution {

void scripted_executor::push( script s )
{
  _scripts.push_back( std::move( s ) );
}

void scripted_executor::clear() noexcept
{
  _scripts.clear();
}

std::size_t scripted_executor::pending() const noexcept
{
  return _scripts.size();
}

execution_output scripted_executor::execute( const execution_context& context )
{
  if( _scripts.empty() )
    throw std::runtime_error( "no script left to execute" );

  auto s = std::move( _scripts.front() );
  _scripts.pop_front();

  execution_output out;
  out.computation_units = s.computation_units;
  out.failure           = std::move( s.failure );

  if( out.failure )
    return out;

  auto& raw = out.effects;

  std::vector< protocol::object_id > created;
  for( std::size_t i = 0; i < s.creations.size(); ++i )
  {
    created.push_back( context.ids.next() );
    raw.minted.insert( created.back() );
  }

  auto resolve = [ & ]( const object_handle& handle ) -> protocol::object_id
  {
    return std::visit( util::overloaded{ []( const protocol::object_id& id )
                                         {
                                           return id;
                                         },
                                         [ & ]( const created_index& c )
                                         {
                                           if( c.index >= created.size() )
                                             throw std::invalid_argument( "script refers to creation "
                                                                          + std::to_string( c.index ) );
                                           return created[ c.index ];
                                         } },
                       handle );
  };

  for( std::size_t i = 0; i < s.creations.size(); ++i )
  {
    auto& c = s.creations[ i ];

    if( c.surfaced )
      raw.surfaced.insert( created[ i ] );

    if( c.wrapped_in )
      raw.wrapped.insert_or_assign( created[ i ], resolve( *c.wrapped_in ) );
    else if( c.deleted )
      raw.deleted.insert( created[ i ] );
    else
    {
      protocol::object obj;
      obj.id       = created[ i ];
      obj.owner    = std::move( c.owner );
      obj.type     = std::move( c.type );
      obj.contents = std::move( c.contents );
      raw.written.insert_or_assign( obj.id, std::move( obj ) );
    }
  }

  for( auto& w: s.writes )
  {
    protocol::object obj;

    if( const auto* existing = context.objects.find( w.id ) )
      obj = *existing;
    else if( !w.type )
      throw std::invalid_argument( "unwrapped object written without a type" );

    obj.id = w.id;
    if( w.owner )
      obj.owner = std::move( *w.owner );
    if( w.type )
      obj.type = std::move( *w.type );
    if( w.contents )
      obj.contents = std::move( *w.contents );

    raw.written.insert_or_assign( obj.id, std::move( obj ) );
  }

  for( const auto& [ child, container ]: s.wraps )
    raw.wrapped.insert_or_assign( resolve( child ), resolve( container ) );

  for( const auto& d: s.deletions )
    raw.deleted.insert( resolve( d ) );

  return out;
}

} // namespace objectum::execution
