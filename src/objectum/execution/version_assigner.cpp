#include <objectum/execution/version_assigner.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>

#include <objectum/encode/hex.hpp>

namespace objectum::execution {

protocol::sequence_number lamport_increment( std::initializer_list< protocol::sequence_number > versions )
{
  protocol::sequence_number max = 0;
  for( auto v: versions )
    max = std::max( max, v );

  if( max >= protocol::max_sequence_number - 1 )
    throw std::runtime_error( "sequence number overflow" );

  return max + 1;
}

protocol::sequence_number version_assigner::version() const noexcept
{
  return _version;
}

protocol::sequence_number version_assigner::assign( const protocol::object_id& id, protocol::sequence_number prior )
{
  if( _version <= prior )
    throw std::runtime_error( "version " + std::to_string( _version ) + " does not advance object "
                              + encode::to_hex( id ) + " past " + std::to_string( prior ) );

  if( !_assigned.emplace( id, prior ).second )
    throw std::runtime_error( "object " + encode::to_hex( id ) + " assigned a version twice" );

  return _version;
}

const std::map< protocol::object_id, protocol::sequence_number >& version_assigner::assigned() const noexcept
{
  return _assigned;
}

} // namespace objectum::execution
