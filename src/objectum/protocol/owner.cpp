#include <objectum/protocol/owner.hpp>

#include <objectum/util/overloaded.hpp>

namespace objectum::protocol {

bool is_shared( const owner& o ) noexcept
{
  return std::holds_alternative< shared >( o );
}

bool is_immutable( const owner& o ) noexcept
{
  return std::holds_alternative< immutable >( o );
}

bool is_child( const owner& o ) noexcept
{
  return std::holds_alternative< object_owner >( o );
}

std::string to_string( const owner& o )
{
  return std::visit( util::overloaded{ []( const address_owner& a )
                                 {
                                   return "address_owner(" + to_short_string( a.address ) + ")";
                                 },
                                 []( const object_owner& p )
                                 {
                                   return "object_owner(" + to_short_string( p.parent ) + ")";
                                 },
                                 []( const shared& s )
                                 {
                                   return "shared(" + std::to_string( s.initial_shared_version ) + ")";
                                 },
                                 []( const immutable& )
                                 {
                                   return std::string( "immutable" );
                                 } },
                     o );
}

} // namespace objectum::protocol
