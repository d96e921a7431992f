#include <objectum/protocol/object.hpp>

#include <stdexcept>

#include <objectum/encode/bcs.hpp>

namespace objectum::protocol {

object_digest object::digest() const
{
  auto d = crypto::hash( crypto::domain::object, encode::bcs::to_bytes( *this ) );

  if( !is_alive( d ) )
    throw std::runtime_error( "object digest collides with a sentinel digest" );

  return d;
}

object_ref object::ref() const
{
  return object_ref{ .id = id, .version = version, .digest = digest() };
}

bool object::is_package() const
{
  return is_immutable( owner ) && type == package_type();
}

std::size_t object::size() const noexcept
{
  return id.size() + sizeof( version ) + contents.size() + previous_transaction.size();
}

object_ref tombstone::ref() const noexcept
{
  return object_ref{ .id = id, .version = version, .digest = wrapped_digest };
}

} // namespace objectum::protocol
