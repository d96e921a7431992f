#include <objectum/store/object_store.hpp>

namespace objectum::store {

std::uint64_t object_store::revision() const noexcept
{
  return _revision;
}

void object_store::increment_revision() noexcept
{
  ++_revision;
}

} // namespace objectum::store
