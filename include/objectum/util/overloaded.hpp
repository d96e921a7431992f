#pragma once

namespace objectum::util {

template< typename... Ts >
struct overloaded: Ts...
{
  using Ts::operator()...;
};

} // namespace objectum::util
