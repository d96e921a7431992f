#include <objectum/ownership/error.hpp>

#include <string>
#include <system_error>
#include <utility>

namespace objectum::ownership {

struct _ownership_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "ownership";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< ownership_errc >( condition ) )
    {
      case ownership_errc::ok:
        return "ok"s;
      case ownership_errc::incorrect_signer:
        return "incorrect signer"s;
      case ownership_errc::invalid_child_object_argument:
        return "child object used without its parent"s;
      case ownership_errc::shared_object_requires_consensus:
        return "shared object requires consensus ordering"s;
      case ownership_errc::shared_object_in_vector:
        return "shared object used as a vector element"s;
      case ownership_errc::immutable_object_mutation:
        return "immutable object cannot be mutated"s;
      case ownership_errc::ownership_chain_too_deep:
        return "ownership chain too deep"s;
      case ownership_errc::ownership_cycle:
        return "ownership cycle"s;
      case ownership_errc::read_only_input_mutation:
        return "input passed by immutable reference cannot be mutated"s;
      case ownership_errc::shared_object_unshared:
        return "shared object cannot be unshared"s;
      case ownership_errc::shared_version_changed:
        return "initial shared version cannot change"s;
    }
    std::unreachable();
  }
};

const std::error_category& ownership_category() noexcept
{
  static _ownership_category category;
  return category;
}

std::error_code make_error_code( ownership_errc e )
{
  return std::error_code( static_cast< int >( e ), ownership_category() );
}

} // namespace objectum::ownership
