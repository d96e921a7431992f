#include <objectum/controller/error.hpp>
#include <string>
#include <system_error>
#include <utility>

namespace objectum::controller {

struct _controller_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "controller";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< controller_errc >( condition ) )
    {
      case controller_errc::ok:
        return "ok"s;
      case controller_errc::malformed_transaction:
        return "malformed transaction"s;
      case controller_errc::already_processed:
        return "transaction already processed"s;
      case controller_errc::effects_computation_failure:
        return "effects could not be computed"s;
    }
    std::unreachable();
  }
};

const std::error_category& controller_category() noexcept
{
  static _controller_category category;
  return category;
}

std::error_code make_error_code( controller_errc e )
{
  return std::error_code( static_cast< int >( e ), controller_category() );
}

} // namespace objectum::controller
