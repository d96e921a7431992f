#include <objectum/encode/error.hpp>
#include <string>
#include <system_error>
#include <utility>

namespace objectum::encode {

struct _encode_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "encode";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< encode_errc >( condition ) )
    {
      case encode_errc::ok:
        return "ok"s;
      case encode_errc::invalid_character:
        return "invalid character"s;
      case encode_errc::invalid_length:
        return "invalid length"s;
      case encode_errc::unexpected_end_of_input:
        return "unexpected end of input"s;
      case encode_errc::trailing_bytes:
        return "trailing bytes after value"s;
      case encode_errc::non_canonical_uleb128:
        return "non-canonical uleb128 encoding"s;
      case encode_errc::uleb128_overflow:
        return "uleb128 value overflows 32 bits"s;
      case encode_errc::invalid_boolean:
        return "invalid boolean encoding"s;
      case encode_errc::invalid_option_tag:
        return "invalid option tag"s;
      case encode_errc::invalid_utf8:
        return "invalid utf-8 string"s;
      case encode_errc::invalid_ascii:
        return "invalid ascii string"s;
      case encode_errc::length_limit_exceeded:
        return "sequence length limit exceeded"s;
      case encode_errc::nesting_limit_exceeded:
        return "type nesting limit exceeded"s;
      case encode_errc::unsupported_type:
        return "type cannot be decoded from pure bytes"s;
    }
    std::unreachable();
  }
};

const std::error_category& encode_category() noexcept
{
  static _encode_category category;
  return category;
}

std::error_code make_error_code( encode_errc e )
{
  return std::error_code( static_cast< int >( e ), encode_category() );
}

} // namespace objectum::encode
