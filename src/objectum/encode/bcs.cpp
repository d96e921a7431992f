#include <objectum/encode/bcs.hpp>

#include <cstdint>
#include <algorithm>
#include <limits>

namespace objectum::encode::bcs {

constexpr std::uint8_t uleb128_continuation = 0x80;
constexpr std::uint8_t uleb128_payload      = 0x7f;
constexpr std::uint32_t uleb128_shift       = 7;

void writer::write_uleb128( std::uint32_t value )
{
  while( value >= uleb128_continuation )
  {
    _data.push_back( static_cast< std::byte >( ( value & uleb128_payload ) | uleb128_continuation ) );
    value >>= uleb128_shift;
  }

  _data.push_back( static_cast< std::byte >( value ) );
}

void writer::write_raw( std::span< const std::byte > bytes )
{
  _data.insert( _data.end(), bytes.begin(), bytes.end() );
}

void writer::write_sequence( std::span< const std::byte > bytes )
{
  write_uleb128( static_cast< std::uint32_t >( bytes.size() ) );
  write_raw( bytes );
}

void writer::write_string( std::string_view s )
{
  write_sequence( std::as_bytes( std::span( s ) ) );
}

const std::vector< std::byte >& writer::data() const noexcept
{
  return _data;
}

std::vector< std::byte > writer::release() noexcept
{
  return std::move( _data );
}

reader::reader( std::span< const std::byte > bytes ) noexcept:
    _bytes( bytes )
{}

result< std::uint32_t > reader::read_uleb128() noexcept
{
  std::uint64_t value = 0;

  for( std::size_t i = 0; i < max_uleb128_length; ++i )
  {
    if( _offset >= _bytes.size() )
      return std::unexpected( encode_errc::unexpected_end_of_input );

    auto byte = std::to_integer< std::uint8_t >( _bytes[ _offset++ ] );
    value    |= static_cast< std::uint64_t >( byte & uleb128_payload ) << ( i * uleb128_shift );

    if( !( byte & uleb128_continuation ) )
    {
      // A trailing zero group means a shorter encoding of the same value exists
      if( i > 0 && byte == 0 )
        return std::unexpected( encode_errc::non_canonical_uleb128 );

      if( value > std::numeric_limits< std::uint32_t >::max() )
        return std::unexpected( encode_errc::uleb128_overflow );

      return static_cast< std::uint32_t >( value );
    }
  }

  return std::unexpected( encode_errc::uleb128_overflow );
}

result< bool > reader::read_bool() noexcept
{
  auto byte = read< std::uint8_t >();
  if( !byte )
    return std::unexpected( byte.error() );

  if( *byte > 1 )
    return std::unexpected( encode_errc::invalid_boolean );

  return *byte == 1;
}

result< std::span< const std::byte > > reader::read_raw( std::size_t length ) noexcept
{
  if( remaining() < length )
    return std::unexpected( encode_errc::unexpected_end_of_input );

  auto out  = _bytes.subspan( _offset, length );
  _offset  += length;
  return out;
}

result< std::vector< std::byte > > reader::read_sequence() noexcept
{
  auto length = read_uleb128();
  if( !length )
    return std::unexpected( length.error() );

  if( *length > max_sequence_length )
    return std::unexpected( encode_errc::length_limit_exceeded );

  auto bytes = read_raw( *length );
  if( !bytes )
    return std::unexpected( bytes.error() );

  return std::vector< std::byte >( bytes->begin(), bytes->end() );
}

result< std::string > reader::read_string() noexcept
{
  auto bytes = read_sequence();
  if( !bytes )
    return std::unexpected( bytes.error() );

  if( !is_valid_utf8( *bytes ) )
    return std::unexpected( encode_errc::invalid_utf8 );

  return std::string( reinterpret_cast< const char* >( bytes->data() ), bytes->size() ); // NOLINT
}

std::size_t reader::remaining() const noexcept
{
  return _bytes.size() - _offset;
}

bool reader::empty() const noexcept
{
  return remaining() == 0;
}

std::error_code reader::finish() const noexcept
{
  if( !empty() )
    return encode_errc::trailing_bytes;

  return encode_errc::ok;
}

bool is_valid_utf8( std::span< const std::byte > bytes ) noexcept
{
  std::size_t i = 0;
  while( i < bytes.size() )
  {
    auto lead = std::to_integer< std::uint8_t >( bytes[ i ] );

    std::size_t length   = 0;
    std::uint32_t code   = 0;
    std::uint32_t minimum = 0;

    if( lead < 0x80 )
    {
      ++i;
      continue;
    }
    else if( ( lead & 0xe0 ) == 0xc0 )
    {
      length  = 2;
      code    = lead & 0x1f;
      minimum = 0x80;
    }
    else if( ( lead & 0xf0 ) == 0xe0 )
    {
      length  = 3;
      code    = lead & 0x0f;
      minimum = 0x800;
    }
    else if( ( lead & 0xf8 ) == 0xf0 )
    {
      length  = 4;
      code    = lead & 0x07;
      minimum = 0x10000;
    }
    else
      return false;

    if( i + length > bytes.size() )
      return false;

    for( std::size_t j = 1; j < length; ++j )
    {
      auto continuation = std::to_integer< std::uint8_t >( bytes[ i + j ] );
      if( ( continuation & 0xc0 ) != 0x80 )
        return false;

      code = ( code << 6 ) | ( continuation & 0x3f );
    }

    // Overlong forms, surrogates and values beyond the unicode range
    if( code < minimum || code > 0x10ffff || ( code >= 0xd800 && code <= 0xdfff ) )
      return false;

    i += length;
  }

  return true;
}

bool is_valid_ascii( std::span< const std::byte > bytes ) noexcept
{
  constexpr std::uint8_t last_ascii = 0x7f;

  return std::ranges::all_of( bytes,
                              []( std::byte b )
                              {
                                return std::to_integer< std::uint8_t >( b ) <= last_ascii;
                              } );
}

} // namespace objectum::encode::bcs
