#pragma once

#include <array>
#include <algorithm>
#include <concepts>
#include <cstring>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <boost/endian/conversion.hpp>

#include <objectum/encode/error.hpp>

namespace objectum::encode::bcs {

constexpr std::uint32_t max_sequence_length = ( 1u << 31 ) - 1;
constexpr std::size_t max_uleb128_length    = 5;

class writer;

template< typename T >
concept Serializable = requires( T& t, writer& w ) { t.serialize( w, 0u ); };

/**
 * Canonical binary encoder. Integers are little endian, sequence lengths and
 * variant tags are ULEB128 prefixed, options are a 0/1 tag followed by the value.
 * Structures opt in by providing `serialize( Archive&, unsigned int )`, so the
 * encoding of any protocol structure is fully determined by its field order.
 */
class writer
{
public:
  writer() = default;

  void write_uleb128( std::uint32_t value );
  void write_raw( std::span< const std::byte > bytes );
  void write_sequence( std::span< const std::byte > bytes );
  void write_string( std::string_view s );

  template< std::integral T >
  void write( T value )
  {
    if constexpr( std::is_same_v< T, bool > )
    {
      _data.push_back( value ? std::byte{ 0x01 } : std::byte{ 0x00 } );
    }
    else
    {
      boost::endian::native_to_little_inplace( value );
      const auto* bytes = reinterpret_cast< const std::byte* >( &value ); // NOLINT
      _data.insert( _data.end(), bytes, bytes + sizeof( T ) );
    }
  }

  template< typename T >
  writer& operator&( const T& value )
  {
    encode( value );
    return *this;
  }

  const std::vector< std::byte >& data() const noexcept;
  std::vector< std::byte > release() noexcept;

private:
  template< std::integral T >
  void encode( T value )
  {
    write( value );
  }

  template< typename T >
    requires std::is_enum_v< T >
  void encode( T value )
  {
    write( std::to_underlying( value ) );
  }

  template< std::size_t N >
  void encode( const std::array< std::byte, N >& value )
  {
    write_raw( value );
  }

  void encode( const std::vector< std::byte >& value )
  {
    write_sequence( value );
  }

  void encode( const std::string& value )
  {
    write_string( value );
  }

  template< typename T >
  void encode( const std::vector< T >& values )
  {
    write_uleb128( static_cast< std::uint32_t >( values.size() ) );
    for( const auto& value: values )
      encode( value );
  }

  template< typename T >
  void encode( const std::set< T >& values )
  {
    write_uleb128( static_cast< std::uint32_t >( values.size() ) );
    for( const auto& value: values )
      encode( value );
  }

  template< typename K, typename V >
  void encode( const std::map< K, V >& values )
  {
    write_uleb128( static_cast< std::uint32_t >( values.size() ) );
    for( const auto& [ key, value ]: values )
    {
      encode( key );
      encode( value );
    }
  }

  template< typename T >
  void encode( const std::optional< T >& value )
  {
    write( value.has_value() );
    if( value )
      encode( *value );
  }

  template< typename T1, typename T2 >
  void encode( const std::pair< T1, T2 >& value )
  {
    encode( value.first );
    encode( value.second );
  }

  template< typename... Ts >
  void encode( const std::variant< Ts... >& value )
  {
    write_uleb128( static_cast< std::uint32_t >( value.index() ) );
    std::visit(
      [ this ]( const auto& alternative )
      {
        encode( alternative );
      },
      value );
  }

  template< Serializable T >
  void encode( const T& value )
  {
    const_cast< T& >( value ).serialize( *this, 0u ); // NOLINT(cppcoreguidelines-pro-type-const-cast)
  }

  std::vector< std::byte > _data;
};

/**
 * Strict decoder. Every read rejects truncated and non-canonical input, so two
 * validators can never accept different encodings of the same value.
 */
class reader
{
public:
  explicit reader( std::span< const std::byte > bytes ) noexcept;

  result< std::uint32_t > read_uleb128() noexcept;
  result< bool > read_bool() noexcept;
  result< std::span< const std::byte > > read_raw( std::size_t length ) noexcept;
  result< std::vector< std::byte > > read_sequence() noexcept;
  result< std::string > read_string() noexcept;

  template< std::unsigned_integral T >
    requires( !std::is_same_v< T, bool > )
  result< T > read() noexcept
  {
    auto bytes = read_raw( sizeof( T ) );
    if( !bytes )
      return std::unexpected( bytes.error() );

    T value{};
    std::memcpy( &value, bytes->data(), sizeof( T ) );
    return boost::endian::little_to_native( value );
  }

  template< std::size_t N >
  result< std::array< std::byte, N > > read_fixed() noexcept
  {
    auto bytes = read_raw( N );
    if( !bytes )
      return std::unexpected( bytes.error() );

    std::array< std::byte, N > out{};
    std::copy( bytes->begin(), bytes->end(), out.begin() );
    return out;
  }

  std::size_t remaining() const noexcept;
  bool empty() const noexcept;
  std::error_code finish() const noexcept;

private:
  std::span< const std::byte > _bytes;
  std::size_t _offset = 0;
};

template< typename T >
std::vector< std::byte > to_bytes( const T& value )
{
  writer w;
  w & value;
  return w.release();
}

bool is_valid_utf8( std::span< const std::byte > bytes ) noexcept;
bool is_valid_ascii( std::span< const std::byte > bytes ) noexcept;

} // namespace objectum::encode::bcs
