#pragma once

#include <algorithm>
#include <array>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <objectum/encode/error.hpp>

namespace objectum::encode {

std::string to_hex( std::span< const std::byte > s ) noexcept;
result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept;

/**
 * Decodes into a fixed width value. Shorter input is left padded with zeroes so
 * that short forms such as `0x2` name the same 32 byte address as the full form.
 */
template< std::size_t N >
result< std::array< std::byte, N > > from_hex_fixed( std::string_view sv ) noexcept
{
  if( sv.starts_with( "0x" ) || sv.starts_with( "0X" ) )
    sv.remove_prefix( 2 );

  if( sv.empty() || sv.size() > N * 2 )
    return std::unexpected( encode_errc::invalid_length );

  std::string padded( N * 2 - sv.size(), '0' );
  padded.append( sv );

  auto bytes = from_hex( padded );
  if( !bytes )
    return std::unexpected( bytes.error() );

  std::array< std::byte, N > out{};
  std::copy( bytes->begin(), bytes->end(), out.begin() );
  return out;
}

} // namespace objectum::encode
