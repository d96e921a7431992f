#include <objectum/package/module.hpp>

#include <cctype>
#include <utility>

#include <objectum/encode/bcs.hpp>

namespace objectum::package {

result< module_header > decode_module_header( std::span< const std::byte > bytes ) noexcept
{
  encode::bcs::reader r( bytes );

  auto magic = r.read< std::uint32_t >();
  if( !magic || *magic != module_magic )
    return std::unexpected( package_errc::invalid_module_header );

  auto version = r.read< std::uint32_t >();
  if( !version || *version < min_bytecode_version || *version > current_bytecode_version )
    return std::unexpected( package_errc::invalid_module_header );

  auto name = r.read_string();
  if( !name || name->empty() )
    return std::unexpected( package_errc::invalid_module_header );

  for( auto c: *name )
    if( !std::isalnum( static_cast< unsigned char >( c ) ) && c != '_' )
      return std::unexpected( package_errc::invalid_module_header );

  return module_header{ .version = *version, .name = std::move( *name ) };
}

std::vector< std::byte > make_module( std::string_view name, std::span< const std::byte > body, std::uint32_t version )
{
  encode::bcs::writer w;
  w.write( module_magic );
  w.write( version );
  w.write_string( name );
  w.write_raw( body );
  return w.release();
}

} // namespace objectum::package
