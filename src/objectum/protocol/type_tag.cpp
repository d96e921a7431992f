#include <objectum/protocol/type_tag.hpp>

#include <array>
#include <cctype>
#include <stdexcept>
#include <utility>

#include <objectum/encode/bcs.hpp>

namespace objectum::protocol {

namespace {

constexpr std::string_view std_string_module  = "string";
constexpr std::string_view ascii_module       = "ascii";
constexpr std::string_view string_struct      = "String";
constexpr std::string_view option_module      = "option";
constexpr std::string_view option_struct      = "Option";
constexpr std::string_view object_module      = "object";
constexpr std::string_view object_id_struct   = "ID";
constexpr std::size_t u128_size               = 16;
constexpr std::size_t u256_size               = 32;

struct primitive_name
{
  std::string_view name;
  type_kind kind;
};

constexpr std::array< primitive_name, 9 > primitive_names{
  primitive_name{ "bool", type_kind::boolean },
  primitive_name{ "u8", type_kind::u8 },
  primitive_name{ "u16", type_kind::u16 },
  primitive_name{ "u32", type_kind::u32 },
  primitive_name{ "u64", type_kind::u64 },
  primitive_name{ "u128", type_kind::u128 },
  primitive_name{ "u256", type_kind::u256 },
  primitive_name{ "address", type_kind::address },
  primitive_name{ "signer", type_kind::signer }
};

class type_parser
{
public:
  explicit type_parser( std::string_view input ):
      _input( input )
  {}

  result< type_tag > parse( std::size_t depth )
  {
    if( depth > max_type_tag_depth )
      return std::unexpected( protocol_errc::type_tag_too_deep );

    skip_whitespace();
    auto token = next_token();
    if( token.empty() )
      return std::unexpected( protocol_errc::invalid_type_tag );

    if( token == "vector" )
    {
      if( !consume( '<' ) )
        return std::unexpected( protocol_errc::invalid_type_tag );

      auto element = parse( depth + 1 );
      if( !element )
        return element;

      if( !consume( '>' ) )
        return std::unexpected( protocol_errc::invalid_type_tag );

      return type_tag::vector_of( std::move( *element ) );
    }

    for( const auto& p: primitive_names )
      if( token == p.name )
        return type_tag::primitive( p.kind );

    if( !token.starts_with( "0x" ) )
      return std::unexpected( protocol_errc::invalid_type_tag );

    auto addr = address_from_string( token );
    if( !addr )
      return std::unexpected( addr.error() );

    if( !consume_separator() )
      return std::unexpected( protocol_errc::invalid_type_tag );

    auto mod = next_token();
    if( !is_identifier( mod ) )
      return std::unexpected( protocol_errc::invalid_identifier );

    if( !consume_separator() )
      return std::unexpected( protocol_errc::invalid_type_tag );

    auto name = next_token();
    if( !is_identifier( name ) )
      return std::unexpected( protocol_errc::invalid_identifier );

    std::vector< type_tag > params;
    if( consume( '<' ) )
    {
      do
      {
        auto param = parse( depth + 1 );
        if( !param )
          return param;

        params.push_back( std::move( *param ) );
      }
      while( consume( ',' ) );

      if( !consume( '>' ) )
        return std::unexpected( protocol_errc::invalid_type_tag );
    }

    return type_tag::structure( *addr, std::string( mod ), std::string( name ), std::move( params ) );
  }

  bool done()
  {
    skip_whitespace();
    return _pos == _input.size();
  }

private:
  static bool is_identifier( std::string_view sv ) noexcept
  {
    if( sv.empty() )
      return false;

    if( !std::isalpha( static_cast< unsigned char >( sv.front() ) ) && sv.front() != '_' )
      return false;

    for( auto c: sv )
      if( !std::isalnum( static_cast< unsigned char >( c ) ) && c != '_' )
        return false;

    return true;
  }

  void skip_whitespace() noexcept
  {
    while( _pos < _input.size() && std::isspace( static_cast< unsigned char >( _input[ _pos ] ) ) )
      ++_pos;
  }

  std::string_view next_token() noexcept
  {
    skip_whitespace();
    auto start = _pos;
    while( _pos < _input.size()
           && ( std::isalnum( static_cast< unsigned char >( _input[ _pos ] ) ) || _input[ _pos ] == '_' ) )
      ++_pos;

    return _input.substr( start, _pos - start );
  }

  bool consume( char c ) noexcept
  {
    skip_whitespace();
    if( _pos < _input.size() && _input[ _pos ] == c )
    {
      ++_pos;
      return true;
    }

    return false;
  }

  bool consume_separator() noexcept
  {
    return consume( ':' ) && _pos < _input.size() && _input[ _pos++ ] == ':';
  }

  std::string_view _input;
  std::size_t _pos = 0;
};

std::error_code validate_value( const type_tag& t, encode::bcs::reader& r, std::size_t depth ) noexcept
{
  using encode::encode_errc;

  if( depth > max_type_tag_depth )
    return encode_errc::nesting_limit_exceeded;

  auto skip = [ & ]( std::size_t n ) -> std::error_code
  {
    auto bytes = r.read_raw( n );
    return bytes ? std::error_code{} : bytes.error();
  };

  switch( t.kind )
  {
    case type_kind::boolean:
      {
        auto b = r.read_bool();
        return b ? std::error_code{} : b.error();
      }
    case type_kind::u8:
      return skip( sizeof( std::uint8_t ) );
    case type_kind::u16:
      return skip( sizeof( std::uint16_t ) );
    case type_kind::u32:
      return skip( sizeof( std::uint32_t ) );
    case type_kind::u64:
      return skip( sizeof( std::uint64_t ) );
    case type_kind::u128:
      return skip( u128_size );
    case type_kind::u256:
      return skip( u256_size );
    case type_kind::address:
    case type_kind::signer:
      return skip( address_length );
    case type_kind::vector:
      {
        if( t.parameters.size() != 1 )
          return encode_errc::unsupported_type;

        auto length = r.read_uleb128();
        if( !length )
          return length.error();

        if( *length > r.remaining() )
          return encode_errc::unexpected_end_of_input;

        const auto& element = t.parameters.front();
        if( element.kind == type_kind::u8 )
          return skip( *length );

        for( std::uint32_t i = 0; i < *length; ++i )
          if( auto ec = validate_value( element, r, depth + 1 ); ec )
            return ec;

        return {};
      }
    case type_kind::structure:
      break;
  }

  if( t.is_structure( std_address, std_string_module, string_struct ) )
  {
    auto s = r.read_string();
    return s ? std::error_code{} : s.error();
  }

  if( t.is_structure( std_address, ascii_module, string_struct ) )
  {
    auto s = r.read_sequence();
    if( !s )
      return s.error();

    if( !encode::bcs::is_valid_ascii( *s ) )
      return encode_errc::invalid_ascii;

    return {};
  }

  if( t.is_structure( framework_address, object_module, object_id_struct ) )
    return skip( address_length );

  if( t.is_structure( std_address, option_module, option_struct ) && t.parameters.size() == 1 )
  {
    auto length = r.read_uleb128();
    if( !length )
      return length.error();

    if( *length > 1 )
      return encode_errc::invalid_option_tag;

    if( *length == 1 )
      return validate_value( t.parameters.front(), r, depth + 1 );

    return {};
  }

  return encode_errc::unsupported_type;
}

} // namespace

bool type_tag::is_primitive() const noexcept
{
  return kind != type_kind::vector && kind != type_kind::structure;
}

bool type_tag::is_structure( const protocol::address& addr, std::string_view mod, std::string_view n ) const noexcept
{
  return kind == type_kind::structure && module_address == addr && module_name == mod && name == n;
}

type_tag type_tag::primitive( type_kind k )
{
  if( k == type_kind::vector || k == type_kind::structure )
    throw std::invalid_argument( "type kind is not a primitive" );

  type_tag t;
  t.kind = k;
  return t;
}

type_tag type_tag::vector_of( type_tag element )
{
  type_tag t;
  t.kind = type_kind::vector;
  t.parameters.push_back( std::move( element ) );
  return t;
}

type_tag type_tag::structure( const protocol::address& addr,
                              std::string mod,
                              std::string n,
                              std::vector< type_tag > params )
{
  type_tag t;
  t.kind           = type_kind::structure;
  t.module_address = addr;
  t.module_name    = std::move( mod );
  t.name           = std::move( n );
  t.parameters     = std::move( params );
  return t;
}

result< type_tag > parse_type_tag( std::string_view sv )
{
  type_parser parser( sv );
  auto t = parser.parse( 0 );
  if( !t )
    return t;

  if( !parser.done() )
    return std::unexpected( protocol_errc::invalid_type_tag );

  return t;
}

std::string to_string( const type_tag& t )
{
  switch( t.kind )
  {
    case type_kind::vector:
      if( t.parameters.empty() )
        return "vector<?>";
      return "vector<" + to_string( t.parameters.front() ) + ">";
    case type_kind::structure:
      {
        auto s = to_short_string( t.module_address ) + "::" + t.module_name + "::" + t.name;
        if( !t.parameters.empty() )
        {
          s += "<";
          for( std::size_t i = 0; i < t.parameters.size(); ++i )
          {
            if( i )
              s += ", ";
            s += to_string( t.parameters[ i ] );
          }
          s += ">";
        }
        return s;
      }
    default:
      break;
  }

  for( const auto& p: primitive_names )
    if( p.kind == t.kind )
      return std::string( p.name );

  std::unreachable();
}

type_tag gas_coin_type()
{
  return type_tag::structure( framework_address, "coin", "Coin", { type_tag::structure( framework_address, "gas", "GAS" ) } );
}

type_tag package_type()
{
  return type_tag::structure( framework_address, "package", "Package" );
}

type_tag upgrade_cap_type()
{
  return type_tag::structure( framework_address, "package", "UpgradeCap" );
}

type_tag utf8_string_type()
{
  return type_tag::structure( std_address, std::string( std_string_module ), std::string( string_struct ) );
}

type_tag ascii_string_type()
{
  return type_tag::structure( std_address, std::string( ascii_module ), std::string( string_struct ) );
}

type_tag object_id_type()
{
  return type_tag::structure( framework_address, std::string( object_module ), std::string( object_id_struct ) );
}

std::error_code validate_pure_bytes( const type_tag& t, std::span< const std::byte > bytes ) noexcept
{
  encode::bcs::reader r( bytes );
  if( auto ec = validate_value( t, r, 0 ); ec )
    return ec;

  return r.finish();
}

} // namespace objectum::protocol
