// NOLINTBEGIN

#include <gtest/gtest.h>

#include <objectum/encode/bcs.hpp>
#include <objectum/package/module.hpp>

using namespace objectum;
using package::package_errc;

TEST( module, header_is_decoded )
{
  std::vector< std::byte > body{ std::byte{ 0xde }, std::byte{ 0xad } };
  auto bytes = package::make_module( "coin_flip", body, 5 );

  auto header = package::decode_module_header( bytes );
  ASSERT_TRUE( header.has_value() );
  EXPECT_EQ( header->name, "coin_flip" );
  EXPECT_EQ( header->version, 5 );
}

TEST( module, garbage_is_rejected )
{
  EXPECT_EQ( package::decode_module_header( {} ).error(), package_errc::invalid_module_header );

  std::vector< std::byte > junk( 16, std::byte{ 0x01 } );
  EXPECT_EQ( package::decode_module_header( junk ).error(), package_errc::invalid_module_header );

  // Truncated after the version
  auto bytes = package::make_module( "things" );
  bytes.resize( 8 );
  EXPECT_EQ( package::decode_module_header( bytes ).error(), package_errc::invalid_module_header );
}

TEST( module, bytecode_version_is_bounded )
{
  EXPECT_FALSE( package::decode_module_header( package::make_module( "things", {}, 0 ) ).has_value() );
  EXPECT_FALSE(
    package::decode_module_header( package::make_module( "things", {}, package::current_bytecode_version + 1 ) )
      .has_value() );
  EXPECT_TRUE(
    package::decode_module_header( package::make_module( "things", {}, package::min_bytecode_version ) ).has_value() );
}

TEST( module, name_must_be_an_identifier )
{
  EXPECT_FALSE( package::decode_module_header( package::make_module( "" ) ).has_value() );
  EXPECT_FALSE( package::decode_module_header( package::make_module( "bad-name" ) ).has_value() );
  EXPECT_FALSE( package::decode_module_header( package::make_module( "two words" ) ).has_value() );
  EXPECT_TRUE( package::decode_module_header( package::make_module( "under_score1" ) ).has_value() );
}

// NOLINTEND
