// NOLINTBEGIN

#include <gtest/gtest.h>

#include <objectum/crypto/hash.hpp>
#include <objectum/encode/hex.hpp>

TEST( hash, blake3 )
{
  auto empty = objectum::crypto::hash( "" );
  EXPECT_EQ( objectum::encode::to_hex( empty ),
             "0xaf1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262" );

  auto abc = objectum::crypto::hash( "abc" );
  EXPECT_EQ( objectum::encode::to_hex( abc ), "0x6437b3ac38465133ffb63b75273a8db548c558465d79db03fd359c6cd5bd9d85" );

  auto pieces = objectum::crypto::hash( std::vector< std::string >{ "a", "b", "c" } );
  EXPECT_EQ( pieces, abc );

  std::vector< std::byte > bytes{ std::byte{ 'a' }, std::byte{ 'b' }, std::byte{ 'c' } };
  EXPECT_EQ( objectum::crypto::hash( objectum::crypto::domain::none, bytes ), abc );
}

TEST( hash, domain_separation )
{
  std::vector< std::byte > bytes{ std::byte{ 0x01 }, std::byte{ 0x02 } };

  auto plain       = objectum::crypto::hash( objectum::crypto::domain::none, bytes );
  auto object      = objectum::crypto::hash( objectum::crypto::domain::object, bytes );
  auto transaction = objectum::crypto::hash( objectum::crypto::domain::transaction, bytes );

  EXPECT_NE( plain, object );
  EXPECT_NE( object, transaction );
  EXPECT_EQ( object, objectum::crypto::hash( objectum::crypto::domain::object, bytes ) );
}

// NOLINTEND
