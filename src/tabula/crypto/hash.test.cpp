// NOLINTBEGIN

#include <gtest/gtest.h>

#include <tabula/crypto/hash.hpp>
#include <tabula/encode.hpp>

#include <cstdint>
#include <string>
#include <vector>

TEST( hash, blake3 )
{
  auto empty = tabula::crypto::hash( "" );
  EXPECT_EQ( tabula::encode::to_hex( empty ), "0xaf1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262" );

  EXPECT_EQ( tabula::crypto::hash( std::string( "carpe diem" ) ), tabula::crypto::hash( "carpe diem" ) );
  EXPECT_NE( tabula::crypto::hash( "carpe diem" ), tabula::crypto::hash( "carpe noctem" ) );
}

TEST( hash, incremental )
{
  tabula::crypto::hasher_reset();
  tabula::crypto::hasher_update( std::string_view( "carpe " ) );
  tabula::crypto::hasher_update( std::string_view( "diem" ) );
  auto incremental = tabula::crypto::hasher_finalize();

  EXPECT_EQ( incremental, tabula::crypto::hash( "carpe diem" ) );

  auto words = std::vector< std::string >{ "carpe ", "diem" };
  EXPECT_EQ( tabula::crypto::hash( words ), incremental );
}

TEST( hash, oneshot_inside_incremental )
{
  tabula::crypto::hasher_reset();
  tabula::crypto::hasher_update( std::string_view( "carpe " ) );
  auto unrelated = tabula::crypto::hash( "unrelated" );
  tabula::crypto::hasher_update( std::string_view( "diem" ) );

  EXPECT_EQ( tabula::crypto::hasher_finalize(), tabula::crypto::hash( "carpe diem" ) );
  EXPECT_EQ( unrelated, tabula::crypto::hash( "unrelated" ) );
}

TEST( hash, integral_is_little_endian )
{
  std::uint64_t number = 12'345;
  std::array< std::byte, 8 > le{ std::byte{ 0x39 }, std::byte{ 0x30 } };

  EXPECT_EQ( tabula::crypto::hash( number ), tabula::crypto::hash( std::span< const std::byte >( le ) ) );
}

// NOLINTEND
