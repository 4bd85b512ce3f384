#include <gtest/gtest.h>

#include <tabula/encode/hex.hpp>
#include <tabula/memory/memory.hpp>

#include <array>
#include <cstdint>

using namespace std::string_view_literals;

constexpr std::array< std::uint8_t, 6 > data{ 4, 8, 15, 16, 23, 42 };
constexpr auto valid_hex_str = "0x04080f10172a"sv;

TEST( hex, encode )
{
  EXPECT_EQ( tabula::encode::to_hex( tabula::memory::as_bytes( data ) ), valid_hex_str );
  EXPECT_EQ( tabula::encode::to_hex( {} ), "0x" );
}

TEST( hex, decode )
{
  auto decoded_data = tabula::encode::from_hex( valid_hex_str );
  ASSERT_TRUE( decoded_data );
  EXPECT_TRUE( std::ranges::equal( *decoded_data, tabula::memory::as_bytes( data ) ) );

  decoded_data = tabula::encode::from_hex( "04080F10172A"sv );
  ASSERT_TRUE( decoded_data );
  EXPECT_TRUE( std::ranges::equal( *decoded_data, tabula::memory::as_bytes( data ) ) );

  decoded_data = tabula::encode::from_hex( valid_hex_str.substr( 3 ) );
  ASSERT_FALSE( decoded_data );
  EXPECT_EQ( decoded_data.error(), tabula::encode::encode_errc::invalid_length );

  decoded_data = tabula::encode::from_hex( "0x0g"sv );
  ASSERT_FALSE( decoded_data );
  EXPECT_EQ( decoded_data.error(), tabula::encode::encode_errc::invalid_character );
  EXPECT_EQ( decoded_data.error().message(), "invalid character" );
}
