#include <tabula/crypto/hash.hpp>
#include <tabula/memory/memory.hpp>

#include <cstdint>
#include <cstring>

#include <blake3.h>

namespace tabula::crypto {

namespace detail {

struct blake3
{
  blake3_hasher hasher{};

  blake3() noexcept
  {
    blake3_hasher_init( &hasher );
  }
};

} // namespace detail

// NOLINTBEGIN
thread_local static detail::blake3 incremental;
thread_local static detail::blake3 oneshot;

// NOLINTEND

digest hash( const void* ptr, std::size_t len ) noexcept
{
  digest out;
  blake3_hasher_reset( &oneshot.hasher );
  blake3_hasher_update( &oneshot.hasher, ptr, len );
  blake3_hasher_finalize( &oneshot.hasher, memory::pointer_cast< std::uint8_t* >( out.data() ), out.size() );
  return out;
}

digest hash( const char* s ) noexcept
{
  return hash( s, std::strlen( s ) );
}

digest hash( const std::string& s ) noexcept
{
  return hash( s.data(), s.size() );
}

digest hash( std::string_view sv ) noexcept
{
  return hash( sv.data(), sv.size() );
}

void hasher_reset() noexcept
{
  blake3_hasher_reset( &incremental.hasher );
}

void hasher_update( const void* ptr, std::size_t len ) noexcept
{
  blake3_hasher_update( &incremental.hasher, ptr, len );
}

void hasher_update( const char* s ) noexcept
{
  blake3_hasher_update( &incremental.hasher, static_cast< const void* >( s ), std::strlen( s ) );
}

void hasher_update( const std::string& s ) noexcept
{
  blake3_hasher_update( &incremental.hasher, static_cast< const void* >( s.data() ), s.size() );
}

void hasher_update( std::string_view sv ) noexcept
{
  blake3_hasher_update( &incremental.hasher, static_cast< const void* >( sv.data() ), sv.size() );
}

digest hasher_finalize() noexcept
{
  digest out;
  blake3_hasher_finalize( &incremental.hasher, memory::pointer_cast< std::uint8_t* >( out.data() ), out.size() );
  return out;
}

} // namespace tabula::crypto
