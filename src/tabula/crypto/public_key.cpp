#include <tabula/crypto/public_key.hpp>
#include <tabula/memory/memory.hpp>

#include "sodium.hpp"

#include <algorithm>

namespace tabula::crypto {

public_key::public_key( const public_key_data& bytes ) noexcept:
    _bytes( bytes )
{
  detail::initialize_sodium();
}

bool public_key::operator==( const public_key& rhs ) const noexcept
{
  return std::ranges::equal( _bytes, rhs._bytes );
}

bool public_key::operator!=( const public_key& rhs ) const noexcept
{
  return !( *this == rhs );
}

bool public_key::verify( const signature& sig, const digest& dig ) const noexcept
{
  return !crypto_sign_verify_detached( memory::pointer_cast< const unsigned char* >( sig.data() ),
                                       memory::pointer_cast< const unsigned char* >( dig.data() ),
                                       dig.size(),
                                       memory::pointer_cast< const unsigned char* >( _bytes.data() ) );
}

const public_key_data& public_key::bytes() const noexcept
{
  return _bytes;
}

} // namespace tabula::crypto
