#include <tabula/protocol/account.hpp>

namespace tabula::protocol {

account::account( const crypto::public_key_data& bytes ) noexcept:
    crypto::public_key_data( bytes )
{}

account::account( const crypto::public_key& key ) noexcept:
    crypto::public_key_data( key.bytes() )
{}

account::operator crypto::public_key() const noexcept
{
  return crypto::public_key( *this );
}

} // namespace tabula::protocol
