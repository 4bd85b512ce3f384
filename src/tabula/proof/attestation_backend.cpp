#include <tabula/proof/attestation_backend.hpp>

#include <algorithm>
#include <utility>

namespace tabula::proof {

attestation_backend::attestation_backend( std::vector< crypto::public_key > trusted ) noexcept:
    _trusted( std::move( trusted ) )
{}

result< bool > attestation_backend::verify( const crypto::digest& program,
                                            std::span< const std::byte > public_inputs,
                                            std::span< const std::byte > data )
{
  if( _trusted.empty() )
    return std::unexpected( make_error_code( proof_errc::backend_unavailable ) );

  if( data.size() != attestation_length )
    return false;

  crypto::public_key_data key_bytes;
  std::ranges::copy( data.first( crypto::public_key_length ), key_bytes.begin() );

  crypto::signature sig;
  std::ranges::copy( data.subspan( crypto::public_key_length ), sig.begin() );

  crypto::public_key prover( key_bytes );

  if( std::ranges::find( _trusted, prover ) == _trusted.end() )
    return false;

  return prover.verify( sig, statement( program, public_inputs ) );
}

crypto::digest attestation_backend::statement( const crypto::digest& program,
                                               std::span< const std::byte > public_inputs ) noexcept
{
  crypto::hasher_reset();
  crypto::hasher_update( program );
  crypto::hasher_update( public_inputs );
  return crypto::hasher_finalize();
}

protocol::proof attestation_backend::attest( const crypto::secret_key& prover,
                                             const crypto::digest& program,
                                             std::vector< std::byte > public_inputs )
{
  auto sig = prover.sign( statement( program, public_inputs ) );
  auto key = prover.public_key().bytes();

  protocol::proof p{ .program = program, .public_inputs = std::move( public_inputs ), .data = {} };
  p.data.reserve( attestation_length );
  p.data.insert( p.data.end(), key.begin(), key.end() );
  p.data.insert( p.data.end(), sig.begin(), sig.end() );
  return p;
}

} // namespace tabula::proof
