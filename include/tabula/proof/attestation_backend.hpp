#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include <tabula/crypto.hpp>
#include <tabula/proof/backend.hpp>
#include <tabula/protocol/proof.hpp>

namespace tabula::proof {

/**
 * A backend that accepts attestations from trusted provers in place of
 * succinct proofs. The proof data is the prover's public key followed by
 * its signature over H( program || public_inputs ).
 */
class attestation_backend final: public backend
{
public:
  static constexpr std::size_t attestation_length = crypto::public_key_length + crypto::signature_length;

  attestation_backend( std::vector< crypto::public_key > trusted ) noexcept;
  ~attestation_backend() override = default;

  result< bool > verify( const crypto::digest& program,
                         std::span< const std::byte > public_inputs,
                         std::span< const std::byte > data ) override;

  static crypto::digest statement( const crypto::digest& program, std::span< const std::byte > public_inputs ) noexcept;

  static protocol::proof
  attest( const crypto::secret_key& prover, const crypto::digest& program, std::vector< std::byte > public_inputs );

private:
  std::vector< crypto::public_key > _trusted;
};

} // namespace tabula::proof
