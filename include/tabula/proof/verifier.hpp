#pragma once

#include <cstddef>
#include <memory>
#include <span>

#include <tabula/crypto/hash.hpp>
#include <tabula/proof/backend.hpp>
#include <tabula/proof/error.hpp>
#include <tabula/protocol/proof.hpp>

namespace tabula::proof {

/**
 * Checks proof arguments against what a method expects of them. The
 * backend is consulted exactly once per call.
 */
class verifier final
{
public:
  verifier( std::shared_ptr< backend > b ) noexcept;

  result< bool > verify( const protocol::proof& p, const crypto::digest& expected_program ) const;
  result< bool > verify( const protocol::proof& p,
                         const crypto::digest& expected_program,
                         std::span< const std::byte > public_inputs ) const;

private:
  std::shared_ptr< backend > _backend;
};

} // namespace tabula::proof
