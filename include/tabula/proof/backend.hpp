#pragma once

#include <cstddef>
#include <span>

#include <tabula/crypto/hash.hpp>
#include <tabula/proof/error.hpp>

namespace tabula::proof {

/**
 * A succinct proof system used as a black box. Returns whether data
 * proves that the program ran on the given public inputs. An error means
 * the backend could not answer, not that the proof is bad.
 */
struct backend
{
  backend()                  = default;
  backend( const backend& )  = delete;
  backend( backend&& )       = delete;
  virtual ~backend()         = default;

  backend& operator=( const backend& ) = delete;
  backend& operator=( backend&& )      = delete;

  virtual result< bool > verify( const crypto::digest& program,
                                 std::span< const std::byte > public_inputs,
                                 std::span< const std::byte > data ) = 0;
};

} // namespace tabula::proof
