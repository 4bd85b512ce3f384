#pragma once

#include <cassert>

#include <sodium.h>

namespace tabula::crypto::detail {

inline void initialize_sodium() noexcept
{
  [[maybe_unused]]
  static int retcode = sodium_init();
  assert( retcode >= 0 );
}

} // namespace tabula::crypto::detail
