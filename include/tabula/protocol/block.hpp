#pragma once

#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

#include <tabula/crypto.hpp>
#include <tabula/protocol/transaction.hpp>

namespace tabula::protocol {

enum class execution_status : std::uint8_t
{
  accepted,
  rejected,
  malformed
};

/**
 * Outcome of one transaction of a block. A rejected transaction lists the
 * assertions that failed, a malformed one carries the error that kept it
 * from executing at all.
 */
struct transaction_record
{
  transaction trx;
  execution_status status = execution_status::malformed;
  std::error_code error;
  std::vector< std::string > failed_assertions;
  std::vector< crypto::digest > folded_proofs;
};

struct block
{
  crypto::digest id{};
  crypto::digest previous{};
  std::uint64_t height = 0;
  crypto::digest previous_state_root{};
  crypto::digest state_root{};
  std::vector< transaction_record > records;

  const transaction_record* record( const crypto::digest& transaction_id ) const noexcept;

  bool validate() const noexcept;
};

crypto::digest make_id( const block& b ) noexcept;

} // namespace tabula::protocol
