#include <tabula/proof/verifier.hpp>

#include <algorithm>
#include <utility>

#include <tabula/log.hpp>

namespace tabula::proof {

verifier::verifier( std::shared_ptr< backend > b ) noexcept:
    _backend( std::move( b ) )
{}

result< bool > verifier::verify( const protocol::proof& p, const crypto::digest& expected_program ) const
{
  return verify( p, expected_program, p.public_inputs );
}

result< bool > verifier::verify( const protocol::proof& p,
                                 const crypto::digest& expected_program,
                                 std::span< const std::byte > public_inputs ) const
{
  if( !_backend )
    return std::unexpected( make_error_code( proof_errc::backend_unavailable ) );

  auto proven = _backend->verify( p.program, p.public_inputs, p.data );
  if( !proven )
  {
    LOG_WARNING( tabula::log::instance(), "Proof backend error: {}", proven.error().message() );
    return proven;
  }

  bool claims_match = p.program == expected_program && std::ranges::equal( p.public_inputs, public_inputs );

  LOG_DEBUG( tabula::log::instance(),
             "Proof for program {} verified: {}, claims match: {}",
             tabula::log::hex{ p.program.data(), p.program.size() },
             *proven,
             claims_match );

  return *proven && claims_match;
}

} // namespace tabula::proof
