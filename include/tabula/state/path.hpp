#pragma once

#include <compare>
#include <cstddef>
#include <span>
#include <string_view>

#include <tabula/crypto/hash.hpp>
#include <tabula/state/codec.hpp>

namespace tabula::state {

class path_deriver;

/**
 * A position in the state tree. Only the first depth bits, most
 * significant bit of the first byte first, are meaningful; the remaining
 * bits are always zero.
 */
class address final
{
public:
  address( const address& ) noexcept = default;
  address( address&& ) noexcept      = default;
  ~address() noexcept                = default;

  address& operator=( const address& ) noexcept = default;
  address& operator=( address&& ) noexcept      = default;

  auto operator<=>( const address& ) const noexcept = default;
  bool operator==( const address& ) const noexcept  = default;

  const crypto::digest& bytes() const noexcept;
  bool bit( std::size_t index ) const noexcept;

private:
  friend class path_deriver;

  address( const crypto::digest& bytes ) noexcept;

  crypto::digest _bytes;
};

enum class property_shape : std::uint8_t
{
  single = 0x01,
  map    = 0x02
};

/**
 * Maps (module, property[, key]) to an address. The mapping is a pure
 * function of its inputs and the tree depth, so anyone able to name a
 * piece of state can locate it.
 */
class path_deriver final
{
public:
  static constexpr std::size_t max_depth = crypto::digest_length * 8;

  path_deriver( std::size_t depth = max_depth );

  std::size_t depth() const noexcept;

  address derive( std::string_view module, std::string_view property ) const noexcept;
  address
  derive( std::string_view module, std::string_view property, std::span< const std::byte > encoded_key ) const noexcept;

  template< canonical_type K >
  address derive( std::string_view module, std::string_view property, const K& key ) const
  {
    return derive( module, property, std::span< const std::byte >( encode( key ) ) );
  }

private:
  void begin( std::string_view module, std::string_view property, property_shape shape ) const noexcept;
  address finish() const noexcept;

  std::size_t _depth;
};

} // namespace tabula::state
