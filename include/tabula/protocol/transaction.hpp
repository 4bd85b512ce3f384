#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <boost/serialization/array.hpp>
#include <boost/serialization/split_member.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

#include <tabula/crypto.hpp>
#include <tabula/protocol/account.hpp>
#include <tabula/protocol/proof.hpp>

namespace tabula::protocol {

/**
 * A method argument: either the canonical encoding of a value or a proof.
 */
using argument = std::variant< std::vector< std::byte >, proof >;

struct transaction
{
  crypto::digest id{};
  std::string module;
  std::string method;
  std::vector< argument > arguments;
  account sender{};
  crypto::signature signature{};

  template< class Archive >
  void save( Archive& ar, const unsigned int version ) const
  {
    ar & id;
    ar & module;
    ar & method;

    std::uint32_t count = arguments.size();
    ar & count;

    for( const auto& arg: arguments )
    {
      std::uint8_t index = arg.index();
      ar & index;

      if( std::holds_alternative< proof >( arg ) )
        ar & std::get< proof >( arg );
      else
        ar & std::get< std::vector< std::byte > >( arg );
    }

    ar & sender;
    ar & signature;
  }

  template< class Archive >
  void load( Archive& ar, const unsigned int version )
  {
    ar & id;
    ar & module;
    ar & method;

    std::uint32_t count = 0;
    ar & count;

    arguments.clear();

    for( std::uint32_t i = 0; i < count; ++i )
    {
      std::uint8_t index = 0;
      ar & index;

      if( index == 1 )
      {
        proof p;
        ar & p;
        arguments.emplace_back( std::move( p ) );
      }
      else
      {
        std::vector< std::byte > value;
        ar & value;
        arguments.emplace_back( std::move( value ) );
      }
    }

    ar & sender;
    ar & signature;
  }

  BOOST_SERIALIZATION_SPLIT_MEMBER()

  /**
   * Structural checks: named target, no empty value arguments and an id
   * matching the content. Does not check the signature.
   */
  bool validate() const noexcept;

  bool verify_signature() const noexcept;

  /**
   * Set sender, id and signature.
   */
  void sign( const crypto::secret_key& key );
};

crypto::digest make_id( const transaction& t ) noexcept;

} // namespace tabula::protocol
