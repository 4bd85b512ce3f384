// NOLINTBEGIN

#include <gtest/gtest.h>

#include <tabula/crypto.hpp>
#include <tabula/module.hpp>
#include <tabula/protocol.hpp>
#include <tabula/state.hpp>

#include <cstdint>

using namespace tabula;

namespace {

void noop( module::context&, const module::arguments& ) {}

module::module_descriptor token()
{
  return module::builder( "Token" )
    .map< protocol::account, std::uint64_t >( "balances" )
    .property< std::uint64_t >( "supply" )
    .entry( "transfer", { module::parameter< protocol::account >( "to" ), module::parameter< std::uint64_t >( "amount" ) }, &noop )
    .internal( "debit", { module::parameter< std::uint64_t >( "amount" ) }, &noop )
    .build();
}

} // namespace

TEST( registry, add_and_find )
{
  module::registry modules;
  EXPECT_EQ( modules.add( token() ), module::module_errc::ok );
  EXPECT_EQ( modules.size(), 1 );

  ASSERT_NE( modules.find( "Token" ), nullptr );
  EXPECT_EQ( modules.find( "Coin" ), nullptr );

  const auto* transfer = modules.find_method( "Token", "transfer" );
  ASSERT_NE( transfer, nullptr );
  EXPECT_TRUE( transfer->entry );
  EXPECT_EQ( transfer->parameters.size(), 2 );

  const auto* debit = modules.find_method( "Token", "debit" );
  ASSERT_NE( debit, nullptr );
  EXPECT_FALSE( debit->entry );

  const auto* balances = modules.find_property( "Token", "balances" );
  ASSERT_NE( balances, nullptr );
  EXPECT_EQ( *balances, ( module::map_property< protocol::account, std::uint64_t >( "balances" ) ) );
  EXPECT_EQ( modules.find_property( "Token", "owner" ), nullptr );
}

TEST( registry, rejects_invalid_modules )
{
  module::registry modules;
  ASSERT_FALSE( modules.add( token() ) );

  EXPECT_EQ( modules.add( token() ), module::module_errc::duplicate_module );
  EXPECT_EQ( modules.add( module::builder( "" ).build() ), module::module_errc::empty_name );

  EXPECT_EQ( modules.add( module::builder( "Twice" ).property< std::uint64_t >( "a" ).property< std::uint8_t >( "a" ).build() ),
             module::module_errc::duplicate_property );

  EXPECT_EQ( modules.add( module::builder( "Twice" ).entry( "a", {}, &noop ).internal( "a", {}, &noop ).build() ),
             module::module_errc::duplicate_method );

  EXPECT_EQ( modules.add( module::builder( "Bodiless" ).entry( "a", {}, {} ).build() ),
             module::module_errc::missing_body );

  module::property_descriptor floating{ .name  = "ratio",
                                        .shape = state::property_shape::single,
                                        .key   = {},
                                        .value = { .kind = state::value_kind::floating, .record = {}, .fields = {} } };
  EXPECT_EQ( modules.add( module::builder( "Floats" ).declare( floating ).build() ),
             module::module_errc::invalid_value_kind );

  module::property_descriptor floating_key{ .name  = "ratios",
                                            .shape = state::property_shape::map,
                                            .key   = { .kind = state::value_kind::floating, .record = {}, .fields = {} },
                                            .value = state::describe< std::uint64_t >() };
  EXPECT_EQ( modules.add( module::builder( "Floats" ).declare( floating_key ).build() ),
             module::module_errc::invalid_key_kind );

  module::parameter_descriptor text{ .name    = "text",
                                     .type    = { .kind = state::value_kind::string, .record = {}, .fields = {} },
                                     .program = {} };
  EXPECT_EQ( modules.add( module::builder( "Strings" ).entry( "say", { text }, &noop ).build() ),
             module::module_errc::invalid_parameter_kind );

  auto program = crypto::hash( "program" );
  EXPECT_EQ( modules.add( module::builder( "Proofs" )
                            .entry( "check",
                                    { module::proof_parameter( "a", program ),
                                      module::proof_parameter( "b", program ),
                                      module::proof_parameter( "c", program ) },
                                    &noop )
                            .build() ),
             module::module_errc::too_many_proofs );

  EXPECT_EQ( modules.add( module::builder( "Proofs" ).entry( "check", { module::proof_parameter( "a", {} ) }, &noop ).build() ),
             module::module_errc::missing_program );

  EXPECT_EQ( modules.add( module::builder( "Proofs" )
                            .entry( "check",
                                    { module::proof_parameter( "a", program ), module::proof_parameter( "b", program ) },
                                    &noop )
                            .build() ),
             module::module_errc::ok );

  EXPECT_EQ( modules.size(), 2 );
}

TEST( registry, sealed )
{
  module::registry modules;
  modules.seal();
  EXPECT_TRUE( modules.sealed() );
  EXPECT_EQ( modules.add( token() ), module::module_errc::registry_sealed );
  EXPECT_EQ( modules.size(), 0 );
}

TEST( descriptor, merge )
{
  auto overrides = module::builder( "StableToken", 2 )
                     .property< std::uint64_t >( "supply" )
                     .property< protocol::account >( "issuer" )
                     .entry( "transfer", { module::parameter< protocol::account >( "to" ) }, &noop )
                     .entry( "freeze", {}, &noop )
                     .descriptor();

  auto merged = module::merge( token(), overrides );
  ASSERT_TRUE( merged );
  EXPECT_EQ( merged->name, "StableToken" );
  EXPECT_EQ( merged->version, 2 );

  EXPECT_EQ( merged->properties.size(), 3 );
  EXPECT_NE( merged->property( "balances" ), nullptr );
  EXPECT_NE( merged->property( "issuer" ), nullptr );

  EXPECT_EQ( merged->methods.size(), 3 );
  ASSERT_NE( merged->method( "transfer" ), nullptr );
  EXPECT_EQ( merged->method( "transfer" )->parameters.size(), 1 );
  EXPECT_NE( merged->method( "debit" ), nullptr );
  EXPECT_NE( merged->method( "freeze" ), nullptr );

  module::registry modules;
  EXPECT_FALSE( modules.add( *merged ) );
}

TEST( descriptor, merge_keeps_base_name )
{
  auto merged = module::merge( token(), module::builder( "" ).entry( "freeze", {}, &noop ).descriptor() );
  ASSERT_TRUE( merged );
  EXPECT_EQ( merged->name, "Token" );
}

TEST( descriptor, merge_conflicting_property )
{
  auto overrides = module::builder( "Token" ).property< std::uint32_t >( "supply" ).descriptor();
  auto merged    = module::merge( token(), overrides );
  ASSERT_FALSE( merged );
  EXPECT_EQ( merged.error(), module::module_errc::conflicting_override );
}

TEST( descriptor, balances )
{
  auto balances = module::balances::descriptor();
  EXPECT_EQ( balances.name, module::balances::name );
  EXPECT_FALSE( module::registry::validate( balances ) );

  ASSERT_NE( balances.method( "credit" ), nullptr );
  EXPECT_FALSE( balances.method( "credit" )->entry );
  EXPECT_TRUE( balances.method( "mint" )->entry );
  EXPECT_TRUE( balances.method( "transfer" )->entry );
  EXPECT_TRUE( balances.method( "burn" )->entry );
}

// NOLINTEND
