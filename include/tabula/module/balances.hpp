#pragma once

#include <string_view>

#include <tabula/module/descriptor.hpp>

namespace tabula::module {

/**
 * The builtin fungible balance module.
 *
 * State: balances (account to uint64), total_supply (uint64) and minter
 * (account, set at genesis).
 *
 * Entry points: mint( to, amount ) by the minter, transfer( to, amount )
 * and burn( amount ) from the sender's balance. The internal method
 * credit( to, amount ) lets another module pay out of the sender's
 * balance.
 */
namespace balances {

constexpr std::string_view name = "Balances";

constexpr std::string_view balances_property     = "balances";
constexpr std::string_view total_supply_property = "total_supply";
constexpr std::string_view minter_property       = "minter";

module_descriptor descriptor();

} // namespace balances

} // namespace tabula::module
