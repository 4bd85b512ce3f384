#pragma once

#include <tabula/protocol/account.hpp>
#include <tabula/protocol/block.hpp>
#include <tabula/protocol/proof.hpp>
#include <tabula/protocol/transaction.hpp>
