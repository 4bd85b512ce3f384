#pragma once

#include <tabula/chain/config.hpp>
#include <tabula/chain/error.hpp>
#include <tabula/chain/genesis.hpp>
#include <tabula/chain/sequencer.hpp>
