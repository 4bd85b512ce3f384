#pragma once

#include <tabula/state_tree/merkle_state_tree.hpp>
