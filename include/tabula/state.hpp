#pragma once

#include <tabula/state/accessor.hpp>
#include <tabula/state/codec.hpp>
#include <tabula/state/error.hpp>
#include <tabula/state/option.hpp>
#include <tabula/state/path.hpp>
#include <tabula/state/state_interface.hpp>
